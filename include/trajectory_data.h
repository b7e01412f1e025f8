#pragma once

#include "bubbles/node.h"
#include "config.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// Binary format for recorded bubble animation (one record per node per frame).
// Lets a renderer replay a run without re-running the layout and physics.

namespace trajectory_data {

// Magic number: "BBLS" + version bytes
constexpr char MAGIC[8] = {'B', 'B', 'L', 'S', 0x01, 0x00, 0x00, 0x00};
constexpr uint32_t FORMAT_VERSION = 1;

// Fixed-size header, little-endian, no padding
#pragma pack(push, 1)
struct Header {
    char magic[8];
    uint32_t format_version;
    uint32_t frame_count;
    uint32_t fps;
    uint32_t width;
    uint32_t height;
    uint32_t floats_per_node;  // Always 4: x, y, scale, radius
    uint64_t record_count;     // Node records over all frames
    double frame_duration;     // seconds of animation per frame
    uint64_t uncompressed_size; // Payload bytes before compression
    uint64_t compressed_size;   // Size of ZSTD-compressed payload

    Header();
    void initFromConfig(Config const& config);
    bool validate() const;
};
#pragma pack(pop)

static_assert(sizeof(Header) == 64, "Header must be exactly 64 bytes");

// Packed node state for serialization (16 bytes per node)
struct PackedNode {
    float x, y;   // NaN when the node had no 2D layout
    float scale;  // 0 when the node had no 2D layout
    float radius;

    PackedNode() = default;
    explicit PackedNode(bubbles::Node const& node);
    bool hasLayout() const { return scale > 0.0f; }
};

static_assert(sizeof(PackedNode) == 16, "PackedNode must be 16 bytes");

// Payload layout: frame_count uint32 node counts, then all PackedNode records in
// frame order. Node counts may differ between frames after a refresh.
class Writer {
public:
    Writer();
    ~Writer();

    // Non-copyable
    Writer(Writer const&) = delete;
    Writer& operator=(Writer const&) = delete;

    bool open(std::filesystem::path const& path, Config const& config);

    // Append one frame of node states
    void writeFrame(bubbles::NodeList const& nodes);

    // Compress and write to disk
    bool close();

    bool isOpen() const { return is_open_; }
    uint32_t framesWritten() const { return static_cast<uint32_t>(counts_.size()); }

private:
    std::filesystem::path path_;
    Header header_;
    std::vector<uint32_t> counts_;
    std::vector<PackedNode> records_;
    bool is_open_ = false;
};

class Reader {
public:
    Reader();
    ~Reader();

    bool open(std::filesystem::path const& path);

    bool isLoaded() const { return is_loaded_; }
    Header const& header() const { return header_; }
    uint32_t frameCount() const { return header_.frame_count; }

    // Node records of one frame (empty if out of range)
    std::vector<PackedNode> getFrame(uint32_t frame) const;

private:
    Header header_;
    std::vector<uint32_t> counts_;
    std::vector<size_t> offsets_; // first record index of each frame
    std::vector<PackedNode> records_;
    bool is_loaded_ = false;
};

} // namespace trajectory_data
