#include "trajectory_data.h"

#include <zstd.h>

#include <cmath>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>

namespace trajectory_data {

// Header implementation

Header::Header() {
    std::memset(this, 0, sizeof(Header));
    std::memcpy(magic, MAGIC, 8);
    format_version = FORMAT_VERSION;
    floats_per_node = 4;
}

void Header::initFromConfig(Config const& config) {
    std::memcpy(magic, MAGIC, 8);
    format_version = FORMAT_VERSION;
    frame_count = 0;
    fps = static_cast<uint32_t>(config.simulation.fps);
    width = static_cast<uint32_t>(config.viewport.width);
    height = static_cast<uint32_t>(config.viewport.height);
    floats_per_node = 4;
    record_count = 0;
    frame_duration = config.simulation.stepDt();
    uncompressed_size = 0;
    compressed_size = 0;
}

bool Header::validate() const {
    if (std::memcmp(magic, MAGIC, 4) != 0) {
        return false;
    }
    if (format_version > FORMAT_VERSION) {
        return false;
    }
    if (floats_per_node != 4) {
        return false;
    }
    if (record_count > uncompressed_size / sizeof(PackedNode)) {
        return false;
    }
    uint64_t expected = static_cast<uint64_t>(frame_count) * sizeof(uint32_t) +
                        record_count * sizeof(PackedNode);
    return uncompressed_size == expected;
}

// PackedNode implementation

PackedNode::PackedNode(bubbles::Node const& node) : radius(static_cast<float>(node.radius)) {
    if (node.layout) {
        x = static_cast<float>(node.layout->x);
        y = static_cast<float>(node.layout->y);
        scale = static_cast<float>(node.layout->scale);
    } else {
        x = std::numeric_limits<float>::quiet_NaN();
        y = std::numeric_limits<float>::quiet_NaN();
        scale = 0.0f;
    }
}

// Writer implementation

Writer::Writer() = default;
Writer::~Writer() {
    if (is_open_) {
        close();
    }
}

bool Writer::open(std::filesystem::path const& path, Config const& config) {
    if (is_open_) {
        return false;
    }
    path_ = path;
    header_.initFromConfig(config);
    counts_.clear();
    records_.clear();
    counts_.reserve(static_cast<size_t>(config.simulation.totalFrames()));
    is_open_ = true;
    return true;
}

void Writer::writeFrame(bubbles::NodeList const& nodes) {
    if (!is_open_) {
        return;
    }
    counts_.push_back(static_cast<uint32_t>(nodes.size()));
    for (auto const& node : nodes) {
        records_.emplace_back(node);
    }
}

bool Writer::close() {
    if (!is_open_) {
        return false;
    }
    is_open_ = false;

    size_t const counts_bytes = counts_.size() * sizeof(uint32_t);
    size_t const records_bytes = records_.size() * sizeof(PackedNode);
    std::vector<char> payload(counts_bytes + records_bytes);
    if (counts_bytes > 0) {
        std::memcpy(payload.data(), counts_.data(), counts_bytes);
    }
    if (records_bytes > 0) {
        std::memcpy(payload.data() + counts_bytes, records_.data(), records_bytes);
    }

    header_.frame_count = static_cast<uint32_t>(counts_.size());
    header_.record_count = records_.size();
    header_.uncompressed_size = payload.size();

    size_t const max_dst_size = ZSTD_compressBound(payload.size());
    std::vector<char> compressed(max_dst_size);
    size_t const compressed_size =
        ZSTD_compress(compressed.data(), max_dst_size, payload.data(), payload.size(), 3);

    if (ZSTD_isError(compressed_size)) {
        std::cerr << "ZSTD compression error: " << ZSTD_getErrorName(compressed_size) << "\n";
        return false;
    }
    header_.compressed_size = compressed_size;

    std::ofstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << path_ << "\n";
        return false;
    }
    file.write(reinterpret_cast<char const*>(&header_), sizeof(Header));
    file.write(compressed.data(), static_cast<std::streamsize>(compressed_size));
    if (!file.good()) {
        std::cerr << "Error writing trajectory file\n";
        return false;
    }

    double ratio = compressed_size > 0
                       ? static_cast<double>(payload.size()) / static_cast<double>(compressed_size)
                       : 0.0;
    std::cout << "Trajectory saved: " << path_ << "\n"
              << "  Frames: " << header_.frame_count << "\n"
              << "  Records: " << header_.record_count << "\n"
              << "  Uncompressed: " << (payload.size() / 1024) << " KB\n"
              << "  Compressed: " << (compressed_size / 1024) << " KB\n"
              << "  Ratio: " << std::fixed << std::setprecision(2) << ratio << "x\n";

    counts_.clear();
    records_.clear();
    records_.shrink_to_fit();
    return true;
}

// Reader implementation

Reader::Reader() = default;
Reader::~Reader() = default;

bool Reader::open(std::filesystem::path const& path) {
    is_loaded_ = false;
    counts_.clear();
    offsets_.clear();
    records_.clear();

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Failed to open trajectory file: " << path << "\n";
        return false;
    }

    file.read(reinterpret_cast<char*>(&header_), sizeof(Header));
    if (!file.good()) {
        std::cerr << "Failed to read header\n";
        return false;
    }
    if (!header_.validate()) {
        std::cerr << "Invalid trajectory file header\n";
        return false;
    }

    auto const data_start = file.tellg();
    file.seekg(0, std::ios::end);
    auto const available = static_cast<uint64_t>(file.tellg() - data_start);
    file.seekg(data_start);
    if (header_.compressed_size > available) {
        std::cerr << "Trajectory file is truncated\n";
        return false;
    }

    std::vector<char> compressed(header_.compressed_size);
    file.read(compressed.data(), static_cast<std::streamsize>(header_.compressed_size));
    if (!file.good()) {
        std::cerr << "Failed to read compressed data\n";
        return false;
    }

    if (ZSTD_getFrameContentSize(compressed.data(), compressed.size()) != header_.uncompressed_size) {
        std::cerr << "Trajectory payload size does not match header\n";
        return false;
    }

    std::vector<char> payload(header_.uncompressed_size);
    size_t const decompressed_size = ZSTD_decompress(payload.data(), payload.size(),
                                                     compressed.data(), compressed.size());
    if (ZSTD_isError(decompressed_size)) {
        std::cerr << "ZSTD decompression error: " << ZSTD_getErrorName(decompressed_size) << "\n";
        return false;
    }
    if (decompressed_size != payload.size()) {
        std::cerr << "Decompressed size mismatch\n";
        return false;
    }

    counts_.resize(header_.frame_count);
    records_.resize(header_.record_count);
    size_t const counts_bytes = counts_.size() * sizeof(uint32_t);
    if (counts_bytes > 0) {
        std::memcpy(counts_.data(), payload.data(), counts_bytes);
    }
    if (!records_.empty()) {
        std::memcpy(records_.data(), payload.data() + counts_bytes,
                    records_.size() * sizeof(PackedNode));
    }

    size_t offset = 0;
    offsets_.reserve(counts_.size());
    for (uint32_t count : counts_) {
        offsets_.push_back(offset);
        offset += count;
    }
    if (offset != records_.size()) {
        std::cerr << "Trajectory frame counts do not match record count\n";
        return false;
    }

    is_loaded_ = true;
    return true;
}

std::vector<PackedNode> Reader::getFrame(uint32_t frame) const {
    if (!is_loaded_ || frame >= counts_.size()) {
        return {};
    }
    auto begin = records_.begin() + static_cast<std::ptrdiff_t>(offsets_[frame]);
    return {begin, begin + counts_[frame]};
}

} // namespace trajectory_data
