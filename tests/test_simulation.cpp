#include <gtest/gtest.h>

#include "simulation.h"
#include "trajectory_data.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

class SimulationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto data = fs::path(BUBBLES_SOURCE_DIR) / "data";
        auto initial = loadInstruments(data / "sample_markets.json");
        auto refresh = loadInstruments(data / "sample_markets_refresh.json");
        ASSERT_TRUE(initial.has_value());
        ASSERT_TRUE(refresh.has_value());
        initial_ = *initial;
        refresh_ = *refresh;

        config_ = Config::defaults();
        config_.simulation.seed = 42;
        out_dir_ = fs::temp_directory_path() / "bubbles_simulation_test";
        fs::remove_all(out_dir_);
    }

    void TearDown() override { fs::remove_all(out_dir_); }

    InstrumentList initial_;
    InstrumentList refresh_;
    Config config_;
    fs::path out_dir_;
};

TEST_F(SimulationTest, ExplicitSeedIsKept) {
    Simulation sim(config_);
    EXPECT_EQ(sim.seed(), 42u);
}

TEST_F(SimulationTest, InitialSnapshot) {
    Simulation sim(config_);
    auto record = sim.applySnapshot(initial_);
    EXPECT_EQ(record.node_count, 12u);
    EXPECT_EQ(record.carried_layouts, 0u);
    EXPECT_EQ(record.price_changes, 12u);
    ASSERT_EQ(sim.nodes().size(), 12u);
    for (auto const& node : sim.nodes()) {
        EXPECT_TRUE(node.layout.has_value());
    }
}

TEST_F(SimulationTest, RefreshKeepsBubblesInPlace) {
    Simulation sim(config_);
    sim.applySnapshot(initial_);
    auto before = sim.nodes();

    auto record = sim.applySnapshot(refresh_, 120);
    EXPECT_EQ(record.frame, 120);
    EXPECT_EQ(record.node_count, 12u);
    EXPECT_EQ(record.carried_layouts, 12u);
    // Only the stablecoin entry is unchanged between the two sample files
    EXPECT_EQ(record.price_changes, 11u);

    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(sim.nodes()[i].instrument->id, before[i].instrument->id);
        EXPECT_EQ(sim.nodes()[i].layout->x, before[i].layout->x);
        EXPECT_EQ(sim.nodes()[i].layout->y, before[i].layout->y);
    }
}

TEST_F(SimulationTest, LongFrameIsCapped) {
    Simulation a(config_);
    Simulation b(config_);
    a.applySnapshot(initial_);
    b.applySnapshot(initial_);

    a.advance(2.0);
    b.advance(config_.simulation.max_dt);

    for (size_t i = 0; i < a.nodes().size(); ++i) {
        EXPECT_EQ(a.nodes()[i].layout->x, b.nodes()[i].layout->x);
        EXPECT_EQ(a.nodes()[i].layout->y, b.nodes()[i].layout->y);
        EXPECT_EQ(a.nodes()[i].layout->vx, b.nodes()[i].layout->vx);
    }
}

TEST_F(SimulationTest, NodesStayInViewportWhileAnimating) {
    Simulation sim(config_);
    sim.applySnapshot(initial_);
    for (int frame = 0; frame < 300; ++frame) {
        sim.advance(1.0 / 60.0);
    }
    auto vp = sim.viewport();
    for (auto const& node : sim.nodes()) {
        EXPECT_GE(node.layout->x, 0.0);
        EXPECT_LE(node.layout->x, vp.width);
        EXPECT_GE(node.layout->y, 0.0);
        EXPECT_LE(node.layout->y, vp.height);
    }
}

TEST_F(SimulationTest, NodesJson) {
    Simulation sim(config_);
    sim.applySnapshot(initial_);
    auto doc = nodesToJson(sim.nodes(), Timeframe::Hour24);

    ASSERT_TRUE(doc.is_array());
    ASSERT_EQ(doc.size(), 12u);
    auto const& btc = doc[0];
    EXPECT_EQ(btc["id"], "bitcoin");
    EXPECT_EQ(btc["symbol"], "btc");
    EXPECT_EQ(btc["price"], "66,758");
    EXPECT_EQ(btc["change_text"], "+2.64%");
    EXPECT_EQ(btc["tone"], "strong_gain");
    EXPECT_EQ(btc["color"], "rgba(180, 229, 13, 0.95)");
    EXPECT_TRUE(btc["layout"].is_object());
    EXPECT_TRUE(btc["layout"].contains("scale"));
    EXPECT_TRUE(btc["sphere"].contains("z"));
    EXPECT_GT(btc["radius"].get<double>(), 0.0);
}

TEST_F(SimulationTest, RunWritesOutputs) {
    config_.simulation.duration_seconds = 0.1;
    config_.output.directory = out_dir_.string();
    config_.output.mode = OutputMode::Direct;
    config_.output.save_trajectory = true;

    Simulation sim(config_);
    int last_progress = 0;
    auto results = sim.run({initial_, refresh_},
                           [&last_progress](int current, int) { last_progress = current; },
                           "config.toml");

    EXPECT_EQ(results.frames_completed, 6);
    EXPECT_EQ(last_progress, 6);
    EXPECT_EQ(results.final_node_count, 12u);
    ASSERT_EQ(results.refreshes.size(), 2u);
    EXPECT_EQ(results.refreshes[0].frame, 0);
    EXPECT_EQ(results.refreshes[1].frame, 3);
    EXPECT_EQ(results.refreshes[1].carried_layouts, 12u);
    EXPECT_EQ(results.output_directory, out_dir_.string());

    EXPECT_TRUE(fs::exists(out_dir_ / "nodes.json"));
    EXPECT_TRUE(fs::exists(out_dir_ / "metadata.json"));
    EXPECT_TRUE(fs::exists(out_dir_ / "config.toml"));

    std::ifstream meta_in(out_dir_ / "metadata.json");
    auto meta = json::parse(meta_in);
    EXPECT_EQ(meta["config"]["seed"], 42);
    EXPECT_EQ(meta["results"]["frames_completed"], 6);

    trajectory_data::Reader reader;
    ASSERT_TRUE(reader.open(out_dir_ / "trajectory.bin"));
    EXPECT_EQ(reader.frameCount(), 6u);
    EXPECT_EQ(reader.getFrame(5).size(), 12u);
}

TEST_F(SimulationTest, RunWithoutSnapshots) {
    config_.output.directory = out_dir_.string();
    Simulation sim(config_);
    auto results = sim.run({});
    EXPECT_EQ(results.frames_completed, 0);
    EXPECT_TRUE(sim.nodes().empty());
}

TEST_F(SimulationTest, OverridesAreValidatedBeforeStepping) {
    config_.simulation.max_dt = -1.0;
    Simulation a(config_);
    a.applySnapshot(initial_);
    auto before = a.nodes();
    a.advance(1.0 / 60.0);

    auto valid = config_;
    valid.simulation.max_dt = 0.05;
    Simulation b(valid);
    b.applySnapshot(initial_);
    b.advance(1.0 / 60.0);

    for (size_t i = 0; i < a.nodes().size(); ++i) {
        EXPECT_EQ(a.nodes()[i].layout->x, b.nodes()[i].layout->x);
        EXPECT_GE(a.nodes()[i].layout->t, before[i].layout->t);
    }
}

TEST_F(SimulationTest, MoreSnapshotsThanFrames) {
    config_.simulation.duration_seconds = 0.01; // one frame at 60 fps
    config_.output.directory = out_dir_.string();
    config_.output.mode = OutputMode::Direct;

    Simulation sim(config_);
    auto results = sim.run({initial_, refresh_, initial_});
    EXPECT_EQ(results.frames_completed, 1);
    ASSERT_EQ(results.refreshes.size(), 3u);
    for (auto const& record : results.refreshes) {
        EXPECT_EQ(record.frame, 0);
    }
    EXPECT_EQ(results.refreshes[2].carried_layouts, 12u);
}
