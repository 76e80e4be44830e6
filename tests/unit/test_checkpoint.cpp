// ============================================================================
// AURUM - Checkpoint Unit Tests
// ============================================================================

#include "aurum/core/error.hpp"
#include "aurum/engine/checkpoint.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace aurum;
using namespace aurum::engine;

class CheckpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        InstrumentCheckpoint gold;
        gold.instrument = "XAUUSD";
        gold.reliabilities = ensemble::ReliabilityTable(0.5);
        gold.reliabilities.set("logit_momentum", RegimeLabel::Trending, 0.8123456789012345);
        gold.reliabilities.set("stumps_reversion", RegimeLabel::Ranging, 0.25);
        gold.equity = 1.0375;
        gold.peak_equity = 1.05;
        gold.positions["XAUUSD"] = -0.16;
        gold.trades = 12;
        gold.regime = RegimeLabel::Trending;

        checkpoint_.written_at = from_epoch_ns(1'700'000'000'000'000'000);
        checkpoint_.instruments.push_back(gold);
    }

    Checkpoint checkpoint_;
};

TEST_F(CheckpointTest, YamlRoundTripIsExact) {
    const auto text = to_yaml(checkpoint_);
    const auto parsed = checkpoint_from_yaml(text, 0.5);

    EXPECT_EQ(parsed.written_at, checkpoint_.written_at);
    ASSERT_EQ(parsed.instruments.size(), 1u);
    const auto& a = parsed.instruments[0];
    const auto& b = checkpoint_.instruments[0];
    EXPECT_EQ(a.instrument, b.instrument);
    EXPECT_EQ(a.reliabilities, b.reliabilities);
    EXPECT_EQ(a.equity, b.equity);
    EXPECT_EQ(a.peak_equity, b.peak_equity);
    EXPECT_EQ(a.positions, b.positions);
    EXPECT_EQ(a.trades, b.trades);
    EXPECT_EQ(a.regime, b.regime);
}

TEST_F(CheckpointTest, MissingFieldsTakeDefaults) {
    const auto parsed = checkpoint_from_yaml(
        "version: 1\ninstruments:\n  - instrument: EURUSD\n", 0.4);
    ASSERT_EQ(parsed.instruments.size(), 1u);
    const auto& inst = parsed.instruments[0];
    EXPECT_DOUBLE_EQ(inst.equity, 1.0);
    EXPECT_EQ(inst.regime, RegimeLabel::Undetermined);
    EXPECT_DOUBLE_EQ(inst.reliabilities.get("anything", RegimeLabel::Ranging), 0.4);
}

TEST_F(CheckpointTest, RejectsBadDocuments) {
    EXPECT_THROW((void)checkpoint_from_yaml("version: 2\n", 0.5), ConfigError);
    EXPECT_THROW((void)checkpoint_from_yaml("version: [1\n", 0.5), ConfigError);
    EXPECT_THROW((void)checkpoint_from_yaml(
                     "version: 1\ninstruments:\n  - instrument: X\n    regime: sideways\n", 0.5),
                 ConfigError);
}

TEST_F(CheckpointTest, SaveAndLoadFile) {
    const auto dir = std::filesystem::temp_directory_path() / "aurum_checkpoint_test";
    const auto path = dir / "nested" / "state.yaml";
    std::filesystem::remove_all(dir);

    EXPECT_FALSE(load_checkpoint(path, 0.5).has_value());

    save_checkpoint(checkpoint_, path);
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    const auto loaded = load_checkpoint(path, 0.5);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->instruments[0].reliabilities, checkpoint_.instruments[0].reliabilities);

    std::filesystem::remove_all(dir);
}
