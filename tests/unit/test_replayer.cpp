// ============================================================================
// AURUM - Backtest Replayer Unit Tests
// ============================================================================

#include "aurum/backtest/replayer.hpp"
#include "aurum/backtest/report.hpp"
#include "aurum/core/error.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <map>
#include <string>

using namespace aurum;
using namespace aurum::backtest;
using namespace aurum::test_support;

class ReplayerTest : public ::testing::Test {
protected:
    void SetUp() override {
        predictors_ = {
            scripted("trend", Script{Direction::Buy, 0.7}, 1.0, {RegimeLabel::Trending}),
            scripted("fade", Script{Direction::Sell, 0.6}, 0.8),
            scripted("advisor", Script{Direction::Sell, 0.9, false, false}, 0.5),
        };

        auto gold = drifting_series(80, 2000.0, 0.0008, "XAUUSD");
        auto wave = wave_series(80, 2000.0, 0.003, "XAUUSD", 81 * SECOND_NS);
        gold.insert(gold.end(), wave.begin(), wave.end());
        series_[Symbol("XAUUSD")] = gold;
        series_[Symbol("EURUSD")] = drifting_series(120, 1.1, -0.0004, "EURUSD");
    }

    model::PredictorSet predictors_;
    Series series_;
    config::AppConfig config_;
};

TEST_F(ReplayerTest, AdvisoryPredictorsExcludedByDefault) {
    BacktestReplayer replayer(config_, predictors_);
    EXPECT_EQ(replayer.arbiter().predictors().size(), 2u);

    config_.backtest.include_advisory = true;
    BacktestReplayer with_advisory(config_, predictors_);
    EXPECT_EQ(with_advisory.arbiter().predictors().size(), 3u);
}

TEST_F(ReplayerTest, IdenticalRunsAreBitIdentical) {
    BacktestReplayer replayer(config_, predictors_);
    const auto first = replayer.run(series_);
    const auto second = replayer.run(series_);

    EXPECT_EQ(first.events, second.events);
    EXPECT_EQ(first.stats, second.stats);
    EXPECT_EQ(first.sessions, second.sessions);
    EXPECT_EQ(fingerprint(first), fingerprint(second));
    EXPECT_NO_THROW((void)replayer.verify_determinism(series_));
}

TEST_F(ReplayerTest, ExposureLimitBindsAcrossInstruments) {
    config_.risk.max_exposure = 0.6;
    BacktestReplayer replayer(config_, {scripted("bull", Script{Direction::Buy, 0.8})});
    const auto result = replayer.run(series_);

    std::map<std::string, double> positions;
    uint64_t exposure_vetoes = 0;
    for (const auto& event : result.events) {
        const auto& signal = event.signal;
        if (signal.is_veto() && signal.risk_reason == RiskReason::ExposureLimit) {
            ++exposure_vetoes;
        }
        positions[signal.instrument.str()] += static_cast<double>(sign_of(signal.direction)) *
                                              signal.size_fraction * config_.risk.max_position_size;
    }

    // Same timestamps: EURUSD moves first, XAUUSD gets the last 0.04 scaled
    EXPECT_NEAR(positions["EURUSD"], 0.32, 1e-9);
    EXPECT_NEAR(positions["XAUUSD"], 0.28, 1e-9);
    EXPECT_EQ(result.sessions.at(Symbol("XAUUSD")).scaled, 1u);
    EXPECT_GT(exposure_vetoes, 0u);
    EXPECT_EQ(result.stats.trade_count, 8u);
}

TEST_F(ReplayerTest, FreshStateForEveryRun) {
    BacktestReplayer replayer(config_, predictors_);
    Series gold_only{{Symbol("XAUUSD"), series_.at(Symbol("XAUUSD"))}};
    const auto alone = replayer.run(gold_only);
    (void)replayer.run(series_);
    EXPECT_EQ(replayer.run(gold_only).events, alone.events);
}

TEST_F(ReplayerTest, NoLookAhead) {
    BacktestReplayer replayer(config_, predictors_);
    const auto& full_series = series_.at(Symbol("XAUUSD"));
    const std::vector<MarketSnapshot> prefix(full_series.begin(), full_series.begin() + 100);

    const auto full = replayer.run(Series{{Symbol("XAUUSD"), full_series}});
    const auto cut = replayer.run(Series{{Symbol("XAUUSD"), prefix}});

    ASSERT_LT(cut.events.size(), full.events.size());
    for (size_t i = 0; i < cut.events.size(); ++i) {
        EXPECT_EQ(cut.events[i].signal, full.events[i].signal) << "event " << i;
        if (i + 1 < cut.events.size()) {
            EXPECT_EQ(cut.events[i].pnl, full.events[i].pnl) << "event " << i;
        }
    }
    EXPECT_EQ(cut.events.back().pnl, 0.0);
}

TEST_F(ReplayerTest, CountsPerInstrument) {
    BacktestReplayer replayer(config_, predictors_);
    const auto result = replayer.run(series_);

    const size_t lookback = replayer.arbiter().min_history();
    ASSERT_EQ(result.sessions.size(), 2u);
    EXPECT_EQ(result.sessions.at(Symbol("EURUSD")).ticks, 120u);
    EXPECT_EQ(result.sessions.at(Symbol("EURUSD")).decisions, 120u - lookback);
    EXPECT_EQ(result.sessions.at(Symbol("XAUUSD")).decisions, 160u - lookback);
    EXPECT_EQ(result.stats.decision_count, result.events.size());
    EXPECT_EQ(result.stats.skipped_ticks, 2 * lookback);

    // Events are grouped by instrument, in time order within each
    EXPECT_EQ(result.events.front().signal.instrument.view(), "EURUSD");
    EXPECT_EQ(result.events.back().signal.instrument.view(), "XAUUSD");
}

TEST_F(ReplayerTest, FlatListIsGroupedFirst) {
    std::vector<MarketSnapshot> flat;
    for (const auto& [symbol, snapshots] : series_) {
        flat.insert(flat.end(), snapshots.rbegin(), snapshots.rend());
    }
    BacktestReplayer replayer(config_, predictors_);
    EXPECT_EQ(fingerprint(replayer.run(flat)), fingerprint(replayer.run(series_)));
}

// ============================================================================
// Statistics
// ============================================================================

namespace {

BacktestEvent event_at(int64_t seconds, double pnl) {
    BacktestEvent e;
    e.timestamp = from_epoch_ns(seconds * SECOND_NS);
    e.pnl = pnl;
    return e;
}

}  // namespace

TEST(BacktestStatsTest, SummarizesEventPnl) {
    const std::vector<BacktestEvent> events = {
        event_at(1, 0.01), event_at(2, -0.005), event_at(3, 0.02), event_at(4, 0.0)};
    const auto stats = summarize(events, {}, 3);

    EXPECT_NEAR(stats.total_return, 0.025, 1e-12);
    EXPECT_NEAR(stats.win_rate, 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(stats.profit_factor, 6.0, 1e-9);
    EXPECT_NEAR(stats.max_drawdown, 0.005 / 1.01, 1e-12);
    EXPECT_GT(stats.sharpe, 0.0);
    EXPECT_EQ(stats.trade_count, 3u);
    EXPECT_EQ(stats.decision_count, 4u);
}

TEST(BacktestStatsTest, NoLossesGivesInfiniteProfitFactor) {
    const auto stats = summarize({event_at(1, 0.01), event_at(2, 0.02)}, {}, 1);
    EXPECT_EQ(stats.profit_factor, std::numeric_limits<double>::infinity());
    EXPECT_DOUBLE_EQ(stats.max_drawdown, 0.0);
    EXPECT_NE(summary_json(stats).find("\"profit_factor\":null"), std::string::npos);
}

TEST(BacktestStatsTest, EmptyRun) {
    const auto stats = summarize({}, {}, 0);
    EXPECT_EQ(stats, BacktestStats{});
}

TEST(BacktestStatsTest, DrawdownUsesTimeOrderAcrossInstruments) {
    // Grouped order would show no drawdown; in time order equity dips
    const std::vector<BacktestEvent> events = {
        event_at(1, 0.1), event_at(3, 0.1),    // first instrument
        event_at(2, -0.1), event_at(4, -0.1)}; // second instrument
    const auto stats = summarize(events, {}, 0);
    EXPECT_NEAR(stats.max_drawdown, 0.1 / 1.1, 1e-12);
}

// ============================================================================
// Report
// ============================================================================

TEST(BacktestReportTest, Sha256KnownVector) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ReplayerTest, ReportFileMatchesFingerprint) {
    const auto result = BacktestReplayer(config_, predictors_).run(series_);
    const auto path = std::filesystem::temp_directory_path() / "aurum_report_test" / "report.json";
    std::filesystem::remove_all(path.parent_path());

    const auto digest = write_report(result, path);
    EXPECT_EQ(digest, fingerprint(result));

    std::ifstream in(path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text, report_json(result) + "\n");
    EXPECT_EQ(text.rfind("{\"summary\":{", 0), 0u);
    EXPECT_NE(text.find("\"instruments\":{\"EURUSD\":"), std::string::npos);
    EXPECT_NE(text.find("\"events\":["), std::string::npos);

    std::filesystem::remove_all(path.parent_path());
}
