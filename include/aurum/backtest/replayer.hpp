#pragma once
// ============================================================================
// AURUM - Backtest Replayer
// ============================================================================
// Replays recorded snapshots through the same DecisionSession cycle the live
// engine runs, on isolated state, with predictors invoked inline and no
// wall-clock deadlines. All instruments share one exposure book and advance
// on a single merged timeline (timestamp, then instrument order), so the
// aggregate exposure limit binds as it does live. Identical inputs give
// bit-identical results
//
// P&L accounting: the position held after committing the decision at t earns
// the mid-price return t -> t+1, which is known only when t+1 arrives. That
// amount is credited to the event of t; the final event earns 0
// ============================================================================

#include "aurum/config/config.hpp"
#include "aurum/engine/decision_session.hpp"
#include "aurum/engine/signal_arbiter.hpp"
#include "aurum/model/predictor.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace aurum::backtest {

using Series = std::map<Symbol, std::vector<MarketSnapshot>>;

struct BacktestEvent {
    Timestamp timestamp{};
    TradeSignal signal;
    double pnl = 0.0;  // Realized over the following interval

    bool operator==(const BacktestEvent&) const = default;
};

struct BacktestStats {
    double total_return = 0.0;     // Sum of event P&L, capital-normalized
    double sharpe = 0.0;           // Per-event mean / sample stddev
    double max_drawdown = 0.0;     // Of the merged equity curve
    double win_rate = 0.0;         // Winning share of events with non-zero P&L
    double profit_factor = 0.0;    // Gross profit / gross loss (inf without losses)
    uint64_t trade_count = 0;
    uint64_t decision_count = 0;
    uint64_t skipped_ticks = 0;

    bool operator==(const BacktestStats&) const = default;
};

struct BacktestResult {
    std::vector<BacktestEvent> events;  // Instrument order, then time order
    BacktestStats stats;
    std::map<Symbol, engine::SessionStats> sessions;
};

/// Aggregate statistics over finished events
[[nodiscard]] BacktestStats summarize(const std::vector<BacktestEvent>& events,
                                      const std::map<Symbol, engine::SessionStats>& sessions,
                                      uint64_t trade_count);

class BacktestReplayer {
public:
    /// Non-deterministic predictors are dropped unless
    /// config.backtest.include_advisory is set
    BacktestReplayer(const config::AppConfig& config, const model::PredictorSet& predictors);

    /// Replay every instrument from a fresh state
    [[nodiscard]] BacktestResult run(const Series& series) const;

    /// Group and stable-sort by timestamp first
    [[nodiscard]] BacktestResult run(const std::vector<MarketSnapshot>& snapshots) const;

    /// Replay twice and compare report fingerprints. Returns the first run;
    /// throws ReplayDivergence when the runs differ
    [[nodiscard]] BacktestResult verify_determinism(const Series& series) const;

    [[nodiscard]] const engine::SignalArbiter& arbiter() const { return *arbiter_; }

private:
    [[nodiscard]] engine::SessionState fresh_state() const;

    config::AppConfig config_;
    std::shared_ptr<const engine::SignalArbiter> arbiter_;
};

}  // namespace aurum::backtest
