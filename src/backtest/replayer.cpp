// ============================================================================
// AURUM - Backtest Replayer Implementation
// ============================================================================

#include "aurum/backtest/replayer.hpp"
#include "aurum/backtest/report.hpp"
#include "aurum/core/error.hpp"
#include "aurum/market/history_loader.hpp"
#include "aurum/model/model_registry.hpp"
#include "aurum/model/prediction_executor.hpp"
#include "aurum/risk/exposure_book.hpp"
#include "aurum/utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <memory>

namespace aurum::backtest {

// ============================================================================
// Statistics
// ============================================================================

BacktestStats summarize(const std::vector<BacktestEvent>& events,
                        const std::map<Symbol, engine::SessionStats>& sessions,
                        uint64_t trade_count) {
    BacktestStats stats;
    stats.decision_count = events.size();
    stats.trade_count = trade_count;
    for (const auto& [symbol, session] : sessions) {
        stats.skipped_ticks += session.skipped;
    }
    if (events.empty()) {
        return stats;
    }

    double gross_profit = 0.0;
    double gross_loss = 0.0;
    uint64_t wins = 0;
    uint64_t scored = 0;
    for (const auto& e : events) {
        stats.total_return += e.pnl;
        if (e.pnl > 0.0) {
            gross_profit += e.pnl;
            ++wins;
            ++scored;
        } else if (e.pnl < 0.0) {
            gross_loss -= e.pnl;
            ++scored;
        }
    }
    stats.win_rate = scored > 0 ? static_cast<double>(wins) / static_cast<double>(scored) : 0.0;
    if (gross_loss > 0.0) {
        stats.profit_factor = gross_profit / gross_loss;
    } else if (gross_profit > 0.0) {
        stats.profit_factor = std::numeric_limits<double>::infinity();
    }

    // Sharpe over per-event returns, sample deviation
    if (events.size() > 1) {
        const double n = static_cast<double>(events.size());
        const double mean = stats.total_return / n;
        double ss = 0.0;
        for (const auto& e : events) {
            ss += (e.pnl - mean) * (e.pnl - mean);
        }
        const double sd = std::sqrt(ss / (n - 1.0));
        stats.sharpe = sd > 0.0 ? mean / sd : 0.0;
    }

    // Equity curve in time order across instruments
    std::vector<const BacktestEvent*> ordered;
    ordered.reserve(events.size());
    for (const auto& e : events) ordered.push_back(&e);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const BacktestEvent* a, const BacktestEvent* b) {
                         return a->timestamp < b->timestamp;
                     });

    double equity = 1.0;
    double peak = 1.0;
    for (const auto* e : ordered) {
        equity += e->pnl;
        peak = std::max(peak, equity);
        if (peak > 0.0) {
            stats.max_drawdown = std::max(stats.max_drawdown, (peak - equity) / peak);
        }
    }
    return stats;
}

// ============================================================================
// Replayer
// ============================================================================

BacktestReplayer::BacktestReplayer(const config::AppConfig& config,
                                   const model::PredictorSet& predictors)
    : config_(config) {
    model::PredictorSet selected = config.backtest.include_advisory
                                       ? predictors
                                       : model::deterministic_only(predictors);
    if (selected.size() != predictors.size()) {
        LOG_INFO("Backtest excludes {} non-deterministic predictors",
                 predictors.size() - selected.size());
    }

    arbiter_ = std::make_shared<const engine::SignalArbiter>(
        features::FeatureBuilder(config.features.schema),
        std::move(selected),
        ensemble::EnsembleAggregator(config.ensemble),
        std::make_shared<model::InlineExecutor>());
}

engine::SessionState BacktestReplayer::fresh_state() const {
    risk::RiskBudget budget;
    budget.limits = config_.risk;
    return engine::SessionState{
        regime::RegimeDetector(config_.regime),
        ensemble::ReliabilityTable(config_.ensemble.initial_reliability),
        std::move(budget),
        std::nullopt,
        std::nullopt,
    };
}

BacktestResult BacktestReplayer::run(const Series& series) const {
    SCOPED_TIMER("backtest");

    struct Lane {
        const std::vector<MarketSnapshot>* snapshots;
        size_t next = 0;
        engine::DecisionSession session;
        std::vector<BacktestEvent> events;
    };

    auto book = std::make_shared<risk::ExposureBook>();
    std::vector<Lane> lanes;
    lanes.reserve(series.size());
    for (const auto& [symbol, snapshots] : series) {
        lanes.push_back(Lane{&snapshots, 0,
                             engine::DecisionSession(symbol, config_.engine.history_capacity,
                                                     fresh_state(), book),
                             {}});
    }

    // Merged timeline; on equal timestamps the earlier instrument goes first
    while (true) {
        Lane* lane = nullptr;
        for (auto& candidate : lanes) {
            if (candidate.next >= candidate.snapshots->size()) continue;
            if (!lane || (*candidate.snapshots)[candidate.next].timestamp <
                             (*lane->snapshots)[lane->next].timestamp) {
                lane = &candidate;
            }
        }
        if (!lane) break;

        const auto& snapshot = (*lane->snapshots)[lane->next++];
        auto result = lane->session.on_snapshot(snapshot, *arbiter_);

        // P&L realized since the previous tick belongs to the last decision
        if (!lane->events.empty()) {
            lane->events.back().pnl += result.booked_pnl;
        }
        if (result.decided()) {
            BacktestEvent event;
            event.timestamp = snapshot.timestamp;
            event.signal = result.decision->signal;
            lane->events.push_back(std::move(event));
        }
    }

    BacktestResult result;
    uint64_t trades = 0;
    for (auto& lane : lanes) {
        const auto& session = lane.session;
        LOG_DEBUG("Replayed {}: {} ticks, {} decisions, equity {:.6f}", session.instrument().view(),
                  session.stats().ticks, session.stats().decisions, session.state().budget.equity);
        result.events.insert(result.events.end(),
                             std::make_move_iterator(lane.events.begin()),
                             std::make_move_iterator(lane.events.end()));
        result.sessions.emplace(session.instrument(), session.stats());
        trades += session.state().budget.trades;
    }
    result.stats = summarize(result.events, result.sessions, trades);

    LOG_INFO("Backtest: {} instruments, {} decisions, {} skipped, return {:.6f}, sharpe {:.4f}, "
             "gross exposure {:.4f}",
             series.size(), result.stats.decision_count, result.stats.skipped_ticks,
             result.stats.total_return, result.stats.sharpe, book->gross());
    return result;
}

BacktestResult BacktestReplayer::run(const std::vector<MarketSnapshot>& snapshots) const {
    return run(market::group_by_instrument(snapshots));
}

BacktestResult BacktestReplayer::verify_determinism(const Series& series) const {
    auto result = run(series);
    const auto first = fingerprint(result);
    const auto second = fingerprint(run(series));
    if (first != second) {
        throw ReplayDivergence("replay fingerprints differ: " + first + " vs " + second);
    }
    LOG_INFO("Replay verified deterministic ({})", first);
    return result;
}

}  // namespace aurum::backtest
