#pragma once
// ============================================================================
// AURUM - Live Engine
// ============================================================================
// Event-driven decision loop for live feeds:
//   - one cycle per incoming snapshot, posted on the instrument's strand so
//     cycles for one instrument never overlap while instruments run in parallel
//   - per-instrument state in an arena, each entry behind its own mutex
//   - one exposure book shared by every instrument for the aggregate limit
//   - a global per-cycle deadline; late cycles are abandoned as missed ticks
// ============================================================================

#include "aurum/config/config.hpp"
#include "aurum/engine/checkpoint.hpp"
#include "aurum/engine/decision_session.hpp"
#include "aurum/engine/signal_arbiter.hpp"
#include "aurum/risk/exposure_book.hpp"

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace aurum::engine {

/// Per-instrument view for status reports
struct InstrumentStatus {
    Symbol instrument;
    SessionStats stats;
    RegimeLabel regime = RegimeLabel::Undetermined;
    double regime_confidence = 0.0;
    double equity = 1.0;
    double drawdown = 0.0;
    double position = 0.0;
    size_t history = 0;  // Snapshots retained for feature building
};

class LiveEngine {
public:
    using SignalCallback = std::function<void(const TradeSignal&)>;

    LiveEngine(const config::AppConfig& config, std::shared_ptr<const SignalArbiter> arbiter);
    ~LiveEngine();

    LiveEngine(const LiveEngine&) = delete;
    LiveEngine& operator=(const LiveEngine&) = delete;

    /// Queue one cycle for `snapshot`. `context` holds preceding snapshots the
    /// caller supplies (absorbed into history when newer than what is known).
    /// The future carries the cycle result, or CycleDeadlineExceeded /
    /// DataError
    std::future<CycleResult> submit(const MarketSnapshot& snapshot,
                                    std::vector<MarketSnapshot> context = {});

    /// Invoked on the strand for every emitted signal
    void on_signal(SignalCallback callback);

    /// Restore state from a checkpoint (before the first submit)
    void restore(const Checkpoint& checkpoint);

    /// Snapshot of every instrument's state
    [[nodiscard]] Checkpoint checkpoint() const;

    /// Write the checkpoint to the configured path, if any
    void save() const;

    /// Apply reloaded limits and thresholds, and optionally a new predictor set
    void reconfigure(const config::AppConfig& config,
                     std::shared_ptr<const SignalArbiter> arbiter = nullptr);

    [[nodiscard]] std::vector<InstrumentStatus> status() const;

    /// Sum of |position| across all instruments
    [[nodiscard]] double gross_exposure() const { return exposure_->gross(); }

    /// Wait for queued cycles, then save the checkpoint
    void stop();

private:
    struct Entry;

    Entry& entry_for(const Symbol& instrument);
    [[nodiscard]] std::shared_ptr<const SignalArbiter> arbiter() const;
    [[nodiscard]] SessionState fresh_state() const;
    void after_commit();

    config::EngineConfig engine_config_;
    regime::RegimeConfig regime_config_;
    ensemble::EnsembleConfig ensemble_config_;
    risk::RiskLimits risk_limits_;

    boost::asio::thread_pool pool_;
    std::shared_ptr<risk::ExposureBook> exposure_;

    mutable std::mutex arbiter_mutex_;
    std::shared_ptr<const SignalArbiter> arbiter_;

    mutable std::mutex arena_mutex_;
    std::map<Symbol, std::unique_ptr<Entry>> arena_;

    std::mutex callback_mutex_;
    std::vector<SignalCallback> callbacks_;

    std::atomic<uint64_t> committed_{0};
    std::atomic<bool> stopped_{false};
};

}  // namespace aurum::engine
