// ============================================================================
// AURUM - Live Engine Implementation
// ============================================================================

#include "aurum/engine/live_engine.hpp"
#include "aurum/core/error.hpp"
#include "aurum/utils/logger.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <filesystem>

namespace aurum::engine {

// ============================================================================
// Arena Entry
// ============================================================================

struct LiveEngine::Entry {
    Entry(boost::asio::thread_pool& pool, Symbol instrument, size_t capacity, SessionState state,
          std::shared_ptr<risk::ExposureBook> exposure)
        : strand(boost::asio::make_strand(pool)),
          session(instrument, capacity, std::move(state), std::move(exposure)) {}

    boost::asio::strand<boost::asio::thread_pool::executor_type> strand;
    mutable std::mutex mutex;
    DecisionSession session;
};

// ============================================================================
// Construction
// ============================================================================

LiveEngine::LiveEngine(const config::AppConfig& config, std::shared_ptr<const SignalArbiter> arbiter)
    : engine_config_(config.engine),
      regime_config_(config.regime),
      ensemble_config_(config.ensemble),
      risk_limits_(config.risk),
      pool_(std::max<size_t>(config.engine.worker_threads, 1)),
      exposure_(std::make_shared<risk::ExposureBook>()),
      arbiter_(std::move(arbiter)) {
    if (!arbiter_) {
        throw ConfigError("live engine needs a signal arbiter");
    }
    LOG_INFO("Live engine: {} workers, {}ms cycle deadline, {} predictors",
             engine_config_.worker_threads, engine_config_.cycle_deadline.count(),
             arbiter_->predictors().size());
}

LiveEngine::~LiveEngine() {
    if (stopped_.load()) return;
    try {
        stop();
    } catch (const std::exception& e) {
        LOG_ERROR("Live engine shutdown failed: {}", e.what());
    }
}

SessionState LiveEngine::fresh_state() const {
    risk::RiskBudget budget;
    budget.limits = risk_limits_;
    return SessionState{
        regime::RegimeDetector(regime_config_),
        ensemble::ReliabilityTable(ensemble_config_.initial_reliability),
        std::move(budget),
        std::nullopt,
        std::nullopt,
    };
}

LiveEngine::Entry& LiveEngine::entry_for(const Symbol& instrument) {
    std::lock_guard<std::mutex> lock(arena_mutex_);
    auto it = arena_.find(instrument);
    if (it == arena_.end()) {
        auto entry = std::make_unique<Entry>(pool_, instrument, engine_config_.history_capacity,
                                             fresh_state(), exposure_);
        it = arena_.emplace(instrument, std::move(entry)).first;
        LOG_INFO("Tracking instrument {}", instrument.view());
    }
    return *it->second;
}

std::shared_ptr<const SignalArbiter> LiveEngine::arbiter() const {
    std::lock_guard<std::mutex> lock(arbiter_mutex_);
    return arbiter_;
}

void LiveEngine::on_signal(SignalCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callbacks_.push_back(std::move(callback));
}

// ============================================================================
// Cycle Dispatch
// ============================================================================

std::future<CycleResult> LiveEngine::submit(const MarketSnapshot& snapshot,
                                            std::vector<MarketSnapshot> context) {
    if (stopped_.load()) {
        throw Error("live engine is stopped");
    }

    const auto deadline = std::chrono::steady_clock::now() + engine_config_.cycle_deadline;
    auto& entry = entry_for(snapshot.instrument);
    auto promise = std::make_shared<std::promise<CycleResult>>();
    auto future = promise->get_future();

    boost::asio::post(entry.strand, [this, &entry, snapshot, context = std::move(context), promise, deadline]() {
        try {
            auto current = arbiter();
            CycleResult result;
            {
                std::lock_guard<std::mutex> lock(entry.mutex);
                // Context is kept even when the cycle itself is too late
                entry.session.absorb(context);
                if (std::chrono::steady_clock::now() >= deadline) {
                    throw CycleDeadlineExceeded("cycle for " + snapshot.instrument.str() +
                                                " started after its deadline");
                }
                result = entry.session.on_snapshot(snapshot, *current, deadline);
            }

            if (result.decision) {
                const auto& signal = result.decision->signal;
                LOG_DEBUG("Signal {} {} size {:.4f} conf {:.4f} regime {}",
                          signal.instrument.view(), to_string(signal.direction),
                          signal.size_fraction, signal.confidence, to_string(signal.regime));

                std::vector<SignalCallback> callbacks;
                {
                    std::lock_guard<std::mutex> lock(callback_mutex_);
                    callbacks = callbacks_;
                }
                for (const auto& callback : callbacks) {
                    callback(signal);
                }
            }

            after_commit();
            promise->set_value(std::move(result));
        } catch (const CycleDeadlineExceeded& e) {
            {
                std::lock_guard<std::mutex> lock(entry.mutex);
                entry.session.record_missed();
            }
            LOG_WARN("Missed tick for {}: {}", snapshot.instrument.view(), e.what());
            promise->set_exception(std::current_exception());
        } catch (const std::exception& e) {
            LOG_ERROR("Cycle failed for {}: {}", snapshot.instrument.view(), e.what());
            promise->set_exception(std::current_exception());
        }
    });

    return future;
}

void LiveEngine::after_commit() {
    const uint64_t n = ++committed_;
    if (engine_config_.checkpoint_interval == 0 || n % engine_config_.checkpoint_interval != 0) {
        return;
    }
    try {
        save();
    } catch (const std::exception& e) {
        LOG_ERROR("Periodic checkpoint failed: {}", e.what());
    }
}

// ============================================================================
// State Management
// ============================================================================

void LiveEngine::restore(const Checkpoint& checkpoint) {
    for (const auto& inst : checkpoint.instruments) {
        auto& entry = entry_for(Symbol(inst.instrument));
        std::lock_guard<std::mutex> lock(entry.mutex);

        auto& state = entry.session.state();
        state.reliabilities = inst.reliabilities;
        state.budget.equity = inst.equity;
        state.budget.peak_equity = inst.peak_equity;
        state.budget.positions = inst.positions;
        state.budget.trades = inst.trades;
        exposure_->record(entry.session.instrument(), state.budget.position(entry.session.instrument()));

        regime::RegimeState regime;
        regime.label = inst.regime;
        regime.candidate = inst.regime;
        if (inst.regime != RegimeLabel::Undetermined) {
            regime.streak = static_cast<uint32_t>(regime_config_.hysteresis);
            regime.recent.assign(regime_config_.hysteresis, inst.regime);
            regime.confidence = 1.0;
        }
        state.detector = regime::RegimeDetector(regime_config_, std::move(regime));
    }
    LOG_INFO("Restored state for {} instruments", checkpoint.instruments.size());
}

Checkpoint LiveEngine::checkpoint() const {
    std::vector<const Entry*> entries;
    {
        std::lock_guard<std::mutex> lock(arena_mutex_);
        for (const auto& [symbol, entry] : arena_) {
            entries.push_back(entry.get());
        }
    }

    Checkpoint checkpoint;
    checkpoint.written_at = now();
    for (const auto* entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        const auto& state = entry->session.state();

        InstrumentCheckpoint inst;
        inst.instrument = entry->session.instrument().str();
        inst.reliabilities = state.reliabilities;
        inst.equity = state.budget.equity;
        inst.peak_equity = state.budget.peak_equity;
        inst.positions = state.budget.positions;
        inst.trades = state.budget.trades;
        inst.regime = state.detector.label();
        checkpoint.instruments.push_back(std::move(inst));
    }
    return checkpoint;
}

void LiveEngine::save() const {
    if (engine_config_.checkpoint_path.empty()) return;
    save_checkpoint(checkpoint(), engine_config_.checkpoint_path);
}

void LiveEngine::reconfigure(const config::AppConfig& config,
                             std::shared_ptr<const SignalArbiter> arbiter) {
    if (arbiter) {
        std::lock_guard<std::mutex> lock(arbiter_mutex_);
        arbiter_ = std::move(arbiter);
    }

    std::vector<Entry*> entries;
    {
        std::lock_guard<std::mutex> lock(arena_mutex_);
        regime_config_ = config.regime;
        ensemble_config_ = config.ensemble;
        risk_limits_ = config.risk;
        for (auto& [symbol, entry] : arena_) {
            entries.push_back(entry.get());
        }
    }

    for (auto* entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        auto& state = entry->session.state();
        state.detector.reconfigure(config.regime);
        state.budget.limits = config.risk;
    }
    LOG_INFO("Live engine reconfigured ({} instruments)", entries.size());
}

std::vector<InstrumentStatus> LiveEngine::status() const {
    std::vector<const Entry*> entries;
    {
        std::lock_guard<std::mutex> lock(arena_mutex_);
        for (const auto& [symbol, entry] : arena_) {
            entries.push_back(entry.get());
        }
    }

    std::vector<InstrumentStatus> out;
    out.reserve(entries.size());
    for (const auto* entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        const auto& session = entry->session;
        const auto& state = session.state();

        InstrumentStatus s;
        s.instrument = session.instrument();
        s.stats = session.stats();
        s.regime = state.detector.state().label;
        s.regime_confidence = state.detector.state().confidence;
        s.equity = state.budget.equity;
        s.drawdown = state.budget.drawdown();
        s.position = state.budget.position(session.instrument());
        s.history = session.history().size();
        out.push_back(s);
    }
    return out;
}

void LiveEngine::stop() {
    if (stopped_.exchange(true)) return;
    pool_.join();
    save();
    LOG_INFO("Live engine stopped after {} committed cycles", committed_.load());
}

}  // namespace aurum::engine
