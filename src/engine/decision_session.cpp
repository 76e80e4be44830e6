// ============================================================================
// AURUM - Decision Session Implementation
// ============================================================================

#include "aurum/engine/decision_session.hpp"
#include "aurum/core/error.hpp"
#include "aurum/utils/logger.hpp"

#include <algorithm>

namespace aurum::engine {

DecisionSession::DecisionSession(Symbol instrument, size_t history_capacity, SessionState state,
                                 std::shared_ptr<risk::ExposureBook> book)
    : instrument_(instrument),
      capacity_(std::max<size_t>(history_capacity, 1)),
      state_(std::move(state)),
      book_(std::move(book)) {
    history_.reserve(capacity_ * 2);
    if (book_) {
        book_->record(instrument_, state_.budget.position(instrument_));
    }
}

std::optional<Timestamp> DecisionSession::last_timestamp() const {
    if (history_.empty()) return std::nullopt;
    return history_.back().timestamp;
}

void DecisionSession::append(const MarketSnapshot& snapshot) {
    history_.push_back(snapshot);
    // Compact lazily; decisions only ever read the trailing window
    if (history_.size() > capacity_ * 2) {
        history_.erase(history_.begin(), history_.end() - static_cast<std::ptrdiff_t>(capacity_));
    }
}

size_t DecisionSession::absorb(std::span<const MarketSnapshot> snapshots) {
    size_t appended = 0;
    for (const auto& s : snapshots) {
        if (!(s.instrument == instrument_)) continue;
        if (!history_.empty() && s.timestamp <= history_.back().timestamp) continue;
        append(s);
        ++appended;
    }
    return appended;
}

void DecisionSession::commit(Decision& decision, const SignalArbiter& arbiter,
                             SessionState& next) const {
    const auto& gate = arbiter.gate();
    if (!book_) {
        gate.commit(decision.signal, next.budget);
        return;
    }

    book_->transact(instrument_, [&](double others) {
        // Another instrument committed while this one was deciding
        if (others != next.budget.external_exposure) {
            next.budget.external_exposure = others;
            const double regime_confidence = decision.signal.regime_confidence;
            decision.signal = gate.evaluate(decision.blended, next.budget, instrument_,
                                            decision.signal.timestamp);
            decision.signal.regime_confidence = regime_confidence;
        }
        gate.commit(decision.signal, next.budget);
        return next.budget.position(instrument_);
    });
}

CycleResult DecisionSession::on_snapshot(const MarketSnapshot& snapshot,
                                         const SignalArbiter& arbiter,
                                         std::optional<model::SteadyTime> deadline) {
    if (!(snapshot.instrument == instrument_)) {
        throw DataError("snapshot for " + snapshot.instrument.str() +
                        " routed to session " + instrument_.str());
    }
    if (!history_.empty() && snapshot.timestamp <= history_.back().timestamp) {
        throw DataError("out-of-order snapshot for " + instrument_.str() + " at " +
                        std::to_string(to_epoch_ns(snapshot.timestamp)));
    }

    SessionState next = state_;
    SessionStats stats = stats_;
    CycleResult result;

    // ------------------------------------------------------------------------
    // Feedback for the position and predictions of the previous cycle
    // ------------------------------------------------------------------------
    const double cur = snapshot.mid();
    if (next.mark && *next.mark > 0.0 && cur > 0.0) {
        const double realized = cur / *next.mark - 1.0;
        result.booked_pnl = arbiter.gate().mark_to_market(next.budget, instrument_, realized);
        if (next.pending) {
            arbiter.aggregator().update_reliability(next.pending->predictions,
                                                    next.pending->regime,
                                                    realized,
                                                    next.reliabilities);
        }
    }
    next.pending.reset();
    if (cur > 0.0) {
        next.mark = cur;
    }
    if (book_) {
        next.budget.external_exposure = book_->others(instrument_);
    }

    // ------------------------------------------------------------------------
    // Decide and commit
    // ------------------------------------------------------------------------
    try {
        Decision decision = arbiter.decide(snapshot, history_, next.detector,
                                           next.reliabilities, next.budget, deadline);
        commit(decision, arbiter, next);
        next.pending = SessionState::Pending{decision.predictions, decision.signal.regime};

        ++stats.decisions;
        if (decision.signal.degraded) ++stats.degraded;
        if (decision.signal.risk_action == RiskAction::Veto) ++stats.vetoes;
        if (decision.signal.risk_action == RiskAction::Scaled) ++stats.scaled;
        result.decision = std::move(decision);
    } catch (const InsufficientHistory& e) {
        ++stats.skipped;
        result.skip_reason = "InsufficientHistory";
        LOG_DEBUG("No decision for {}: {}", instrument_.view(), e.what());
    } catch (const DataError& e) {
        ++stats.skipped;
        result.skip_reason = "DataError";
        LOG_WARN("No decision for {}: {}", instrument_.view(), e.what());
    }

    ++stats.ticks;
    state_ = std::move(next);
    stats_ = stats;
    append(snapshot);
    return result;
}

}  // namespace aurum::engine
