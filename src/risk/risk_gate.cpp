// ============================================================================
// AURUM - Risk Gate Implementation
// ============================================================================

#include "aurum/risk/risk_gate.hpp"
#include "aurum/core/error.hpp"
#include "aurum/utils/logger.hpp"

#include <algorithm>
#include <cmath>

namespace aurum::risk {

namespace {

constexpr double EPSILON = 1e-12;

TradeSignal veto(TradeSignal signal, RiskReason reason) {
    signal.direction = Direction::Hold;
    signal.size_fraction = 0.0;
    signal.risk_action = RiskAction::Veto;
    signal.risk_reason = reason;
    LOG_INFO("Risk veto {} {}: proposed {} {:.4f} confidence {:.4f}",
             signal.instrument.view(), to_string(reason),
             to_string(signal.proposed_direction), signal.proposed_fraction, signal.confidence);
    return signal;
}

}  // namespace

void validate(const RiskLimits& limits) {
    auto in_unit = [](double v) { return v > 0.0 && v <= 1.0; };
    if (!in_unit(limits.max_exposure)) {
        throw ConfigError("risk.max_exposure must be in (0, 1]");
    }
    if (!in_unit(limits.max_position_size)) {
        throw ConfigError("risk.max_position_size must be in (0, 1]");
    }
    if (!in_unit(limits.max_drawdown)) {
        throw ConfigError("risk.max_drawdown must be in (0, 1]");
    }
    if (!(limits.instrument_limit > 0.0)) {
        throw ConfigError("risk.instrument_limit must be positive");
    }
    for (const auto& [instrument, limit] : limits.instrument_limits) {
        if (!(limit > 0.0)) {
            throw ConfigError("risk.instrument_limits." + instrument + " must be positive");
        }
    }
}

double RiskBudget::gross_exposure() const {
    double gross = external_exposure;
    for (const auto& [instrument, position] : positions) {
        gross += std::abs(position);
    }
    return gross;
}

// ============================================================================
// Evaluation
// ============================================================================

TradeSignal RiskGate::evaluate(const ensemble::BlendedSignal& blended,
                               const RiskBudget& budget,
                               const Symbol& instrument,
                               Timestamp timestamp) const {
    TradeSignal signal;
    signal.instrument = instrument;
    signal.timestamp = timestamp;
    signal.direction = blended.direction;
    signal.size_fraction = blended.direction == Direction::Hold ? 0.0 : blended.proposed_fraction;
    signal.confidence = blended.confidence;
    signal.proposed_direction = blended.direction;
    signal.proposed_fraction = signal.size_fraction;
    signal.regime = blended.regime;
    signal.degraded = blended.degraded;
    signal.responded = blended.responded;
    signal.total_predictors = blended.total;

    const auto& limits = budget.limits;
    const double position = budget.position(instrument);
    const double sign = static_cast<double>(sign_of(signal.direction));

    if (signal.direction != Direction::Hold && signal.size_fraction > 0.0) {
        const double delta = sign * signal.size_fraction * limits.max_position_size;
        const double next = position + delta;

        // Rule 1: per-instrument cap
        if (std::abs(next) > limits.limit_for(instrument) + EPSILON &&
            std::abs(next) > std::abs(position)) {
            return veto(signal, RiskReason::InstrumentLimit);
        }

        // Rule 2: aggregate exposure
        const double increase = std::abs(next) - std::abs(position);
        if (increase > 0.0 && budget.gross_exposure() + increase > limits.max_exposure + EPSILON) {
            const double headroom = budget.headroom();
            if (headroom <= EPSILON) {
                return veto(signal, RiskReason::ExposureLimit);
            }

            // Closing an opposite position first frees 2|position| of room
            const bool flips = position * sign < 0.0;
            const double reach = headroom + (flips ? 2.0 * std::abs(position) : 0.0);
            const double fitted = std::min(signal.size_fraction, reach / limits.max_position_size);

            LOG_DEBUG("Risk scale {} {:.4f} -> {:.4f} (headroom {:.4f})",
                      instrument.view(), signal.size_fraction, fitted, headroom);
            signal.size_fraction = fitted;
            signal.risk_action = RiskAction::Scaled;
            signal.risk_reason = RiskReason::ExposureLimit;
        }
    }

    // Rule 3: drawdown circuit breaker, whatever the direction
    if (budget.drawdown() >= limits.max_drawdown) {
        return veto(signal, RiskReason::DrawdownBreaker);
    }

    return signal;
}

// ============================================================================
// Budget Mutation
// ============================================================================

void RiskGate::commit(const TradeSignal& signal, RiskBudget& budget) const {
    if (signal.direction == Direction::Hold || signal.size_fraction <= 0.0) {
        return;
    }
    const double delta = static_cast<double>(sign_of(signal.direction)) *
                         signal.size_fraction * budget.limits.max_position_size;
    budget.positions[signal.instrument.str()] += delta;
    ++budget.trades;
}

double RiskGate::mark_to_market(RiskBudget& budget, const Symbol& instrument,
                                double price_return) const {
    const double pnl = budget.position(instrument) * price_return;
    budget.equity += pnl;
    budget.peak_equity = std::max(budget.peak_equity, budget.equity);
    return pnl;
}

}  // namespace aurum::risk
