#pragma once

// ============================================================================
// AURUM - Risk Gate
// ============================================================================
// Position, exposure and drawdown constraints applied to every blended
// signal. Rules run in a fixed order and can only shrink or veto a proposal:
//   1. InstrumentLimit  - veto if the instrument position would exceed its limit
//   2. ExposureLimit    - scale down to the aggregate headroom (veto at zero)
//   3. DrawdownBreaker  - veto everything once drawdown reaches the threshold
//   4. Pass
// Units are capital-normalized: equity starts at 1.0 and a size fraction of
// 1.0 moves the position by max_position_size
// ============================================================================

#include "aurum/core/types.hpp"
#include "aurum/ensemble/aggregator.hpp"

#include <algorithm>
#include <map>
#include <string>

namespace aurum::risk {

// ============================================================================
// Risk Limits
// ============================================================================

struct RiskLimits {
    double max_exposure = 1.0;       // Sum of |positions| across instruments
    double max_position_size = 0.1;  // Position change for size fraction 1.0
    double max_drawdown = 0.15;      // Circuit breaker, fraction of peak equity
    double instrument_limit = 0.5;   // Default |position| cap per instrument
    std::map<std::string, double> instrument_limits;  // Per-instrument overrides

    [[nodiscard]] double limit_for(const Symbol& instrument) const {
        auto it = instrument_limits.find(instrument.str());
        return it != instrument_limits.end() ? it->second : instrument_limit;
    }

    bool operator==(const RiskLimits&) const = default;
};

void validate(const RiskLimits& limits);

// ============================================================================
// Risk Budget
// ============================================================================

struct RiskBudget {
    RiskLimits limits;
    double equity = 1.0;
    double peak_equity = 1.0;
    std::map<std::string, double> positions;  // Signed, fraction of initial capital
    double external_exposure = 0.0;           // Gross exposure held by other sessions
    uint64_t trades = 0;

    [[nodiscard]] double position(const Symbol& instrument) const {
        auto it = positions.find(instrument.str());
        return it != positions.end() ? it->second : 0.0;
    }

    /// Own positions plus external_exposure
    [[nodiscard]] double gross_exposure() const;

    [[nodiscard]] double drawdown() const {
        if (peak_equity <= 0.0) return 1.0;
        return std::max(0.0, (peak_equity - equity) / peak_equity);
    }

    [[nodiscard]] double headroom() const {
        return std::max(0.0, limits.max_exposure - gross_exposure());
    }

    bool operator==(const RiskBudget&) const = default;
};

// ============================================================================
// Risk Gate
// ============================================================================

class RiskGate {
public:
    /// Apply the rules to a blended signal. Never increases the proposed
    /// fraction; a veto becomes Hold with the blended confidence kept
    [[nodiscard]] TradeSignal evaluate(const ensemble::BlendedSignal& blended,
                                       const RiskBudget& budget,
                                       const Symbol& instrument,
                                       Timestamp timestamp) const;

    /// Apply an accepted signal to the budget's positions
    void commit(const TradeSignal& signal, RiskBudget& budget) const;

    /// Accrue the P&L of holding the instrument position over a price
    /// return; updates equity and peak equity. Returns the P&L
    double mark_to_market(RiskBudget& budget, const Symbol& instrument, double price_return) const;
};

}  // namespace aurum::risk
