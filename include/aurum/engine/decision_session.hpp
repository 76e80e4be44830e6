#pragma once
// ============================================================================
// AURUM - Decision Session
// ============================================================================
// Per-instrument state and the cycle run for every snapshot:
//   1. feedback  - mark the open position to market and score the previous
//                  decision's predictions against the return realized since
//                  the last cycle (context absorbed in between included)
//   2. decide    - SignalArbiter::decide on the updated state
//   3. commit    - apply the signal to the risk budget and the shared
//                  exposure book, append history
// The cycle works on copies and commits them at the end, so a cycle that is
// abandoned (deadline) or fails leaves the session exactly as it was
// ============================================================================

#include "aurum/core/types.hpp"
#include "aurum/engine/signal_arbiter.hpp"
#include "aurum/risk/exposure_book.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace aurum::engine {

// ============================================================================
// Cycle Result & Statistics
// ============================================================================

struct CycleResult {
    std::optional<Decision> decision;  // Empty: no decision this tick
    std::string skip_reason;           // Set when decision is empty
    double booked_pnl = 0.0;           // P&L of the position held since the previous tick

    [[nodiscard]] bool decided() const { return decision.has_value(); }
};

struct SessionStats {
    uint64_t ticks = 0;
    uint64_t decisions = 0;
    uint64_t skipped = 0;   // InsufficientHistory / bad data
    uint64_t missed = 0;    // Cycle deadline exceeded
    uint64_t degraded = 0;
    uint64_t vetoes = 0;
    uint64_t scaled = 0;

    bool operator==(const SessionStats&) const = default;
};

// ============================================================================
// Session State
// ============================================================================

struct SessionState {
    regime::RegimeDetector detector;
    ensemble::ReliabilityTable reliabilities;
    risk::RiskBudget budget;

    /// Outcome feedback owed for the last decision
    struct Pending {
        std::vector<ModelPrediction> predictions;
        RegimeLabel regime = RegimeLabel::Undetermined;
    };
    std::optional<Pending> pending;

    /// Mid price of the last cycle, where the budget was last marked
    std::optional<double> mark;
};

// ============================================================================
// Decision Session
// ============================================================================

class DecisionSession {
public:
    /// With a `book`, exposure limits apply across every session sharing it
    DecisionSession(Symbol instrument, size_t history_capacity, SessionState state,
                    std::shared_ptr<risk::ExposureBook> book = nullptr);

    /// Run one full cycle for `snapshot`, which must be newer than every
    /// snapshot seen so far (DataError otherwise). InsufficientHistory and
    /// bad data yield a result without a decision; CycleDeadlineExceeded
    /// propagates and leaves the session untouched
    CycleResult on_snapshot(const MarketSnapshot& snapshot,
                            const SignalArbiter& arbiter,
                            std::optional<model::SteadyTime> deadline = std::nullopt);

    /// Append externally supplied context snapshots newer than the last one
    /// seen, without running cycles. Returns the number appended. The price
    /// move across them is booked by the next cycle
    size_t absorb(std::span<const MarketSnapshot> snapshots);

    /// Count an abandoned cycle
    void record_missed() { ++stats_.missed; }

    [[nodiscard]] const Symbol& instrument() const { return instrument_; }
    [[nodiscard]] const SessionState& state() const { return state_; }
    [[nodiscard]] SessionState& state() { return state_; }
    [[nodiscard]] const SessionStats& stats() const { return stats_; }
    [[nodiscard]] const std::vector<MarketSnapshot>& history() const { return history_; }
    [[nodiscard]] std::optional<Timestamp> last_timestamp() const;

private:
    void append(const MarketSnapshot& snapshot);
    void commit(Decision& decision, const SignalArbiter& arbiter, SessionState& next) const;

    Symbol instrument_;
    size_t capacity_;
    std::vector<MarketSnapshot> history_;
    SessionState state_;
    SessionStats stats_;
    std::shared_ptr<risk::ExposureBook> book_;
};

}  // namespace aurum::engine
