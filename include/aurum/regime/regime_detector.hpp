#pragma once
// ============================================================================
// AURUM - Regime Detector
// ============================================================================
// Explicit state machine classifying the market into a discrete regime from
// a rolling window of snapshots. A new label is committed only after the
// same raw classification has been produced `hysteresis` times in a row
//
// Classification priority (first match wins):
//   Illiquid       - mean relative spread > max_spread or mean volume < min_volume
//   HighVolatility - realized volatility > high_volatility
//   Trending       - trend efficiency > trend_threshold
//   Ranging        - otherwise
// ============================================================================

#include "aurum/core/types.hpp"
#include "aurum/features/feature_builder.hpp"

#include <optional>
#include <vector>

namespace aurum::regime {

// ============================================================================
// Configuration
// ============================================================================

struct RegimeConfig {
    size_t window = 30;              // Snapshots per evaluation, current included
    size_t hysteresis = 3;           // Consecutive matching evaluations to commit
    double high_volatility = 0.004;  // Per-step log-return stddev
    double trend_threshold = 1.5;    // |net move| / (vol * sqrt(steps))
    double max_spread = 0.002;       // Mean relative spread
    double min_volume = 0.0;         // Mean volume per snapshot
};

/// Statistics measured over one window
struct RegimeStatistics {
    double volatility = 0.0;
    double efficiency = 0.0;
    double mean_spread = 0.0;
    double mean_volume = 0.0;
};

// ============================================================================
// State
// ============================================================================

struct RegimeState {
    RegimeLabel label = RegimeLabel::Undetermined;  // Committed label
    double confidence = 0.0;

    // Hysteresis bookkeeping
    RegimeLabel candidate = RegimeLabel::Undetermined;
    uint32_t streak = 0;
    std::vector<RegimeLabel> recent;  // Last `hysteresis` raw labels, oldest first
    uint64_t evaluations = 0;
    uint64_t transitions = 0;

    bool operator==(const RegimeState&) const = default;
};

// ============================================================================
// Detector
// ============================================================================

class RegimeDetector {
public:
    explicit RegimeDetector(RegimeConfig config = {});
    RegimeDetector(RegimeConfig config, RegimeState state);

    /// Evaluate once for `snapshot`. Leaves the state untouched while the
    /// window is not yet filled
    const RegimeState& evaluate(const MarketSnapshot& snapshot, features::SnapshotWindow history);

    /// Window statistics, or nullopt while history is too short
    [[nodiscard]] std::optional<RegimeStatistics> measure(const MarketSnapshot& snapshot,
                                                          features::SnapshotWindow history) const;

    /// Raw, memoryless classification
    [[nodiscard]] RegimeLabel classify(const RegimeStatistics& stats) const;

    /// Feed one raw classification through the hysteresis state machine
    const RegimeState& observe(RegimeLabel raw);

    [[nodiscard]] const RegimeState& state() const { return state_; }
    [[nodiscard]] RegimeLabel label() const { return state_.label; }
    [[nodiscard]] const RegimeConfig& config() const { return config_; }

    /// Replace the thresholds, keeping the committed label
    void reconfigure(const RegimeConfig& config);

private:
    RegimeConfig config_;
    RegimeState state_;
};

/// Throws ConfigError for unusable settings
void validate(const RegimeConfig& config);

}  // namespace aurum::regime
