#pragma once
// ============================================================================
// AURUM - Predictor Reliability
// ============================================================================
// Per-predictor, per-regime exponentially weighted accuracy in [0, 1]
// Plain value type: the replayer and checkpoints work on copies
// ============================================================================

#include "aurum/core/types.hpp"

#include <array>
#include <map>
#include <string>

namespace aurum::ensemble {

class ReliabilityTable {
public:
    using Scores = std::array<double, REGIME_COUNT>;

    explicit ReliabilityTable(double initial = 0.5) : initial_(initial) {}

    /// Score for a predictor in a regime; the initial value if never updated
    [[nodiscard]] double get(const std::string& predictor_id, RegimeLabel regime) const {
        auto it = scores_.find(predictor_id);
        if (it == scores_.end()) return initial_;
        return it->second[regime_index(regime)];
    }

    void set(const std::string& predictor_id, RegimeLabel regime, double score) {
        auto it = scores_.find(predictor_id);
        if (it == scores_.end()) {
            Scores fresh;
            fresh.fill(initial_);
            it = scores_.emplace(predictor_id, fresh).first;
        }
        it->second[regime_index(regime)] = clamp_confidence(score);
    }

    [[nodiscard]] double initial() const { return initial_; }
    [[nodiscard]] const std::map<std::string, Scores>& entries() const { return scores_; }
    [[nodiscard]] bool empty() const { return scores_.empty(); }

    bool operator==(const ReliabilityTable&) const = default;

private:
    double initial_;
    std::map<std::string, Scores> scores_;  // Ordered for stable checkpoints
};

}  // namespace aurum::ensemble
