#pragma once
// ============================================================================
// AURUM - Ensemble Aggregator
// ============================================================================
// Blends predictor outcomes into one directional signal:
//   weight_i   = base_weight_i * reliability(i, regime), responders only,
//                normalized to sum to 1
//   direction  = sign(sum w_i * sign_i), exactly zero -> Hold
//   confidence = sum w_i * conf_i, scaled down by the share of the ensemble
//                that failed to respond
// Reliability is learned afterwards from realized returns
// ============================================================================

#include "aurum/core/types.hpp"
#include "aurum/ensemble/reliability.hpp"
#include "aurum/model/prediction_executor.hpp"

#include <string>
#include <vector>

namespace aurum::ensemble {

// ============================================================================
// Configuration
// ============================================================================

struct EnsembleConfig {
    double decay_half_life = 20.0;      // Outcomes until an observation's weight halves
    double initial_reliability = 0.5;
    double out_of_regime_penalty = 0.5; // Confidence multiplier outside validated regimes
    double flat_return = 0.0001;        // |return| at or below counts as "no move"

    /// Per-update decay factor 0.5^(1/half_life)
    [[nodiscard]] double decay() const;
};

void validate(const EnsembleConfig& config);

// ============================================================================
// Blended Signal
// ============================================================================

struct WeightedVote {
    std::string predictor_id;
    Direction direction = Direction::Hold;
    double confidence = 0.0;  // After any out-of-regime penalty
    double weight = 0.0;      // Normalized
    bool out_of_regime = false;
};

struct BlendedSignal {
    Direction direction = Direction::Hold;
    double confidence = 0.0;
    double proposed_fraction = 0.0;  // Position-size fraction proposed to the risk gate
    double score = 0.0;              // Weighted sign sum in [-1, 1]
    RegimeLabel regime = RegimeLabel::Undetermined;
    uint32_t responded = 0;
    uint32_t total = 0;
    bool degraded = false;
    std::vector<WeightedVote> votes;
};

// ============================================================================
// Aggregator
// ============================================================================

class EnsembleAggregator {
public:
    explicit EnsembleAggregator(EnsembleConfig config = {});

    /// Always returns a signal; no responders gives Hold with confidence 0
    [[nodiscard]] BlendedSignal aggregate(const std::vector<model::PredictorOutcome>& outcomes,
                                          RegimeLabel regime,
                                          const ReliabilityTable& reliabilities) const;

    /// Fold one realized outcome into the reliability scores of `regime`
    void update_reliability(const std::vector<ModelPrediction>& predictions,
                            RegimeLabel regime,
                            double realized_return,
                            ReliabilityTable& reliabilities) const;

    /// 1 if the call matched the realized move, else 0
    [[nodiscard]] double correctness(Direction direction, double realized_return) const;

    [[nodiscard]] const EnsembleConfig& config() const { return config_; }

private:
    EnsembleConfig config_;
    double decay_;
};

}  // namespace aurum::ensemble
