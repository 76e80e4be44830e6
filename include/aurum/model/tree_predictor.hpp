#pragma once
// ============================================================================
// AURUM - Tree Ensemble Predictor
// ============================================================================
// Additive ensemble of decision stumps (gradient-boosting style). Each stump
// contributes `left` when x[feature] <= threshold, else `right`; the sum is
// scaled by the learning rate to give the score s. Confidence is tanh(|s|)
// ============================================================================

#include "aurum/model/predictor.hpp"

#include <vector>

namespace aurum::model {

struct Stump {
    size_t feature = 0;
    double threshold = 0.0;
    double left = 0.0;
    double right = 0.0;
};

struct TreeEnsembleParams {
    std::vector<Stump> stumps;
    double learning_rate = 1.0;
    double hold_band = 0.0;
};

class TreeEnsemblePredictor final : public PredictorBase {
public:
    TreeEnsemblePredictor(PredictorSpec spec, TreeEnsembleParams params);

    [[nodiscard]] ModelPrediction predict(const FeatureVector& features) const override;

    [[nodiscard]] double score(const std::vector<double>& x) const;

protected:
    void check_shape(size_t dimension) const override;

private:
    TreeEnsembleParams params_;
};

}  // namespace aurum::model
