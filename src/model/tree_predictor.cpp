// ============================================================================
// AURUM - Tree Ensemble Predictor Implementation
// ============================================================================

#include "aurum/model/tree_predictor.hpp"
#include "aurum/core/error.hpp"

#include <cmath>
#include <string>

namespace aurum::model {

TreeEnsemblePredictor::TreeEnsemblePredictor(PredictorSpec spec, TreeEnsembleParams params)
    : PredictorBase(std::move(spec)), params_(std::move(params)) {
    if (params_.stumps.empty()) {
        throw ConfigError("tree ensemble '" + id() + "' has no stumps");
    }
    if (!(params_.learning_rate > 0.0)) {
        throw ConfigError("tree ensemble '" + id() + "' learning_rate must be positive");
    }
}

void TreeEnsemblePredictor::check_shape(size_t dimension) const {
    for (const auto& stump : params_.stumps) {
        if (stump.feature >= dimension) {
            throw SchemaMismatch("tree ensemble '" + id() + "' splits on feature " +
                                 std::to_string(stump.feature) + " but schema has " +
                                 std::to_string(dimension));
        }
    }
}

double TreeEnsemblePredictor::score(const std::vector<double>& x) const {
    double s = 0.0;
    for (const auto& stump : params_.stumps) {
        s += x[stump.feature] <= stump.threshold ? stump.left : stump.right;
    }
    return s * params_.learning_rate;
}

ModelPrediction TreeEnsemblePredictor::predict(const FeatureVector& features) const {
    check_features(features);
    const double s = score(features.values);
    return from_score(features, s, params_.hold_band, std::tanh(std::abs(s)));
}

}  // namespace aurum::model
