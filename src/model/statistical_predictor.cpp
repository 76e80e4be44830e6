// ============================================================================
// AURUM - Statistical Predictor Implementation
// ============================================================================

#include "aurum/model/statistical_predictor.hpp"
#include "aurum/core/error.hpp"

#include <cmath>
#include <string>

namespace aurum::model {

StatisticalPredictor::StatisticalPredictor(PredictorSpec spec, LogisticParams params)
    : PredictorBase(std::move(spec)), params_(std::move(params)) {
    if (params_.weights.empty()) {
        throw ConfigError("statistical predictor '" + id() + "' has no weights");
    }
    if (params_.hold_band < 0.0 || params_.hold_band >= 0.5) {
        throw ConfigError("statistical predictor '" + id() + "' hold_band must be in [0, 0.5)");
    }
}

void StatisticalPredictor::check_shape(size_t dimension) const {
    if (params_.weights.size() != dimension) {
        throw SchemaMismatch("predictor '" + id() + "' expects " +
                             std::to_string(params_.weights.size()) +
                             " features, schema provides " + std::to_string(dimension));
    }
}

double StatisticalPredictor::probability(const std::vector<double>& x) const {
    double z = params_.bias;
    for (size_t i = 0; i < params_.weights.size(); ++i) {
        z += params_.weights[i] * x[i];
    }
    return 1.0 / (1.0 + std::exp(-z));
}

ModelPrediction StatisticalPredictor::predict(const FeatureVector& features) const {
    check_features(features);
    const double p = probability(features.values);
    return from_score(features, p - 0.5, params_.hold_band, std::abs(2.0 * p - 1.0));
}

}  // namespace aurum::model
