// ============================================================================
// AURUM - Predictor Base Implementation
// ============================================================================

#include "aurum/model/predictor.hpp"
#include "aurum/core/error.hpp"

#include <cmath>

namespace aurum::model {

void PredictorBase::validate(const features::FeatureSchema& schema) const {
    if (spec_.schema_id != schema.id) {
        throw SchemaMismatch("predictor '" + spec_.id + "'", spec_.schema_id, schema.id);
    }
    check_shape(schema.dimension());
}

void PredictorBase::check_features(const FeatureVector& features) const {
    if (features.schema_id != spec_.schema_id) {
        throw SchemaMismatch("predictor '" + spec_.id + "'", spec_.schema_id, features.schema_id);
    }
    check_shape(features.size());
}

ModelPrediction PredictorBase::from_score(const FeatureVector& features,
                                          double score,
                                          double hold_band,
                                          double confidence) const {
    if (!std::isfinite(score) || !std::isfinite(confidence)) {
        throw ModelError("predictor '" + spec_.id + "' produced a non-finite output");
    }

    ModelPrediction prediction;
    prediction.predictor_id = spec_.id;
    prediction.timestamp = features.as_of;
    prediction.confidence = clamp_confidence(confidence);

    if (score > hold_band) {
        prediction.direction = Direction::Buy;
    } else if (score < -hold_band) {
        prediction.direction = Direction::Sell;
    } else {
        prediction.direction = Direction::Hold;
    }
    return prediction;
}

}  // namespace aurum::model
