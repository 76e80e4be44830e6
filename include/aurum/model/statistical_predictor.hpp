#pragma once
// ============================================================================
// AURUM - Statistical Predictor
// ============================================================================
// Logistic regression over the feature vector:
//   p = sigmoid(w . x + b), direction from p - 0.5, confidence |2p - 1|
// ============================================================================

#include "aurum/model/predictor.hpp"

#include <vector>

namespace aurum::model {

struct LogisticParams {
    std::vector<double> weights;
    double bias = 0.0;
    double hold_band = 0.05;  // Hold while |p - 0.5| <= hold_band
};

class StatisticalPredictor final : public PredictorBase {
public:
    StatisticalPredictor(PredictorSpec spec, LogisticParams params);

    [[nodiscard]] ModelPrediction predict(const FeatureVector& features) const override;

    /// Raw probability of an up move, without schema checks
    [[nodiscard]] double probability(const std::vector<double>& x) const;

    [[nodiscard]] const LogisticParams& params() const { return params_; }

protected:
    void check_shape(size_t dimension) const override;

private:
    LogisticParams params_;
};

}  // namespace aurum::model
