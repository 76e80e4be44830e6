#pragma once
// ============================================================================
// AURUM - Neural Predictor
// ============================================================================
// Feed-forward dense network. Hidden layers and the single output unit use
// tanh, so the output o lies in [-1, 1]; direction is sign(o) outside the
// hold band and confidence is |o|
// ============================================================================

#include "aurum/model/predictor.hpp"

#include <vector>

namespace aurum::model {

/// Row-major weights: outputs x inputs
struct DenseLayer {
    size_t inputs = 0;
    size_t outputs = 0;
    std::vector<double> weights;
    std::vector<double> bias;
};

struct NeuralParams {
    std::vector<DenseLayer> layers;
    double hold_band = 0.05;
};

class NeuralPredictor final : public PredictorBase {
public:
    NeuralPredictor(PredictorSpec spec, NeuralParams params);

    [[nodiscard]] ModelPrediction predict(const FeatureVector& features) const override;

    /// Forward pass; returns the single output activation
    [[nodiscard]] double forward(const std::vector<double>& x) const;

protected:
    void check_shape(size_t dimension) const override;

private:
    NeuralParams params_;
};

}  // namespace aurum::model
