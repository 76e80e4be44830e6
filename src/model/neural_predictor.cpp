// ============================================================================
// AURUM - Neural Predictor Implementation
// ============================================================================

#include "aurum/model/neural_predictor.hpp"
#include "aurum/core/error.hpp"

#include <cmath>
#include <string>

namespace aurum::model {

NeuralPredictor::NeuralPredictor(PredictorSpec spec, NeuralParams params)
    : PredictorBase(std::move(spec)), params_(std::move(params)) {
    if (params_.layers.empty()) {
        throw ConfigError("neural predictor '" + id() + "' has no layers");
    }

    for (size_t i = 0; i < params_.layers.size(); ++i) {
        const auto& layer = params_.layers[i];
        if (layer.inputs == 0 || layer.outputs == 0 ||
            layer.weights.size() != layer.inputs * layer.outputs ||
            layer.bias.size() != layer.outputs) {
            throw ConfigError("neural predictor '" + id() + "' layer " + std::to_string(i) +
                              " has inconsistent weight or bias shape");
        }
        if (i > 0 && layer.inputs != params_.layers[i - 1].outputs) {
            throw ConfigError("neural predictor '" + id() + "' layer " + std::to_string(i) +
                              " does not connect to the previous layer");
        }
    }

    if (params_.layers.back().outputs != 1) {
        throw ConfigError("neural predictor '" + id() + "' must have a single output");
    }
}

void NeuralPredictor::check_shape(size_t dimension) const {
    const size_t inputs = params_.layers.front().inputs;
    if (inputs != dimension) {
        throw SchemaMismatch("neural predictor '" + id() + "' expects " + std::to_string(inputs) +
                             " inputs, schema provides " + std::to_string(dimension));
    }
}

double NeuralPredictor::forward(const std::vector<double>& x) const {
    std::vector<double> activation(x.begin(), x.end());
    std::vector<double> next;

    for (const auto& layer : params_.layers) {
        next.assign(layer.outputs, 0.0);
        for (size_t o = 0; o < layer.outputs; ++o) {
            double z = layer.bias[o];
            const double* row = layer.weights.data() + o * layer.inputs;
            for (size_t i = 0; i < layer.inputs; ++i) {
                z += row[i] * activation[i];
            }
            next[o] = std::tanh(z);
        }
        activation.swap(next);
    }
    return activation.front();
}

ModelPrediction NeuralPredictor::predict(const FeatureVector& features) const {
    check_features(features);
    const double o = forward(features.values);
    return from_score(features, o, params_.hold_band, std::abs(o));
}

}  // namespace aurum::model
