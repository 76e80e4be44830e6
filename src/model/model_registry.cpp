// ============================================================================
// AURUM - Model Registry Implementation
// ============================================================================

#include "aurum/model/model_registry.hpp"
#include "aurum/core/error.hpp"
#include "aurum/model/advisory_predictor.hpp"
#include "aurum/model/neural_predictor.hpp"
#include "aurum/model/statistical_predictor.hpp"
#include "aurum/model/tree_predictor.hpp"
#include "aurum/utils/logger.hpp"

#include <simdjson.h>

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace aurum::model {

namespace {

using simdjson::ondemand::array;
using simdjson::ondemand::object;

// ============================================================================
// JSON Helpers
// ============================================================================

double optional_double(object& obj, std::string_view key, double fallback) {
    auto field = obj[key];
    if (field.error() == simdjson::NO_SUCH_FIELD) return fallback;
    return field.get_double().value();
}

std::string optional_string(object& obj, std::string_view key, const std::string& fallback) {
    auto field = obj[key];
    if (field.error() == simdjson::NO_SUCH_FIELD) return fallback;
    return std::string(field.get_string().value());
}

std::vector<double> double_array(array arr) {
    std::vector<double> values;
    for (auto v : arr) {
        values.push_back(v.get_double().value());
    }
    return values;
}

// ============================================================================
// Per-kind Parameter Parsing
// ============================================================================

LogisticParams parse_logistic(object params) {
    LogisticParams p;
    p.weights = double_array(params["weights"].get_array().value());
    p.bias = optional_double(params, "bias", 0.0);
    p.hold_band = optional_double(params, "hold_band", p.hold_band);
    return p;
}

TreeEnsembleParams parse_tree(object params) {
    TreeEnsembleParams p;
    p.learning_rate = optional_double(params, "learning_rate", p.learning_rate);
    p.hold_band = optional_double(params, "hold_band", p.hold_band);
    for (auto s : params["stumps"].get_array()) {
        object node = s.get_object().value();
        Stump stump;
        stump.feature = static_cast<size_t>(node["feature"].get_uint64().value());
        stump.threshold = node["threshold"].get_double().value();
        stump.left = node["left"].get_double().value();
        stump.right = node["right"].get_double().value();
        p.stumps.push_back(stump);
    }
    return p;
}

NeuralParams parse_neural(object params) {
    NeuralParams p;
    p.hold_band = optional_double(params, "hold_band", p.hold_band);
    for (auto l : params["layers"].get_array()) {
        object node = l.get_object().value();
        DenseLayer layer;
        layer.inputs = static_cast<size_t>(node["inputs"].get_uint64().value());
        layer.outputs = static_cast<size_t>(node["outputs"].get_uint64().value());
        layer.weights = double_array(node["weights"].get_array().value());
        layer.bias = double_array(node["bias"].get_array().value());
        p.layers.push_back(std::move(layer));
    }
    return p;
}

AdvisoryParams parse_advisory(object params) {
    AdvisoryParams p;
    p.host = optional_string(params, "host", p.host);
    p.port = optional_string(params, "port", p.port);
    p.target = optional_string(params, "target", p.target);
    return p;
}

// ============================================================================
// Entry Parsing
// ============================================================================

PredictorSpec parse_spec(object& entry) {
    PredictorSpec spec;
    spec.id = std::string(entry["id"].get_string().value());
    spec.kind = std::string(entry["kind"].get_string().value());
    spec.schema_id = optional_string(entry, "schema", features::CORE_V1);
    spec.base_weight = optional_double(entry, "base_weight", 1.0);

    const double timeout_ms = optional_double(entry, "timeout_ms", 50.0);
    if (!(timeout_ms > 0.0)) {
        throw ConfigError("predictor '" + spec.id + "' timeout_ms must be positive");
    }
    spec.timeout = std::chrono::milliseconds(static_cast<int64_t>(timeout_ms));
    if (spec.timeout.count() == 0) {
        spec.timeout = std::chrono::milliseconds(1);
    }

    if (!(spec.base_weight >= 0.0) || !std::isfinite(spec.base_weight)) {
        throw ConfigError("predictor '" + spec.id + "' base_weight must be non-negative");
    }

    auto regimes = entry["regimes"];
    if (regimes.error() != simdjson::NO_SUCH_FIELD) {
        for (auto r : regimes.get_array()) {
            std::string_view name = r.get_string().value();
            auto label = parse_regime(name);
            if (!label) {
                throw ConfigError("predictor '" + spec.id + "' lists unknown regime '" +
                                  std::string(name) + "'");
            }
            spec.regimes.push_back(*label);
        }
    }
    return spec;
}

PredictorPtr make_predictor(PredictorSpec spec, object params, const RegistryOptions& options) {
    if (spec.kind == "statistical") {
        return std::make_shared<StatisticalPredictor>(std::move(spec), parse_logistic(params));
    }
    if (spec.kind == "tree_ensemble") {
        return std::make_shared<TreeEnsemblePredictor>(std::move(spec), parse_tree(params));
    }
    if (spec.kind == "neural") {
        return std::make_shared<NeuralPredictor>(std::move(spec), parse_neural(params));
    }
    if (spec.kind == "advisory") {
        auto advisory = parse_advisory(params);
        if (options.advisory_client) {
            return std::make_shared<AdvisoryPredictor>(std::move(spec), std::move(advisory),
                                                       options.advisory_client);
        }
        return std::make_shared<AdvisoryPredictor>(std::move(spec), std::move(advisory));
    }
    throw ConfigError("predictor '" + spec.id + "' has unknown kind '" + spec.kind + "'");
}

}  // namespace

// ============================================================================
// ModelRegistry
// ============================================================================

PredictorSet ModelRegistry::parse(std::string_view json,
                                  const features::FeatureSchema& schema,
                                  const RegistryOptions& options) {
    PredictorSet predictors;
    std::set<std::string> seen;

    try {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(json);
        auto doc = parser.iterate(padded);

        for (auto e : doc["predictors"].get_array()) {
            object entry = e.get_object().value();
            PredictorSpec spec = parse_spec(entry);

            if (!seen.insert(spec.id).second) {
                throw ConfigError("duplicate predictor id '" + spec.id + "'");
            }

            object params = entry["params"].get_object().value();
            auto predictor = make_predictor(std::move(spec), params, options);
            predictor->validate(schema);
            predictors.push_back(std::move(predictor));
        }
    } catch (const simdjson::simdjson_error& e) {
        throw ConfigError(std::string("malformed model registry: ") + e.what());
    }

    if (predictors.empty()) {
        throw ConfigError("model registry lists no predictors");
    }

    LOG_INFO("Model registry: {} predictors validated against schema {}",
             predictors.size(), schema.id);
    return predictors;
}

PredictorSet ModelRegistry::load(const std::filesystem::path& path,
                                 const features::FeatureSchema& schema,
                                 const RegistryOptions& options) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open model registry " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), schema, options);
}

PredictorSet deterministic_only(const PredictorSet& predictors) {
    PredictorSet out;
    for (const auto& p : predictors) {
        if (p->deterministic()) {
            out.push_back(p);
        }
    }
    return out;
}

}  // namespace aurum::model
