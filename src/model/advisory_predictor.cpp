// ============================================================================
// AURUM - Advisory Predictor Implementation
// ============================================================================

#include "aurum/model/advisory_predictor.hpp"
#include "aurum/core/error.hpp"

#include <simdjson.h>
#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <iterator>

namespace aurum::model {

AdvisoryPredictor::AdvisoryPredictor(PredictorSpec spec, AdvisoryParams params)
    : AdvisoryPredictor(std::move(spec), params,
                        std::make_shared<network::HttpClient>(
                            network::HttpClientConfig{params.host, params.port, "Aurum/1.0"})) {}

AdvisoryPredictor::AdvisoryPredictor(PredictorSpec spec, AdvisoryParams params,
                                     std::shared_ptr<network::IHttpClient> client)
    : PredictorBase(std::move(spec)), params_(std::move(params)), client_(std::move(client)) {
    if (!client_) {
        throw ConfigError("advisory predictor '" + id() + "' has no transport");
    }
}

std::string AdvisoryPredictor::encode_request(const FeatureVector& features) const {
    std::string body;
    auto out = std::back_inserter(body);
    fmt::format_to(out, R"({{"predictor":"{}","schema":"{}","timestamp":{},"features":[)",
                   id(), features.schema_id, to_epoch_ns(features.as_of));
    for (size_t i = 0; i < features.size(); ++i) {
        fmt::format_to(out, "{}{:.17g}", i == 0 ? "" : ",", features[i]);
    }
    body += "]}";
    return body;
}

ModelPrediction AdvisoryPredictor::decode_response(const FeatureVector& features,
                                                   const std::string& body) const {
    ModelPrediction prediction;
    prediction.predictor_id = id();
    prediction.timestamp = features.as_of;

    try {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(body);
        auto doc = parser.iterate(padded);

        std::string_view direction = doc["direction"].get_string().value();
        double confidence = doc["confidence"].get_double().value();

        auto parsed = parse_direction(direction);
        if (!parsed) {
            throw ModelError("advisory '" + id() + "' returned unknown direction '" +
                             std::string(direction) + "'");
        }
        if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
            throw ModelError("advisory '" + id() + "' returned confidence outside [0, 1]");
        }
        prediction.direction = *parsed;
        prediction.confidence = confidence;
    } catch (const simdjson::simdjson_error& e) {
        throw ModelError("advisory '" + id() + "' returned malformed JSON: " + e.what());
    }
    return prediction;
}

ModelPrediction AdvisoryPredictor::predict(const FeatureVector& features) const {
    check_features(features);

    auto response = client_->post(params_.target, encode_request(features), timeout());
    if (response.timed_out) {
        throw ModelTimeout(id(), timeout());
    }
    if (!response.is_success()) {
        throw ModelError("advisory '" + id() + "' request failed (" +
                         std::to_string(response.status_code) + "): " + response.body);
    }
    return decode_response(features, response.body);
}

}  // namespace aurum::model
