#pragma once
// ============================================================================
// AURUM - Advisory Predictor
// ============================================================================
// External advisory service (e.g. an LLM behind an HTTP endpoint) wrapped as
// one more predictor. The feature vector is POSTed as JSON; the service
// answers {"direction": "buy|sell|hold", "confidence": x}
// Unavailability surfaces as ModelError and degrades the ensemble
// ============================================================================

#include "aurum/model/predictor.hpp"
#include "aurum/network/http_client.hpp"

#include <memory>
#include <string>

namespace aurum::model {

struct AdvisoryParams {
    std::string host = "127.0.0.1";
    std::string port = "8080";
    std::string target = "/advise";
};

class AdvisoryPredictor final : public PredictorBase {
public:
    /// Uses a Beast client built from params
    AdvisoryPredictor(PredictorSpec spec, AdvisoryParams params);

    /// Uses the supplied transport (tests inject a fake here)
    AdvisoryPredictor(PredictorSpec spec, AdvisoryParams params,
                      std::shared_ptr<network::IHttpClient> client);

    [[nodiscard]] ModelPrediction predict(const FeatureVector& features) const override;

    [[nodiscard]] bool deterministic() const override { return false; }

    /// Request body sent to the service
    [[nodiscard]] std::string encode_request(const FeatureVector& features) const;

    /// Parse a service reply; throws ModelError when malformed
    [[nodiscard]] ModelPrediction decode_response(const FeatureVector& features,
                                                  const std::string& body) const;

protected:
    void check_shape(size_t) const override {}

private:
    AdvisoryParams params_;
    std::shared_ptr<network::IHttpClient> client_;
};

}  // namespace aurum::model
