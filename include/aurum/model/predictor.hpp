#pragma once
// ============================================================================
// AURUM - Predictor Interface
// ============================================================================
// One capability shared by every model family: predict() from a feature
// vector, plus the schema, latency budget and regimes it was validated for.
// New model families plug in here without touching the aggregator
// ============================================================================

#include "aurum/core/types.hpp"
#include "aurum/features/feature_builder.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace aurum::model {

// ============================================================================
// Predictor Specification (one model registry entry)
// ============================================================================

struct PredictorSpec {
    std::string id;
    std::string kind;
    std::string schema_id = features::CORE_V1;
    double base_weight = 1.0;
    std::chrono::milliseconds timeout{50};
    std::vector<RegimeLabel> regimes;  // Empty: validated for every regime
};

// ============================================================================
// Predictor Interface
// ============================================================================

class IPredictor {
public:
    virtual ~IPredictor() = default;

    [[nodiscard]] virtual const PredictorSpec& spec() const = 0;

    /// Produce a prediction. Throws SchemaMismatch for a foreign vector and
    /// ModelError on internal failure. Must be safe to call concurrently
    [[nodiscard]] virtual ModelPrediction predict(const FeatureVector& features) const = 0;

    /// Startup validation against the configured feature schema
    virtual void validate(const features::FeatureSchema& schema) const = 0;

    /// Identical inputs always give identical outputs
    [[nodiscard]] virtual bool deterministic() const { return true; }

    [[nodiscard]] const std::string& id() const { return spec().id; }
    [[nodiscard]] const std::string& schema_id() const { return spec().schema_id; }
    [[nodiscard]] std::chrono::milliseconds timeout() const { return spec().timeout; }
    [[nodiscard]] double base_weight() const { return spec().base_weight; }
    [[nodiscard]] const std::vector<RegimeLabel>& validated_regimes() const { return spec().regimes; }

    [[nodiscard]] bool validated_for(RegimeLabel regime) const {
        const auto& regimes = spec().regimes;
        if (regimes.empty()) return true;
        return std::find(regimes.begin(), regimes.end(), regime) != regimes.end();
    }
};

using PredictorPtr = std::shared_ptr<const IPredictor>;
using PredictorSet = std::vector<PredictorPtr>;

// ============================================================================
// Common Base
// ============================================================================

class PredictorBase : public IPredictor {
public:
    explicit PredictorBase(PredictorSpec spec) : spec_(std::move(spec)) {}

    [[nodiscard]] const PredictorSpec& spec() const override { return spec_; }

    /// Checks the schema id, then the parameter shapes against its dimension
    void validate(const features::FeatureSchema& schema) const override;

protected:
    /// Throws SchemaMismatch unless the vector matches this predictor
    void check_features(const FeatureVector& features) const;

    /// Throws SchemaMismatch if the model parameters cannot consume
    /// vectors of the given dimension
    virtual void check_shape(size_t dimension) const = 0;

    /// Map a signed score to a prediction, holding inside +/- hold_band
    [[nodiscard]] ModelPrediction from_score(const FeatureVector& features,
                                             double score,
                                             double hold_band,
                                             double confidence) const;

private:
    PredictorSpec spec_;
};

}  // namespace aurum::model
