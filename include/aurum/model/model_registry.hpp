#pragma once
// ============================================================================
// AURUM - Model Registry
// ============================================================================
// Loads the persisted predictor catalog (JSON) and turns it into a validated
// predictor set. Schema-incompatible entries are rejected at load time, never
// coerced
//
// Catalog format:
//   {"predictors": [{"id": "...", "kind": "statistical", "schema": "core.v1",
//                    "base_weight": 1.0, "timeout_ms": 20,
//                    "regimes": ["trending"], "params": {...}}]}
// ============================================================================

#include "aurum/features/feature_builder.hpp"
#include "aurum/model/predictor.hpp"
#include "aurum/network/http_client.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace aurum::model {

struct RegistryOptions {
    /// Transport shared by advisory predictors; a Beast client per entry
    /// is created when empty
    std::shared_ptr<network::IHttpClient> advisory_client;
};

class ModelRegistry {
public:
    /// Parse and validate a catalog. Throws ConfigError for malformed
    /// entries and SchemaMismatch for schema-incompatible ones
    [[nodiscard]] static PredictorSet parse(std::string_view json,
                                            const features::FeatureSchema& schema,
                                            const RegistryOptions& options = {});

    [[nodiscard]] static PredictorSet load(const std::filesystem::path& path,
                                           const features::FeatureSchema& schema,
                                           const RegistryOptions& options = {});
};

/// Subset of predictors whose outputs are reproducible
[[nodiscard]] PredictorSet deterministic_only(const PredictorSet& predictors);

}  // namespace aurum::model
