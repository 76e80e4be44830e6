#pragma once
// ============================================================================
// AURUM - Feature Builder
// ============================================================================
// Turns a snapshot plus its history window into the fixed-shape vector the
// predictors were configured for. Pure function of its inputs: the same
// snapshot and window always produce a bit-identical vector
// ============================================================================

#include "aurum/core/types.hpp"

#include <span>
#include <string>
#include <vector>

namespace aurum::features {

/// Ordered prior snapshots, oldest first, not including the current one
using SnapshotWindow = std::span<const MarketSnapshot>;

struct FeatureSchema {
    std::string id;
    std::vector<std::string> names;
    size_t min_lookback = 0;

    [[nodiscard]] size_t dimension() const { return names.size(); }
};

inline constexpr const char* CORE_V1 = "core.v1";

/// Look up a built-in schema; throws ConfigError for unknown ids
[[nodiscard]] const FeatureSchema& schema_by_id(const std::string& id);

class FeatureBuilder {
public:
    explicit FeatureBuilder(const std::string& schema_id = CORE_V1);

    /// Build the vector for `snapshot` using the trailing min_lookback()
    /// entries of `history`. Throws InsufficientHistory when the window is
    /// shorter, DataError on non-positive prices
    [[nodiscard]] FeatureVector build(const MarketSnapshot& snapshot,
                                      SnapshotWindow history) const;

    [[nodiscard]] const FeatureSchema& schema() const { return *schema_; }
    [[nodiscard]] const std::string& schema_id() const { return schema_->id; }
    [[nodiscard]] size_t min_lookback() const { return schema_->min_lookback; }
    [[nodiscard]] size_t dimension() const { return schema_->dimension(); }

private:
    const FeatureSchema* schema_;
};

}  // namespace aurum::features
