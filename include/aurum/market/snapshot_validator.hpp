#pragma once
// ============================================================================
// AURUM - Snapshot Validator
// ============================================================================
// Rejects malformed market data before it reaches the decision path:
// non-finite or non-positive prices, crossed books, negative volume or
// spread, and timestamps that do not increase per instrument
// ============================================================================

#include "aurum/core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace aurum::market {

enum class ValidationMode {
    Strict,   // First bad snapshot throws DataError
    Lenient   // Bad snapshots are dropped with a warning
};

struct ValidationReport {
    size_t accepted = 0;
    size_t rejected = 0;
    std::vector<std::string> problems;  // First few, for diagnostics
};

class SnapshotValidator {
public:
    static constexpr size_t MAX_RECORDED_PROBLEMS = 16;

    explicit SnapshotValidator(ValidationMode mode = ValidationMode::Lenient) : mode_(mode) {}

    /// Content checks only; a description of the first problem found
    [[nodiscard]] static std::optional<std::string> check(const MarketSnapshot& snapshot);

    /// Content and ordering checks. Returns false for a dropped snapshot in
    /// lenient mode; throws DataError in strict mode
    bool accept(const MarketSnapshot& snapshot);

    /// Keep the acceptable snapshots, in order
    [[nodiscard]] std::vector<MarketSnapshot> filter(const std::vector<MarketSnapshot>& snapshots);

    [[nodiscard]] const ValidationReport& report() const { return report_; }
    [[nodiscard]] ValidationMode mode() const { return mode_; }

    /// Forget per-instrument ordering state
    void reset();

private:
    bool reject(const MarketSnapshot& snapshot, const std::string& problem);

    ValidationMode mode_;
    std::unordered_map<Symbol, Timestamp> last_seen_;
    ValidationReport report_;
};

}  // namespace aurum::market
