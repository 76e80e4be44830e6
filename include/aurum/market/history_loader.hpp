#pragma once
// ============================================================================
// AURUM - Historical Data Loader
// ============================================================================
// Reads recorded snapshots from CSV:
//   timestamp_ns,instrument,bid,ask,last,volume,volatility,spread
// Header line optional, '#' comments and blank lines skipped
// ============================================================================

#include "aurum/core/types.hpp"
#include "aurum/market/snapshot_validator.hpp"

#include <filesystem>
#include <istream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace aurum::market {

struct HistoricalData {
    /// Per-instrument series, each sorted by timestamp (stable)
    std::map<Symbol, std::vector<MarketSnapshot>> series;
    size_t rows = 0;
    ValidationReport validation;

    [[nodiscard]] size_t snapshot_count() const;
};

/// Parse one CSV data row; throws DataError on malformed input
[[nodiscard]] MarketSnapshot parse_csv_row(std::string_view line);

/// Parse all rows in file order (no sorting, no validation)
[[nodiscard]] std::vector<MarketSnapshot> read_csv(std::istream& in);

/// Group by instrument, stable-sort by timestamp
[[nodiscard]] std::map<Symbol, std::vector<MarketSnapshot>>
group_by_instrument(const std::vector<MarketSnapshot>& snapshots);

/// Read, group, sort and validate
[[nodiscard]] HistoricalData load_history(const std::filesystem::path& path,
                                          ValidationMode mode = ValidationMode::Lenient);

[[nodiscard]] HistoricalData load_history(std::istream& in,
                                          ValidationMode mode = ValidationMode::Lenient);

}  // namespace aurum::market
