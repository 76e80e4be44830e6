#pragma once
// ============================================================================
// AURUM - Backtest Report
// ============================================================================
// JSON rendering of a BacktestResult and its SHA-256 fingerprint:
//   {"summary": {...}, "instruments": {...}, "events": [{"timestamp", "signal", "pnl"}]}
// The text is a pure function of the result, so equal results give equal
// fingerprints
// ============================================================================

#include "aurum/backtest/replayer.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace aurum::backtest {

[[nodiscard]] std::string summary_json(const BacktestStats& stats);

[[nodiscard]] std::string report_json(const BacktestResult& result);

/// Lowercase hex SHA-256 of `text`
[[nodiscard]] std::string sha256_hex(std::string_view text);

/// sha256_hex(report_json(result))
[[nodiscard]] std::string fingerprint(const BacktestResult& result);

/// Write report_json to `path`; returns the fingerprint of what was written
std::string write_report(const BacktestResult& result, const std::filesystem::path& path);

}  // namespace aurum::backtest
