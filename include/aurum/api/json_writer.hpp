#pragma once
// ============================================================================
// AURUM - JSON Writer
// ============================================================================
// Append-style JSON output on top of fmt. Doubles are printed with 17
// significant digits so that parsing them back is exact; non-finite values
// become null
// ============================================================================

#include "aurum/core/types.hpp"

#include <string>
#include <string_view>

namespace aurum::api {

void append_string(std::string& out, std::string_view value);

void append_number(std::string& out, double value);

/// {"instrument":..,"timestamp":..,"direction":..,...} with every field named
void append_signal(std::string& out, const TradeSignal& signal);

[[nodiscard]] std::string signal_to_json(const TradeSignal& signal);

}  // namespace aurum::api
