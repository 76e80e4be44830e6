// ============================================================================
// AURUM - JSON Writer Implementation
// ============================================================================

#include "aurum/api/json_writer.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <iterator>

namespace aurum::api {

void append_string(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    fmt::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<int>(c));
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void append_number(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    fmt::format_to(std::back_inserter(out), "{:.17g}", value);
}

void append_signal(std::string& out, const TradeSignal& s) {
    auto it = std::back_inserter(out);

    out += "{\"instrument\":";
    append_string(out, s.instrument.view());
    fmt::format_to(it, ",\"timestamp\":{},\"direction\":\"{}\",\"size_fraction\":",
                   to_epoch_ns(s.timestamp), to_string(s.direction));
    append_number(out, s.size_fraction);
    out += ",\"confidence\":";
    append_number(out, s.confidence);
    fmt::format_to(it, ",\"proposed_direction\":\"{}\",\"proposed_fraction\":",
                   to_string(s.proposed_direction));
    append_number(out, s.proposed_fraction);
    fmt::format_to(it, ",\"regime\":\"{}\",\"regime_confidence\":", to_string(s.regime));
    append_number(out, s.regime_confidence);
    fmt::format_to(it,
                   ",\"risk_action\":\"{}\",\"risk_reason\":\"{}\",\"degraded\":{},"
                   "\"responded\":{},\"total_predictors\":{}}}",
                   to_string(s.risk_action), to_string(s.risk_reason), s.degraded,
                   s.responded, s.total_predictors);
}

std::string signal_to_json(const TradeSignal& signal) {
    std::string out;
    out.reserve(384);
    append_signal(out, signal);
    return out;
}

}  // namespace aurum::api
