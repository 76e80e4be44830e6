#pragma once
// ============================================================================
// AURUM - Decision API
// ============================================================================
// JSON request/response surface of the live engine, one document per line
//
// Request:
//   {"instrument": "XAUUSD", "timestamp": <ns>,
//    "snapshots": [{"timestamp", "bid", "ask", "last", "volume",
//                   "volatility", "spread"}, ...]}
//   Oldest first; the last snapshot is the one to decide on
//   {"command": "status"} returns per-instrument engine status
//
// Response:
//   {"instrument": ..., "timestamp": ..., "decision": {<TradeSignal>}}
//   {"instrument": ..., "timestamp": ..., "decision": null, "error": "<kind>"}
// ============================================================================

#include "aurum/core/types.hpp"
#include "aurum/engine/live_engine.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace aurum::api {

struct DecisionRequest {
    Symbol instrument;
    Timestamp timestamp{};
    std::vector<MarketSnapshot> snapshots;  // Oldest first, never empty
    bool status_query = false;

    [[nodiscard]] const MarketSnapshot& current() const { return snapshots.back(); }
};

/// Throws DataError for malformed requests
[[nodiscard]] DecisionRequest parse_request(std::string_view json);

[[nodiscard]] std::string decision_json(const TradeSignal& signal);

[[nodiscard]] std::string error_json(const Symbol& instrument, Timestamp timestamp,
                                     std::string_view kind);

[[nodiscard]] std::string status_json(const std::vector<engine::InstrumentStatus>& status,
                                      double gross_exposure);

/// Taxonomy name of an exception ("InsufficientHistory", "DataError", ...)
[[nodiscard]] std::string error_kind(const std::exception& e);

class DecisionApi {
public:
    explicit DecisionApi(engine::LiveEngine& engine) : engine_(engine) {}

    /// Answer one request line. Failures are reported in the response
    [[nodiscard]] std::string handle(std::string_view line);

private:
    engine::LiveEngine& engine_;
};

}  // namespace aurum::api
