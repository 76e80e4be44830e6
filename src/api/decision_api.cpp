// ============================================================================
// AURUM - Decision API Implementation
// ============================================================================

#include "aurum/api/decision_api.hpp"
#include "aurum/api/json_writer.hpp"
#include "aurum/core/error.hpp"
#include "aurum/market/snapshot_validator.hpp"
#include "aurum/utils/logger.hpp"

#include <simdjson.h>
#include <spdlog/fmt/fmt.h>

#include <iterator>
#include <optional>

namespace aurum::api {

namespace {

using simdjson::ondemand::object;

double optional_double(object& obj, std::string_view key) {
    auto field = obj[key];
    if (field.error() == simdjson::NO_SUCH_FIELD) return 0.0;
    return field.get_double().value();
}

void append_header(std::string& out, const Symbol& instrument, Timestamp timestamp) {
    out += "{\"instrument\":";
    append_string(out, instrument.view());
    fmt::format_to(std::back_inserter(out), ",\"timestamp\":{}", to_epoch_ns(timestamp));
}

}  // namespace

// ============================================================================
// Request Parsing
// ============================================================================

DecisionRequest parse_request(std::string_view json) {
    DecisionRequest request;
    std::optional<int64_t> requested_ts;

    try {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(json);
        auto doc = parser.iterate(padded);
        object root = doc.get_object().value();

        auto command = root["command"];
        if (command.error() != simdjson::NO_SUCH_FIELD) {
            std::string_view name = command.get_string().value();
            if (name != "status") {
                throw DataError("unknown command '" + std::string(name) + "'");
            }
            request.status_query = true;
            return request;
        }

        std::string_view instrument = root["instrument"].get_string().value();
        if (instrument.empty() || instrument.size() > Symbol::MAX_LENGTH) {
            throw DataError("bad instrument '" + std::string(instrument) + "'");
        }
        request.instrument = Symbol(instrument);

        auto ts = root["timestamp"];
        if (ts.error() != simdjson::NO_SUCH_FIELD) {
            requested_ts = ts.get_int64().value();
        }

        for (auto item : root["snapshots"].get_array()) {
            object snap = item.get_object().value();
            MarketSnapshot s;
            s.instrument = request.instrument;
            s.timestamp = from_epoch_ns(snap["timestamp"].get_int64().value());
            s.bid = snap["bid"].get_double().value();
            s.ask = snap["ask"].get_double().value();
            s.last = snap["last"].get_double().value();
            s.volume = optional_double(snap, "volume");
            s.volatility = optional_double(snap, "volatility");
            s.spread = optional_double(snap, "spread");
            request.snapshots.push_back(s);
        }
    } catch (const simdjson::simdjson_error& e) {
        throw DataError(std::string("malformed request: ") + e.what());
    }

    if (request.snapshots.empty()) {
        throw DataError("request carries no snapshots");
    }

    market::SnapshotValidator validator(market::ValidationMode::Strict);
    for (const auto& s : request.snapshots) {
        validator.accept(s);
    }

    request.timestamp = request.current().timestamp;
    if (requested_ts && *requested_ts != to_epoch_ns(request.timestamp)) {
        throw DataError("request timestamp does not match its last snapshot");
    }
    return request;
}

// ============================================================================
// Responses
// ============================================================================

std::string decision_json(const TradeSignal& signal) {
    std::string out;
    out.reserve(448);
    append_header(out, signal.instrument, signal.timestamp);
    out += ",\"decision\":";
    append_signal(out, signal);
    out += '}';
    return out;
}

std::string error_json(const Symbol& instrument, Timestamp timestamp, std::string_view kind) {
    std::string out;
    append_header(out, instrument, timestamp);
    out += ",\"decision\":null,\"error\":";
    append_string(out, kind);
    out += '}';
    return out;
}

std::string status_json(const std::vector<engine::InstrumentStatus>& status,
                        double gross_exposure) {
    std::string out = "{\"status\":[";
    auto it = std::back_inserter(out);
    for (size_t i = 0; i < status.size(); ++i) {
        const auto& s = status[i];
        if (i > 0) out += ',';
        out += "{\"instrument\":";
        append_string(out, s.instrument.view());
        fmt::format_to(it,
                       ",\"ticks\":{},\"decisions\":{},\"skipped\":{},\"missed\":{},"
                       "\"degraded\":{},\"vetoes\":{},\"scaled\":{},\"regime\":\"{}\","
                       "\"regime_confidence\":",
                       s.stats.ticks, s.stats.decisions, s.stats.skipped, s.stats.missed,
                       s.stats.degraded, s.stats.vetoes, s.stats.scaled, to_string(s.regime));
        append_number(out, s.regime_confidence);
        out += ",\"equity\":";
        append_number(out, s.equity);
        out += ",\"drawdown\":";
        append_number(out, s.drawdown);
        out += ",\"position\":";
        append_number(out, s.position);
        fmt::format_to(it, ",\"history\":{}}}", s.history);
    }
    out += "],\"gross_exposure\":";
    append_number(out, gross_exposure);
    out += '}';
    return out;
}

std::string error_kind(const std::exception& e) {
    if (dynamic_cast<const InsufficientHistory*>(&e)) return "InsufficientHistory";
    if (dynamic_cast<const CycleDeadlineExceeded*>(&e)) return "CycleDeadlineExceeded";
    if (dynamic_cast<const DataError*>(&e)) return "DataError";
    if (dynamic_cast<const SchemaMismatch*>(&e)) return "SchemaMismatch";
    if (dynamic_cast<const ModelTimeout*>(&e)) return "ModelTimeout";
    if (dynamic_cast<const ModelError*>(&e)) return "ModelError";
    if (dynamic_cast<const ConfigError*>(&e)) return "ConfigError";
    if (dynamic_cast<const ReplayDivergence*>(&e)) return "ReplayDivergence";
    return "Error";
}

// ============================================================================
// DecisionApi
// ============================================================================

std::string DecisionApi::handle(std::string_view line) {
    DecisionRequest request;
    try {
        request = parse_request(line);
    } catch (const Error& e) {
        LOG_WARN("Rejected request: {}", e.what());
        return error_json(Symbol{}, Timestamp{}, error_kind(e));
    }

    if (request.status_query) {
        return status_json(engine_.status(), engine_.gross_exposure());
    }

    try {
        std::vector<MarketSnapshot> context(request.snapshots.begin(), request.snapshots.end() - 1);
        auto result = engine_.submit(request.current(), std::move(context)).get();
        if (!result.decided()) {
            return error_json(request.instrument, request.timestamp, result.skip_reason);
        }
        return decision_json(result.decision->signal);
    } catch (const Error& e) {
        return error_json(request.instrument, request.timestamp, error_kind(e));
    }
}

}  // namespace aurum::api
