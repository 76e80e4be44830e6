// ============================================================================
// AURUM - Snapshot Validator Implementation
// ============================================================================

#include "aurum/market/snapshot_validator.hpp"
#include "aurum/core/error.hpp"
#include "aurum/utils/logger.hpp"

#include <cmath>

namespace aurum::market {

std::optional<std::string> SnapshotValidator::check(const MarketSnapshot& s) {
    if (s.instrument.empty()) {
        return "missing instrument";
    }
    for (double v : {s.bid, s.ask, s.last, s.volume, s.volatility, s.spread}) {
        if (!std::isfinite(v)) return "non-finite field";
    }
    if (s.bid < 0.0 || s.ask < 0.0 || s.last < 0.0) {
        return "negative price";
    }
    if (!(s.mid() > 0.0)) {
        return "no positive price";
    }
    if (s.bid > 0.0 && s.ask > 0.0 && s.bid > s.ask) {
        return "crossed book";
    }
    if (s.volume < 0.0) {
        return "negative volume";
    }
    if (s.spread < 0.0 || s.volatility < 0.0) {
        return "negative indicator";
    }
    return std::nullopt;
}

bool SnapshotValidator::reject(const MarketSnapshot& snapshot, const std::string& problem) {
    const std::string message = snapshot.instrument.str() + " @" +
                                std::to_string(to_epoch_ns(snapshot.timestamp)) + ": " + problem;
    if (mode_ == ValidationMode::Strict) {
        throw DataError("invalid snapshot " + message);
    }

    ++report_.rejected;
    if (report_.problems.size() < MAX_RECORDED_PROBLEMS) {
        report_.problems.push_back(message);
    }
    LOG_WARN("Dropping snapshot {}", message);
    return false;
}

bool SnapshotValidator::accept(const MarketSnapshot& snapshot) {
    if (auto problem = check(snapshot)) {
        return reject(snapshot, *problem);
    }

    auto it = last_seen_.find(snapshot.instrument);
    if (it != last_seen_.end() && snapshot.timestamp <= it->second) {
        return reject(snapshot, "timestamp not increasing");
    }

    last_seen_[snapshot.instrument] = snapshot.timestamp;
    ++report_.accepted;
    return true;
}

std::vector<MarketSnapshot> SnapshotValidator::filter(const std::vector<MarketSnapshot>& snapshots) {
    std::vector<MarketSnapshot> out;
    out.reserve(snapshots.size());
    for (const auto& s : snapshots) {
        if (accept(s)) {
            out.push_back(s);
        }
    }
    return out;
}

void SnapshotValidator::reset() {
    last_seen_.clear();
    report_ = ValidationReport{};
}

}  // namespace aurum::market
