// ============================================================================
// AURUM - Regime Detector Implementation
// ============================================================================

#include "aurum/regime/regime_detector.hpp"
#include "aurum/core/error.hpp"
#include "aurum/features/indicators.hpp"
#include "aurum/utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace aurum::regime {

namespace {

double relative_spread(const MarketSnapshot& s) {
    const double mid = s.mid();
    if (mid <= 0.0) return 0.0;
    if (s.bid > 0.0 && s.ask > 0.0) return (s.ask - s.bid) / mid;
    return s.spread / mid;
}

}  // namespace

void validate(const RegimeConfig& config) {
    if (config.window < 3) {
        throw ConfigError("regime.window must be at least 3");
    }
    if (config.hysteresis < 1) {
        throw ConfigError("regime.hysteresis must be at least 1");
    }
    if (!(config.high_volatility > 0.0) || !(config.trend_threshold > 0.0) ||
        !(config.max_spread > 0.0) || config.min_volume < 0.0) {
        throw ConfigError("regime thresholds must be positive");
    }
}

RegimeDetector::RegimeDetector(RegimeConfig config) : RegimeDetector(config, RegimeState{}) {}

RegimeDetector::RegimeDetector(RegimeConfig config, RegimeState state)
    : config_(config), state_(std::move(state)) {
    validate(config_);
}

void RegimeDetector::reconfigure(const RegimeConfig& config) {
    validate(config);
    config_ = config;
    while (state_.recent.size() > config_.hysteresis) {
        state_.recent.erase(state_.recent.begin());
    }
}

std::optional<RegimeStatistics> RegimeDetector::measure(const MarketSnapshot& snapshot,
                                                        features::SnapshotWindow history) const {
    const size_t prior = config_.window - 1;
    if (history.size() < prior) {
        return std::nullopt;
    }

    const auto tail = history.subspan(history.size() - prior);
    std::vector<const MarketSnapshot*> window;
    window.reserve(config_.window);
    for (const auto& s : tail) {
        window.push_back(&s);
    }
    window.push_back(&snapshot);

    features::RollingWindow returns(window.size() - 1);
    double spread_sum = 0.0;
    double volume_sum = 0.0;
    for (size_t i = 0; i < window.size(); ++i) {
        const auto& s = *window[i];
        spread_sum += relative_spread(s);
        volume_sum += s.volume;
        if (i > 0) {
            const double prev = window[i - 1]->mid();
            const double cur = s.mid();
            if (!(prev > 0.0) || !(cur > 0.0)) {
                throw DataError("non-positive price in regime window for " + snapshot.instrument.str());
            }
            returns.push(std::log(cur / prev));
        }
    }

    RegimeStatistics stats;
    const double n = static_cast<double>(window.size());
    stats.mean_spread = spread_sum / n;
    stats.mean_volume = volume_sum / n;
    stats.volatility = returns.std_dev();

    const double net_move = std::abs(std::log(window.back()->mid() / window.front()->mid()));
    const double steps = static_cast<double>(returns.size());
    if (stats.volatility > 0.0) {
        stats.efficiency = net_move / (stats.volatility * std::sqrt(steps));
    } else {
        // Constant step size: either flat or a perfectly straight drift
        stats.efficiency = net_move > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
    }
    return stats;
}

RegimeLabel RegimeDetector::classify(const RegimeStatistics& stats) const {
    if (stats.mean_spread > config_.max_spread || stats.mean_volume < config_.min_volume) {
        return RegimeLabel::Illiquid;
    }
    if (stats.volatility > config_.high_volatility) {
        return RegimeLabel::HighVolatility;
    }
    if (stats.efficiency > config_.trend_threshold) {
        return RegimeLabel::Trending;
    }
    return RegimeLabel::Ranging;
}

const RegimeState& RegimeDetector::observe(RegimeLabel raw) {
    ++state_.evaluations;

    state_.recent.push_back(raw);
    while (state_.recent.size() > config_.hysteresis) {
        state_.recent.erase(state_.recent.begin());
    }

    if (raw == state_.candidate) {
        ++state_.streak;
    } else {
        state_.candidate = raw;
        state_.streak = 1;
    }

    if (raw != state_.label && state_.streak >= config_.hysteresis) {
        LOG_DEBUG("Regime transition {} -> {} after {} evaluations",
                  to_string(state_.label), to_string(raw), state_.streak);
        state_.label = raw;
        ++state_.transitions;
    }

    const auto agreeing = std::count(state_.recent.begin(), state_.recent.end(), state_.label);
    state_.confidence = state_.label == RegimeLabel::Undetermined
                            ? 0.0
                            : static_cast<double>(agreeing) / static_cast<double>(config_.hysteresis);
    return state_;
}

const RegimeState& RegimeDetector::evaluate(const MarketSnapshot& snapshot,
                                            features::SnapshotWindow history) {
    auto stats = measure(snapshot, history);
    if (!stats) {
        return state_;
    }
    return observe(classify(*stats));
}

}  // namespace aurum::regime
