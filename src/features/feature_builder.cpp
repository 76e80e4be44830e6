// ============================================================================
// AURUM - Feature Builder Implementation
// ============================================================================

#include "aurum/features/feature_builder.hpp"
#include "aurum/core/error.hpp"
#include "aurum/features/indicators.hpp"

#include <cmath>

namespace aurum::features {

namespace {

constexpr size_t BAND_PERIOD = 20;
constexpr size_t VOL_PERIOD = 20;
constexpr size_t RSI_PERIOD = 14;
constexpr size_t MACD_FAST = 12;
constexpr size_t MACD_SLOW = 26;
constexpr size_t MACD_SIGNAL = 9;

const FeatureSchema& core_v1() {
    static const FeatureSchema schema{
        CORE_V1,
        {
            "log_return_1",
            "log_return_5",
            "ema_ratio_12_26",
            "macd_histogram",
            "rsi_14",
            "bollinger_pct_b",
            "bollinger_width",
            "realized_vol_20",
            "relative_spread",
            "volume_z_20",
            "aux_volatility",
        },
        MACD_SLOW + MACD_SIGNAL,
    };
    return schema;
}

double relative_spread(const MarketSnapshot& s, double mid) {
    if (s.bid > 0.0 && s.ask > 0.0) {
        return (s.ask - s.bid) / mid;
    }
    return s.spread / mid;
}

}  // namespace

const FeatureSchema& schema_by_id(const std::string& id) {
    if (id == CORE_V1) return core_v1();
    throw ConfigError("unknown feature schema '" + id + "'");
}

FeatureBuilder::FeatureBuilder(const std::string& schema_id)
    : schema_(&schema_by_id(schema_id)) {}

FeatureVector FeatureBuilder::build(const MarketSnapshot& snapshot,
                                    SnapshotWindow history) const {
    const size_t lookback = schema_->min_lookback;
    if (history.size() < lookback) {
        throw InsufficientHistory(lookback, history.size());
    }

    // Only the trailing window is used so that longer histories give the
    // same vector as the minimum one
    const auto window = history.subspan(history.size() - lookback);

    std::vector<double> mids;
    std::vector<double> volumes;
    mids.reserve(lookback + 1);
    volumes.reserve(lookback + 1);
    for (const auto& s : window) {
        mids.push_back(s.mid());
        volumes.push_back(s.volume);
    }
    mids.push_back(snapshot.mid());
    volumes.push_back(snapshot.volume);

    for (double p : mids) {
        if (!(p > 0.0) || !std::isfinite(p)) {
            throw DataError("non-positive price in feature window for " + snapshot.instrument.str());
        }
    }

    const size_t n = mids.size();
    const double price = mids[n - 1];

    Ema fast(MACD_FAST);
    Ema slow(MACD_SLOW);
    Macd macd(MACD_FAST, MACD_SLOW, MACD_SIGNAL);
    Rsi rsi(RSI_PERIOD);
    Bollinger bands(BAND_PERIOD, 2.0);
    feed(fast, mids);
    feed(slow, mids);
    feed(macd, mids);
    feed(rsi, mids);
    feed(bands, mids);

    RollingWindow returns(VOL_PERIOD);
    for (size_t i = n - VOL_PERIOD; i < n; ++i) {
        returns.push(std::log(mids[i] / mids[i - 1]));
    }

    RollingWindow vols(VOL_PERIOD);
    for (size_t i = n - VOL_PERIOD; i < n; ++i) {
        vols.push(volumes[i]);
    }
    const double vol_sd = vols.std_dev();
    const double volume_z = vol_sd > 0.0 ? (snapshot.volume - vols.mean()) / vol_sd : 0.0;

    FeatureVector fv;
    fv.schema_id = schema_->id;
    fv.as_of = snapshot.timestamp;
    fv.values = {
        std::log(price / mids[n - 2]),
        std::log(price / mids[n - 6]),
        slow.value() != 0.0 ? fast.value() / slow.value() - 1.0 : 0.0,
        macd.histogram() / price,
        rsi.value() / 100.0 - 0.5,
        bands.percent_b() - 0.5,
        bands.band_width(),
        returns.std_dev(),
        relative_spread(snapshot, price),
        volume_z,
        snapshot.volatility,
    };
    return fv;
}

}  // namespace aurum::features
