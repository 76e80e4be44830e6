#pragma once
// ============================================================================
// AURUM - Shared Test Fixtures
// ============================================================================
// Synthetic snapshot series and a scripted predictor
// ============================================================================

#include "aurum/core/error.hpp"
#include "aurum/core/types.hpp"
#include "aurum/model/predictor.hpp"

#include <chrono>
#include <cmath>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace aurum::test_support {

inline constexpr int64_t SECOND_NS = 1'000'000'000;

/// Two-sided book around `mid` with a relative spread of one basis point
inline MarketSnapshot make_snapshot(int64_t ts_ns, double mid,
                                    std::string_view instrument = "XAUUSD",
                                    double volume = 100.0,
                                    double relative_spread = 0.0001) {
    MarketSnapshot s;
    s.timestamp = from_epoch_ns(ts_ns);
    s.instrument = Symbol(instrument);
    const double half = mid * relative_spread / 2.0;
    s.bid = mid - half;
    s.ask = mid + half;
    s.last = mid;
    s.volume = volume;
    s.volatility = 0.001;
    s.spread = s.ask - s.bid;
    return s;
}

/// Geometric drift of `step` per tick, one tick per second
inline std::vector<MarketSnapshot> drifting_series(size_t n, double start, double step,
                                                   std::string_view instrument = "XAUUSD",
                                                   int64_t first_ts = SECOND_NS) {
    std::vector<MarketSnapshot> out;
    out.reserve(n);
    double mid = start;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(make_snapshot(first_ts + static_cast<int64_t>(i) * SECOND_NS, mid, instrument));
        mid *= 1.0 + step;
    }
    return out;
}

/// Mean-reverting wave: no net move over a full period
inline std::vector<MarketSnapshot> wave_series(size_t n, double center, double amplitude,
                                               std::string_view instrument = "XAUUSD",
                                               int64_t first_ts = SECOND_NS) {
    std::vector<MarketSnapshot> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const double phase = static_cast<double>(i) * 0.7;
        const double mid = center * (1.0 + amplitude * std::sin(phase));
        out.push_back(make_snapshot(first_ts + static_cast<int64_t>(i) * SECOND_NS, mid, instrument));
    }
    return out;
}

// ============================================================================
// Scripted Predictor
// ============================================================================

struct Script {
    Direction direction = Direction::Buy;
    double confidence = 0.8;
    bool fail = false;
    bool deterministic = true;
    std::chrono::milliseconds delay{0};
};

class ScriptedPredictor final : public model::PredictorBase {
public:
    ScriptedPredictor(model::PredictorSpec spec, Script script)
        : PredictorBase(std::move(spec)), script_(script) {}

    [[nodiscard]] ModelPrediction predict(const FeatureVector& features) const override {
        check_features(features);
        if (script_.delay.count() > 0) {
            std::this_thread::sleep_for(script_.delay);
        }
        if (script_.fail) {
            throw ModelError("scripted failure in '" + id() + "'");
        }
        ModelPrediction p;
        p.predictor_id = id();
        p.direction = script_.direction;
        p.confidence = script_.confidence;
        p.timestamp = features.as_of;
        return p;
    }

    [[nodiscard]] bool deterministic() const override { return script_.deterministic; }

protected:
    void check_shape(size_t) const override {}

private:
    Script script_;
};

inline model::PredictorPtr scripted(const std::string& id, Script script,
                                    double base_weight = 1.0,
                                    std::vector<RegimeLabel> regimes = {},
                                    std::chrono::milliseconds timeout = std::chrono::milliseconds(50)) {
    model::PredictorSpec spec;
    spec.id = id;
    spec.kind = "scripted";
    spec.base_weight = base_weight;
    spec.regimes = std::move(regimes);
    spec.timeout = timeout;
    return std::make_shared<ScriptedPredictor>(std::move(spec), script);
}

/// Feature vector of the right schema and dimension for core.v1
inline FeatureVector core_vector(std::vector<double> values = std::vector<double>(11, 0.0),
                                 int64_t ts_ns = SECOND_NS) {
    FeatureVector fv;
    fv.schema_id = features::CORE_V1;
    fv.values = std::move(values);
    fv.as_of = from_epoch_ns(ts_ns);
    return fv;
}

}  // namespace aurum::test_support
