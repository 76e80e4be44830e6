#pragma once
// ============================================================================
// AURUM - Core Types
// ============================================================================
// Fundamental type definitions shared by the live and backtest paths
// Every record here is a plain value type so that replay can copy it freely
// ============================================================================

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace aurum {

// ============================================================================
// Time Types
// ============================================================================

/// Nanosecond precision timestamp
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Duration in nanoseconds
using Duration = std::chrono::nanoseconds;

/// Get current timestamp with nanosecond precision
[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

/// Convert timestamp to Unix epoch nanoseconds (wire and report format)
[[nodiscard]] inline int64_t to_epoch_ns(Timestamp ts) noexcept {
    return ts.time_since_epoch().count();
}

/// Convert Unix epoch nanoseconds to Timestamp
[[nodiscard]] inline Timestamp from_epoch_ns(int64_t epoch_ns) noexcept {
    return Timestamp{std::chrono::nanoseconds{epoch_ns}};
}

/// Convert timestamp to Unix epoch milliseconds
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// ============================================================================
// Symbol Type
// ============================================================================

/// Instrument identifier (e.g., "XAUUSD")
/// Fixed-size storage keeps MarketSnapshot trivially copyable
class Symbol {
public:
    static constexpr size_t MAX_LENGTH = 15;

    Symbol() noexcept : length_(0) { data_[0] = '\0'; }

    explicit Symbol(std::string_view symbol) noexcept {
        length_ = static_cast<uint8_t>(std::min(symbol.size(), MAX_LENGTH));
        std::copy_n(symbol.data(), length_, data_);
        data_[length_] = '\0';
    }

    [[nodiscard]] std::string_view view() const noexcept { return {data_, length_}; }
    [[nodiscard]] std::string str() const { return std::string(view()); }
    [[nodiscard]] size_t size() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    bool operator==(const Symbol& other) const noexcept { return view() == other.view(); }
    bool operator<(const Symbol& other) const noexcept { return view() < other.view(); }

private:
    char data_[MAX_LENGTH + 1];
    uint8_t length_;
};

// ============================================================================
// Direction
// ============================================================================

/// Directional call; the underlying value is the numeric sign used in blending
enum class Direction : int8_t {
    Sell = -1,
    Hold = 0,
    Buy = 1
};

[[nodiscard]] constexpr int sign_of(Direction d) noexcept { return static_cast<int>(d); }

[[nodiscard]] constexpr Direction direction_from_sign(double value) noexcept {
    if (value > 0.0) return Direction::Buy;
    if (value < 0.0) return Direction::Sell;
    return Direction::Hold;
}

[[nodiscard]] constexpr std::string_view to_string(Direction d) noexcept {
    switch (d) {
        case Direction::Buy:  return "buy";
        case Direction::Sell: return "sell";
        case Direction::Hold: return "hold";
    }
    return "hold";
}

[[nodiscard]] inline std::optional<Direction> parse_direction(std::string_view s) noexcept {
    if (s == "buy") return Direction::Buy;
    if (s == "sell") return Direction::Sell;
    if (s == "hold") return Direction::Hold;
    return std::nullopt;
}

// ============================================================================
// Regime Labels
// ============================================================================

enum class RegimeLabel : uint8_t {
    Undetermined = 0,
    Trending = 1,
    Ranging = 2,
    HighVolatility = 3,
    Illiquid = 4
};

inline constexpr size_t REGIME_COUNT = 5;

[[nodiscard]] constexpr size_t regime_index(RegimeLabel r) noexcept {
    return static_cast<size_t>(r);
}

[[nodiscard]] constexpr std::string_view to_string(RegimeLabel r) noexcept {
    switch (r) {
        case RegimeLabel::Undetermined:   return "undetermined";
        case RegimeLabel::Trending:       return "trending";
        case RegimeLabel::Ranging:        return "ranging";
        case RegimeLabel::HighVolatility: return "high_volatility";
        case RegimeLabel::Illiquid:       return "illiquid";
    }
    return "undetermined";
}

[[nodiscard]] inline std::optional<RegimeLabel> parse_regime(std::string_view s) noexcept {
    if (s == "undetermined") return RegimeLabel::Undetermined;
    if (s == "trending") return RegimeLabel::Trending;
    if (s == "ranging") return RegimeLabel::Ranging;
    if (s == "high_volatility") return RegimeLabel::HighVolatility;
    if (s == "illiquid") return RegimeLabel::Illiquid;
    return std::nullopt;
}

// ============================================================================
// Market Data
// ============================================================================

/// Top-of-book snapshot with auxiliary indicators
struct MarketSnapshot {
    Timestamp timestamp{};
    Symbol instrument;
    double bid = 0.0;
    double ask = 0.0;
    double last = 0.0;
    double volume = 0.0;
    double volatility = 0.0;  // Feed-supplied volatility indicator
    double spread = 0.0;      // Feed-supplied spread indicator

    [[nodiscard]] double mid() const noexcept {
        if (bid > 0.0 && ask > 0.0) return (bid + ask) / 2.0;
        return last;
    }
};
static_assert(std::is_trivially_copyable_v<MarketSnapshot>,
              "MarketSnapshot must stay trivially copyable");

// ============================================================================
// Model I/O
// ============================================================================

/// Fixed-length feature vector tagged with the schema it was built for
struct FeatureVector {
    std::string schema_id;
    std::vector<double> values;
    Timestamp as_of{};  // Timestamp of the snapshot the vector describes

    [[nodiscard]] size_t size() const noexcept { return values.size(); }
    [[nodiscard]] double operator[](size_t i) const { return values[i]; }
};

/// Output of a single predictor
struct ModelPrediction {
    std::string predictor_id;
    Direction direction = Direction::Hold;
    double confidence = 0.0;  // [0, 1]
    Timestamp timestamp{};
};

[[nodiscard]] inline double clamp_confidence(double c) noexcept {
    if (!std::isfinite(c)) return 0.0;
    return std::clamp(c, 0.0, 1.0);
}

// ============================================================================
// Trade Signal
// ============================================================================

enum class RiskAction : uint8_t {
    Pass = 0,
    Scaled = 1,
    Veto = 2
};

enum class RiskReason : uint8_t {
    None = 0,
    InstrumentLimit = 1,
    ExposureLimit = 2,
    DrawdownBreaker = 3
};

[[nodiscard]] constexpr std::string_view to_string(RiskAction a) noexcept {
    switch (a) {
        case RiskAction::Pass:   return "pass";
        case RiskAction::Scaled: return "scaled";
        case RiskAction::Veto:   return "veto";
    }
    return "pass";
}

[[nodiscard]] constexpr std::string_view to_string(RiskReason r) noexcept {
    switch (r) {
        case RiskReason::None:            return "none";
        case RiskReason::InstrumentLimit: return "instrument_limit";
        case RiskReason::ExposureLimit:   return "exposure_limit";
        case RiskReason::DrawdownBreaker: return "drawdown_breaker";
    }
    return "none";
}

/// Final output of one decision cycle
struct TradeSignal {
    Symbol instrument;
    Timestamp timestamp{};
    Direction direction = Direction::Hold;
    double size_fraction = 0.0;         // [0, 1] of max position size
    double confidence = 0.0;            // Blended confidence, kept through vetoes

    // Audit context
    Direction proposed_direction = Direction::Hold;
    double proposed_fraction = 0.0;
    RegimeLabel regime = RegimeLabel::Undetermined;
    double regime_confidence = 0.0;
    RiskAction risk_action = RiskAction::Pass;
    RiskReason risk_reason = RiskReason::None;
    bool degraded = false;
    uint32_t responded = 0;
    uint32_t total_predictors = 0;

    [[nodiscard]] bool is_veto() const noexcept { return risk_action == RiskAction::Veto; }

    bool operator==(const TradeSignal&) const = default;
};

}  // namespace aurum

// ============================================================================
// Hash specializations for use with containers
// ============================================================================
template <>
struct std::hash<aurum::Symbol> {
    size_t operator()(const aurum::Symbol& s) const noexcept {
        return std::hash<std::string_view>{}(s.view());
    }
};
