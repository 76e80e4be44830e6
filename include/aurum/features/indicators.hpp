#pragma once
// ============================================================================
// AURUM - Streaming Indicators
// ============================================================================
// Incremental indicators used by the Feature Builder and Regime Detector
// Periods are runtime values so that feature schemas can be configured
// ============================================================================

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <vector>

namespace aurum::features {

// ============================================================================
// Indicator Concept
// ============================================================================

template <typename T>
concept Indicator = requires(T indicator, double value) {
    { indicator.update(value) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
    { indicator.reset() } -> std::same_as<void>;
};

/// Feed a sequence into an indicator in order
template <Indicator I, typename Range>
void feed(I& indicator, const Range& values) {
    for (double v : values) {
        indicator.update(v);
    }
}

// ============================================================================
// Rolling Window
// ============================================================================

/// Fixed-capacity circular window; index 0 is the most recent value
class RollingWindow {
public:
    explicit RollingWindow(size_t capacity)
        : buffer_(std::max<size_t>(capacity, 1), 0.0), size_(0), index_(0) {}

    void push(double value) {
        buffer_[index_] = value;
        index_ = (index_ + 1) % buffer_.size();
        if (size_ < buffer_.size()) {
            ++size_;
        }
    }

    [[nodiscard]] double operator[](size_t i) const {
        if (i >= size_) return 0.0;
        const size_t cap = buffer_.size();
        return buffer_[(index_ + cap - 1 - i) % cap];
    }

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] size_t capacity() const { return buffer_.size(); }
    [[nodiscard]] bool is_full() const { return size_ == buffer_.size(); }

    void reset() {
        size_ = 0;
        index_ = 0;
    }

    /// Sum in insertion order (oldest first) so results do not depend on
    /// where the circular cursor happens to sit
    [[nodiscard]] double sum() const {
        double s = 0.0;
        for (size_t i = size_; i-- > 0;) {
            s += (*this)[i];
        }
        return s;
    }

    [[nodiscard]] double mean() const {
        if (size_ == 0) return 0.0;
        return sum() / static_cast<double>(size_);
    }

    /// Population standard deviation
    [[nodiscard]] double std_dev() const {
        if (size_ < 2) return 0.0;
        const double m = mean();
        double variance = 0.0;
        for (size_t i = size_; i-- > 0;) {
            const double diff = (*this)[i] - m;
            variance += diff * diff;
        }
        return std::sqrt(variance / static_cast<double>(size_));
    }

private:
    std::vector<double> buffer_;
    size_t size_;
    size_t index_;
};

// ============================================================================
// EMA (SMA-seeded)
// ============================================================================

class Ema {
public:
    explicit Ema(size_t period)
        : period_(std::max<size_t>(period, 1)),
          multiplier_(2.0 / (static_cast<double>(period_) + 1.0)) {
        reset();
    }

    void update(double price) {
        if (count_ < period_) {
            sum_ += price;
            ema_ = sum_ / static_cast<double>(count_ + 1);
        } else {
            ema_ = (price - ema_) * multiplier_ + ema_;
        }
        ++count_;
    }

    [[nodiscard]] double value() const { return ema_; }
    [[nodiscard]] bool is_ready() const { return count_ >= period_; }
    [[nodiscard]] size_t period() const { return period_; }

    void reset() {
        count_ = 0;
        ema_ = 0.0;
        sum_ = 0.0;
    }

private:
    size_t period_;
    double multiplier_;
    size_t count_;
    double ema_;
    double sum_;
};

// ============================================================================
// RSI (Wilder's smoothing)
// ============================================================================

class Rsi {
public:
    explicit Rsi(size_t period = 14) : period_(std::max<size_t>(period, 1)) { reset(); }

    void update(double price) {
        if (count_ == 0) {
            prev_price_ = price;
            ++count_;
            return;
        }

        const double change = price - prev_price_;
        prev_price_ = price;
        ++count_;

        const double gain = std::max(change, 0.0);
        const double loss = std::max(-change, 0.0);
        const double n = static_cast<double>(period_);

        // count_ - 1 changes seen so far; seed with the first `period_`
        if (count_ <= period_ + 1) {
            gain_sum_ += gain;
            loss_sum_ += loss;
            if (count_ == period_ + 1) {
                avg_gain_ = gain_sum_ / n;
                avg_loss_ = loss_sum_ / n;
            }
        } else {
            avg_gain_ = (avg_gain_ * (n - 1.0) + gain) / n;
            avg_loss_ = (avg_loss_ * (n - 1.0) + loss) / n;
        }
    }

    /// 0-100; neutral 50 until ready
    [[nodiscard]] double value() const {
        if (!is_ready()) return 50.0;
        if (avg_loss_ == 0.0) return avg_gain_ == 0.0 ? 50.0 : 100.0;
        const double rs = avg_gain_ / avg_loss_;
        return 100.0 - (100.0 / (1.0 + rs));
    }

    [[nodiscard]] bool is_ready() const { return count_ > period_; }

    void reset() {
        count_ = 0;
        prev_price_ = 0.0;
        gain_sum_ = 0.0;
        loss_sum_ = 0.0;
        avg_gain_ = 0.0;
        avg_loss_ = 0.0;
    }

private:
    size_t period_;
    size_t count_;
    double prev_price_;
    double gain_sum_;
    double loss_sum_;
    double avg_gain_;
    double avg_loss_;
};

// ============================================================================
// MACD
// ============================================================================

class Macd {
public:
    Macd(size_t fast = 12, size_t slow = 26, size_t signal = 9)
        : fast_(fast), slow_(slow), signal_(signal), slow_period_(slow), signal_period_(signal) {
        reset();
    }

    void update(double price) {
        fast_.update(price);
        slow_.update(price);
        ++count_;

        if (count_ >= slow_period_) {
            macd_line_ = fast_.value() - slow_.value();
            signal_.update(macd_line_);
            histogram_ = macd_line_ - signal_.value();
        }
    }

    [[nodiscard]] double value() const { return macd_line_; }
    [[nodiscard]] double signal_line() const { return signal_.value(); }
    [[nodiscard]] double histogram() const { return histogram_; }
    [[nodiscard]] bool is_ready() const { return count_ >= slow_period_ + signal_period_; }
    [[nodiscard]] size_t lookback() const { return slow_period_ + signal_period_; }

    void reset() {
        count_ = 0;
        macd_line_ = 0.0;
        histogram_ = 0.0;
        fast_.reset();
        slow_.reset();
        signal_.reset();
    }

private:
    Ema fast_;
    Ema slow_;
    Ema signal_;
    size_t slow_period_;
    size_t signal_period_;
    size_t count_;
    double macd_line_;
    double histogram_;
};

// ============================================================================
// Bollinger Bands
// ============================================================================

class Bollinger {
public:
    explicit Bollinger(size_t period = 20, double width = 2.0)
        : window_(period), period_(std::max<size_t>(period, 1)), width_(width) {
        reset();
    }

    void update(double price) {
        window_.push(price);
        latest_ = price;
        ++count_;

        if (count_ >= period_) {
            middle_ = window_.mean();
            const double sd = window_.std_dev();
            upper_ = middle_ + width_ * sd;
            lower_ = middle_ - width_ * sd;
        }
    }

    /// Middle band (SMA)
    [[nodiscard]] double value() const { return middle_; }
    [[nodiscard]] double upper_band() const { return upper_; }
    [[nodiscard]] double lower_band() const { return lower_; }

    [[nodiscard]] double band_width() const {
        if (middle_ == 0.0) return 0.0;
        return (upper_ - lower_) / middle_;
    }

    /// 0 = lower band, 0.5 = middle, 1 = upper band
    [[nodiscard]] double percent_b() const {
        if (upper_ == lower_) return 0.5;
        return (latest_ - lower_) / (upper_ - lower_);
    }

    [[nodiscard]] bool is_ready() const { return count_ >= period_; }

    void reset() {
        window_.reset();
        count_ = 0;
        middle_ = 0.0;
        upper_ = 0.0;
        lower_ = 0.0;
        latest_ = 0.0;
    }

private:
    RollingWindow window_;
    size_t period_;
    double width_;
    size_t count_;
    double middle_;
    double upper_;
    double lower_;
    double latest_;
};

static_assert(Indicator<Ema>);
static_assert(Indicator<Rsi>);
static_assert(Indicator<Macd>);
static_assert(Indicator<Bollinger>);

}  // namespace aurum::features
