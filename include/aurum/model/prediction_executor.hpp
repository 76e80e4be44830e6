#pragma once
// ============================================================================
// AURUM - Prediction Executor
// ============================================================================
// Runs every predictor of a cycle and collects one outcome per predictor, in
// predictor order. Failures and timeouts become outcomes, never exceptions;
// the only exception is the live per-cycle deadline
// ============================================================================

#include "aurum/core/types.hpp"
#include "aurum/model/predictor.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aurum::model {

// ============================================================================
// Outcome
// ============================================================================

struct PredictorOutcome {
    enum class Status : uint8_t {
        Ok,
        Timeout,
        Error
    };

    PredictorPtr predictor;
    Status status = Status::Error;
    std::optional<ModelPrediction> prediction;
    std::string error;

    [[nodiscard]] bool ok() const { return status == Status::Ok && prediction.has_value(); }
};

[[nodiscard]] constexpr std::string_view to_string(PredictorOutcome::Status s) noexcept {
    switch (s) {
        case PredictorOutcome::Status::Ok:      return "ok";
        case PredictorOutcome::Status::Timeout: return "timeout";
        case PredictorOutcome::Status::Error:   return "error";
    }
    return "error";
}

using SteadyTime = std::chrono::steady_clock::time_point;

// ============================================================================
// Executor Interface
// ============================================================================

class IPredictionExecutor {
public:
    virtual ~IPredictionExecutor() = default;

    /// One outcome per predictor, same order as `predictors`.
    /// Throws CycleDeadlineExceeded if still waiting when `deadline` passes
    [[nodiscard]] virtual std::vector<PredictorOutcome> run(
        const PredictorSet& predictors,
        const FeatureVector& features,
        std::optional<SteadyTime> deadline = std::nullopt) = 0;
};

// ============================================================================
// Inline Executor (backtest)
// ============================================================================

/// Sequential, on the calling thread, with no wall-clock timeouts so that a
/// replay never depends on machine speed
class InlineExecutor final : public IPredictionExecutor {
public:
    [[nodiscard]] std::vector<PredictorOutcome> run(
        const PredictorSet& predictors,
        const FeatureVector& features,
        std::optional<SteadyTime> deadline = std::nullopt) override;
};

// ============================================================================
// Pooled Executor (live)
// ============================================================================

/// Fans predictors out on a thread pool and waits for each until its own
/// timeout. Abandoned calls finish in the background on private copies
class PooledExecutor final : public IPredictionExecutor {
public:
    explicit PooledExecutor(size_t threads);
    ~PooledExecutor() override;

    PooledExecutor(const PooledExecutor&) = delete;
    PooledExecutor& operator=(const PooledExecutor&) = delete;

    [[nodiscard]] std::vector<PredictorOutcome> run(
        const PredictorSet& predictors,
        const FeatureVector& features,
        std::optional<SteadyTime> deadline = std::nullopt) override;

private:
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

/// Invoke one predictor and fold any failure into the outcome
[[nodiscard]] PredictorOutcome invoke_predictor(const PredictorPtr& predictor,
                                                const FeatureVector& features);

}  // namespace aurum::model
