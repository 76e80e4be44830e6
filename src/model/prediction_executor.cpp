// ============================================================================
// AURUM - Prediction Executor Implementation
// ============================================================================

#include "aurum/model/prediction_executor.hpp"
#include "aurum/core/error.hpp"
#include "aurum/utils/logger.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <future>

namespace aurum::model {

PredictorOutcome invoke_predictor(const PredictorPtr& predictor, const FeatureVector& features) {
    PredictorOutcome outcome;
    outcome.predictor = predictor;

    try {
        outcome.prediction = predictor->predict(features);
        outcome.prediction->confidence = clamp_confidence(outcome.prediction->confidence);
        outcome.status = PredictorOutcome::Status::Ok;
    } catch (const ModelTimeout& e) {
        outcome.status = PredictorOutcome::Status::Timeout;
        outcome.error = e.what();
    } catch (const std::exception& e) {
        outcome.status = PredictorOutcome::Status::Error;
        outcome.error = e.what();
    }

    if (!outcome.ok()) {
        LOG_WARN("Predictor {} {}: {}", predictor->id(), to_string(outcome.status), outcome.error);
    }
    return outcome;
}

// ============================================================================
// Inline Executor
// ============================================================================

std::vector<PredictorOutcome> InlineExecutor::run(const PredictorSet& predictors,
                                                  const FeatureVector& features,
                                                  std::optional<SteadyTime>) {
    std::vector<PredictorOutcome> outcomes;
    outcomes.reserve(predictors.size());
    for (const auto& predictor : predictors) {
        outcomes.push_back(invoke_predictor(predictor, features));
    }
    return outcomes;
}

// ============================================================================
// Pooled Executor
// ============================================================================

PooledExecutor::PooledExecutor(size_t threads)
    : pool_(std::make_unique<boost::asio::thread_pool>(std::max<size_t>(threads, 1))) {}

PooledExecutor::~PooledExecutor() {
    pool_->join();
}

std::vector<PredictorOutcome> PooledExecutor::run(const PredictorSet& predictors,
                                                  const FeatureVector& features,
                                                  std::optional<SteadyTime> deadline) {
    const auto start = std::chrono::steady_clock::now();

    // Tasks own their inputs so an abandoned call can finish after run()
    auto shared_features = std::make_shared<const FeatureVector>(features);

    std::vector<std::future<PredictorOutcome>> futures;
    futures.reserve(predictors.size());
    for (const auto& predictor : predictors) {
        auto task = std::make_shared<std::packaged_task<PredictorOutcome()>>(
            [predictor, shared_features]() {
                return invoke_predictor(predictor, *shared_features);
            });
        futures.push_back(task->get_future());
        boost::asio::post(*pool_, [task]() { (*task)(); });
    }

    std::vector<PredictorOutcome> outcomes;
    outcomes.reserve(predictors.size());
    for (size_t i = 0; i < predictors.size(); ++i) {
        const auto& predictor = predictors[i];
        const auto budget_end = start + predictor->timeout();
        const auto wait_end = deadline ? std::min(budget_end, *deadline) : budget_end;

        if (futures[i].wait_until(wait_end) == std::future_status::ready) {
            outcomes.push_back(futures[i].get());
            continue;
        }

        if (deadline && *deadline <= budget_end) {
            throw CycleDeadlineExceeded("cycle deadline passed while waiting on predictor '" +
                                        predictor->id() + "'");
        }

        PredictorOutcome outcome;
        outcome.predictor = predictor;
        outcome.status = PredictorOutcome::Status::Timeout;
        outcome.error = ModelTimeout(predictor->id(), predictor->timeout()).what();
        LOG_WARN("Predictor {} timeout: {}", predictor->id(), outcome.error);
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

}  // namespace aurum::model
