// ============================================================================
// AURUM - Signal Arbiter Implementation
// ============================================================================

#include "aurum/engine/signal_arbiter.hpp"
#include "aurum/core/error.hpp"
#include "aurum/utils/logger.hpp"

namespace aurum::engine {

SignalArbiter::SignalArbiter(features::FeatureBuilder builder,
                             model::PredictorSet predictors,
                             ensemble::EnsembleAggregator aggregator,
                             std::shared_ptr<model::IPredictionExecutor> executor)
    : builder_(std::move(builder)),
      predictors_(std::move(predictors)),
      aggregator_(std::move(aggregator)),
      executor_(std::move(executor)) {
    if (!executor_) {
        throw ConfigError("signal arbiter needs a prediction executor");
    }
    for (const auto& predictor : predictors_) {
        predictor->validate(builder_.schema());
    }
}

Decision SignalArbiter::decide(const MarketSnapshot& snapshot,
                               features::SnapshotWindow history,
                               regime::RegimeDetector& detector,
                               const ensemble::ReliabilityTable& reliabilities,
                               const risk::RiskBudget& budget,
                               std::optional<model::SteadyTime> deadline) const {
    SCOPED_TIMER("decide");

    Decision decision;
    decision.features = builder_.build(snapshot, history);

    auto outcomes = executor_->run(predictors_, decision.features, deadline);

    const auto& regime = detector.evaluate(snapshot, history);

    decision.blended = aggregator_.aggregate(outcomes, regime.label, reliabilities);
    decision.signal = gate_.evaluate(decision.blended, budget, snapshot.instrument, snapshot.timestamp);
    decision.signal.regime_confidence = regime.confidence;

    decision.predictions.reserve(outcomes.size());
    for (auto& outcome : outcomes) {
        if (outcome.ok()) {
            decision.predictions.push_back(std::move(*outcome.prediction));
        }
    }

    if (decision.signal.degraded) {
        LOG_DEBUG("Degraded ensemble for {}: {}/{} predictors responded",
                  snapshot.instrument.view(), decision.signal.responded,
                  decision.signal.total_predictors);
    }
    return decision;
}

}  // namespace aurum::engine
