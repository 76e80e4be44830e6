#pragma once
// ============================================================================
// AURUM - Signal Arbiter
// ============================================================================
// The single decision entry point shared by live trading and backtesting:
//   Feature Builder -> Predictors -> Regime Detector -> Aggregator -> Risk Gate
// Exactly one TradeSignal per call. Only the Feature Builder (insufficient
// or bad history) and the live cycle deadline can prevent a decision
// ============================================================================

#include "aurum/core/types.hpp"
#include "aurum/ensemble/aggregator.hpp"
#include "aurum/ensemble/reliability.hpp"
#include "aurum/features/feature_builder.hpp"
#include "aurum/model/prediction_executor.hpp"
#include "aurum/model/predictor.hpp"
#include "aurum/regime/regime_detector.hpp"
#include "aurum/risk/risk_gate.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace aurum::engine {

/// Output of one decide() call
struct Decision {
    TradeSignal signal;
    std::vector<ModelPrediction> predictions;  // Responders, for reliability feedback
    ensemble::BlendedSignal blended;
    FeatureVector features;
};

class SignalArbiter {
public:
    SignalArbiter(features::FeatureBuilder builder,
                  model::PredictorSet predictors,
                  ensemble::EnsembleAggregator aggregator,
                  std::shared_ptr<model::IPredictionExecutor> executor);

    /// Run one decision. Evaluates `detector` once; reads but never mutates
    /// the reliabilities and budget. Throws InsufficientHistory / DataError
    /// from the builder and CycleDeadlineExceeded from a live executor; in
    /// those cases `detector` is left untouched
    [[nodiscard]] Decision decide(const MarketSnapshot& snapshot,
                                  features::SnapshotWindow history,
                                  regime::RegimeDetector& detector,
                                  const ensemble::ReliabilityTable& reliabilities,
                                  const risk::RiskBudget& budget,
                                  std::optional<model::SteadyTime> deadline = std::nullopt) const;

    [[nodiscard]] const features::FeatureBuilder& builder() const { return builder_; }
    [[nodiscard]] const model::PredictorSet& predictors() const { return predictors_; }
    [[nodiscard]] const ensemble::EnsembleAggregator& aggregator() const { return aggregator_; }
    [[nodiscard]] const risk::RiskGate& gate() const { return gate_; }

    /// History needed before the first decision can be made
    [[nodiscard]] size_t min_history() const { return builder_.min_lookback(); }

private:
    features::FeatureBuilder builder_;
    model::PredictorSet predictors_;
    ensemble::EnsembleAggregator aggregator_;
    risk::RiskGate gate_;
    std::shared_ptr<model::IPredictionExecutor> executor_;
};

}  // namespace aurum::engine
