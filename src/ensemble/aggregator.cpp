// ============================================================================
// AURUM - Ensemble Aggregator Implementation
// ============================================================================

#include "aurum/ensemble/aggregator.hpp"
#include "aurum/core/error.hpp"

#include <algorithm>
#include <cmath>

namespace aurum::ensemble {

double EnsembleConfig::decay() const {
    return std::pow(0.5, 1.0 / decay_half_life);
}

void validate(const EnsembleConfig& config) {
    if (!(config.decay_half_life > 0.0)) {
        throw ConfigError("ensemble.decay_half_life must be positive");
    }
    if (config.initial_reliability < 0.0 || config.initial_reliability > 1.0) {
        throw ConfigError("ensemble.initial_reliability must be in [0, 1]");
    }
    if (config.out_of_regime_penalty < 0.0 || config.out_of_regime_penalty > 1.0) {
        throw ConfigError("ensemble.out_of_regime_penalty must be in [0, 1]");
    }
    if (config.flat_return < 0.0) {
        throw ConfigError("ensemble.flat_return must be non-negative");
    }
}

EnsembleAggregator::EnsembleAggregator(EnsembleConfig config)
    : config_(config) {
    validate(config_);
    decay_ = config_.decay();
}

BlendedSignal EnsembleAggregator::aggregate(const std::vector<model::PredictorOutcome>& outcomes,
                                            RegimeLabel regime,
                                            const ReliabilityTable& reliabilities) const {
    BlendedSignal blended;
    blended.regime = regime;
    blended.total = static_cast<uint32_t>(outcomes.size());

    // Raw weights over the whole ensemble, so the failed share is known
    double total_raw = 0.0;
    double responder_raw = 0.0;
    std::vector<double> raw_weights;
    raw_weights.reserve(outcomes.size());

    for (const auto& outcome : outcomes) {
        const auto& predictor = *outcome.predictor;
        const double raw = predictor.base_weight() * reliabilities.get(predictor.id(), regime);
        total_raw += raw;

        if (!outcome.ok()) continue;

        const auto& prediction = *outcome.prediction;
        WeightedVote vote;
        vote.predictor_id = prediction.predictor_id;
        vote.direction = prediction.direction;
        vote.confidence = prediction.confidence;
        vote.out_of_regime = !predictor.validated_for(regime);
        if (vote.out_of_regime) {
            vote.confidence *= config_.out_of_regime_penalty;
        }

        raw_weights.push_back(raw);
        responder_raw += raw;
        blended.votes.push_back(std::move(vote));
    }

    blended.responded = static_cast<uint32_t>(blended.votes.size());
    blended.degraded = blended.responded < blended.total;

    if (blended.votes.empty()) {
        return blended;
    }

    // Normalize across responders; all-zero weights fall back to equal shares
    const size_t n = blended.votes.size();
    for (size_t i = 0; i < n; ++i) {
        blended.votes[i].weight = responder_raw > 0.0
                                      ? raw_weights[i] / responder_raw
                                      : 1.0 / static_cast<double>(n);
    }

    double score = 0.0;
    double confidence = 0.0;
    for (const auto& vote : blended.votes) {
        score += vote.weight * sign_of(vote.direction);
        confidence += vote.weight * vote.confidence;
    }

    // Penalty for missing members: the smaller of the responding head-count
    // share and the responding prior-weight share
    double coverage = static_cast<double>(blended.responded) / static_cast<double>(blended.total);
    if (total_raw > 0.0) {
        coverage = std::min(coverage, responder_raw / total_raw);
    }

    blended.score = score;
    blended.direction = direction_from_sign(score);
    blended.confidence = clamp_confidence(confidence * coverage);
    blended.proposed_fraction = blended.direction == Direction::Hold ? 0.0 : blended.confidence;
    return blended;
}

double EnsembleAggregator::correctness(Direction direction, double realized_return) const {
    switch (direction) {
        case Direction::Buy:  return realized_return > config_.flat_return ? 1.0 : 0.0;
        case Direction::Sell: return realized_return < -config_.flat_return ? 1.0 : 0.0;
        case Direction::Hold: return std::abs(realized_return) <= config_.flat_return ? 1.0 : 0.0;
    }
    return 0.0;
}

void EnsembleAggregator::update_reliability(const std::vector<ModelPrediction>& predictions,
                                            RegimeLabel regime,
                                            double realized_return,
                                            ReliabilityTable& reliabilities) const {
    for (const auto& prediction : predictions) {
        const double old_score = reliabilities.get(prediction.predictor_id, regime);
        const double hit = correctness(prediction.direction, realized_return);
        reliabilities.set(prediction.predictor_id, regime,
                          decay_ * old_score + (1.0 - decay_) * hit);
    }
}

}  // namespace aurum::ensemble
