// ============================================================================
// AURUM - Prediction Executor Unit Tests
// ============================================================================

#include "aurum/core/error.hpp"
#include "aurum/model/prediction_executor.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace aurum;
using namespace aurum::model;
using namespace aurum::test_support;
using std::chrono::milliseconds;

namespace {

PredictorSet mixed_set() {
    return {
        scripted("up", Script{Direction::Buy, 0.9}),
        scripted("broken", Script{Direction::Buy, 0.9, true}),
        scripted("down", Script{Direction::Sell, 0.4}),
    };
}

}  // namespace

TEST(InlineExecutorTest, OneOutcomePerPredictorInOrder) {
    InlineExecutor executor;
    const auto outcomes = executor.run(mixed_set(), core_vector());

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_TRUE(outcomes[0].ok());
    EXPECT_EQ(outcomes[0].prediction->direction, Direction::Buy);

    EXPECT_FALSE(outcomes[1].ok());
    EXPECT_EQ(outcomes[1].status, PredictorOutcome::Status::Error);
    EXPECT_NE(outcomes[1].error.find("scripted failure"), std::string::npos);

    EXPECT_TRUE(outcomes[2].ok());
    EXPECT_EQ(outcomes[2].predictor->id(), "down");
}

TEST(InlineExecutorTest, IgnoresDeadline) {
    InlineExecutor executor;
    const auto past = std::chrono::steady_clock::now() - milliseconds(10);
    const auto outcomes = executor.run(mixed_set(), core_vector(), past);
    EXPECT_EQ(outcomes.size(), 3u);
}

TEST(InlineExecutorTest, SchemaMismatchIsAnError) {
    InlineExecutor executor;
    auto fv = core_vector();
    fv.schema_id = "other";
    const auto outcomes = executor.run(mixed_set(), fv);
    for (const auto& o : outcomes) {
        EXPECT_EQ(o.status, PredictorOutcome::Status::Error);
    }
}

TEST(InvokePredictorTest, ClampsConfidence) {
    const auto outcome = invoke_predictor(scripted("hot", Script{Direction::Buy, 1.7}), core_vector());
    ASSERT_TRUE(outcome.ok());
    EXPECT_DOUBLE_EQ(outcome.prediction->confidence, 1.0);
}

TEST(PooledExecutorTest, MatchesInlineWhenFast) {
    PooledExecutor pooled(4);
    InlineExecutor inline_executor;

    const auto a = pooled.run(mixed_set(), core_vector());
    const auto b = inline_executor.run(mixed_set(), core_vector());
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].status, b[i].status);
        EXPECT_EQ(a[i].predictor->id(), b[i].predictor->id());
    }
}

TEST(PooledExecutorTest, SlowPredictorTimesOut) {
    PooledExecutor pooled(4);
    PredictorSet set = {
        scripted("fast", Script{Direction::Buy, 0.7}),
        scripted("slow", Script{Direction::Sell, 0.9, false, true, milliseconds(300)},
                 1.0, {}, milliseconds(20)),
    };

    const auto start = std::chrono::steady_clock::now();
    const auto outcomes = pooled.run(set, core_vector());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].ok());
    EXPECT_EQ(outcomes[1].status, PredictorOutcome::Status::Timeout);
    EXPECT_FALSE(outcomes[1].prediction.has_value());
    EXPECT_LT(elapsed, milliseconds(250));
}

TEST(PooledExecutorTest, CycleDeadlineAbandonsTheCall) {
    PooledExecutor pooled(2);
    PredictorSet set = {
        scripted("slow", Script{Direction::Buy, 0.9, false, true, milliseconds(300)},
                 1.0, {}, milliseconds(1000)),
    };

    const auto deadline = std::chrono::steady_clock::now() + milliseconds(30);
    EXPECT_THROW((void)pooled.run(set, core_vector(), deadline), CycleDeadlineExceeded);
}
