// ============================================================================
// AURUM - Predictor Unit Tests
// ============================================================================

#include "aurum/core/error.hpp"
#include "aurum/model/advisory_predictor.hpp"
#include "aurum/model/neural_predictor.hpp"
#include "aurum/model/statistical_predictor.hpp"
#include "aurum/model/tree_predictor.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <mutex>

using namespace aurum;
using namespace aurum::model;
using namespace aurum::test_support;

namespace {

PredictorSpec spec_for(const std::string& id, const std::string& kind) {
    PredictorSpec spec;
    spec.id = id;
    spec.kind = kind;
    return spec;
}

std::vector<double> unit(size_t index, double value = 1.0) {
    std::vector<double> x(11, 0.0);
    x[index] = value;
    return x;
}

/// Canned transport that records what was sent
class FakeHttpClient : public network::IHttpClient {
public:
    explicit FakeHttpClient(network::HttpResponse response) : response_(std::move(response)) {}

    network::HttpResponse post(const std::string& target, const std::string& body,
                               std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_target = target;
        last_body = body;
        last_timeout = timeout;
        return response_;
    }

    std::string last_target;
    std::string last_body;
    std::chrono::milliseconds last_timeout{0};

private:
    std::mutex mutex_;
    network::HttpResponse response_;
};

network::HttpResponse ok_response(const std::string& body) {
    network::HttpResponse r;
    r.status_code = 200;
    r.body = body;
    return r;
}

}  // namespace

// ============================================================================
// Statistical
// ============================================================================

class StatisticalPredictorTest : public ::testing::Test {
protected:
    StatisticalPredictor predictor{spec_for("logit", "statistical"),
                                   LogisticParams{std::vector<double>(11, 0.0), 0.0, 0.05}};

    StatisticalPredictor with_first_weight(double w) {
        auto weights = std::vector<double>(11, 0.0);
        weights[0] = w;
        return StatisticalPredictor(spec_for("logit", "statistical"), LogisticParams{weights, 0.0, 0.05});
    }
};

TEST_F(StatisticalPredictorTest, ZeroWeightsHold) {
    const auto p = predictor.predict(core_vector());
    EXPECT_EQ(p.direction, Direction::Hold);
    EXPECT_DOUBLE_EQ(p.confidence, 0.0);
    EXPECT_EQ(p.predictor_id, "logit");
}

TEST_F(StatisticalPredictorTest, SignFollowsScore) {
    auto model = with_first_weight(4.0);
    const auto up = model.predict(core_vector(unit(0, 1.0)));
    const auto down = model.predict(core_vector(unit(0, -1.0)));

    EXPECT_EQ(up.direction, Direction::Buy);
    EXPECT_EQ(down.direction, Direction::Sell);
    const double p = 1.0 / (1.0 + std::exp(-4.0));
    EXPECT_NEAR(up.confidence, 2.0 * p - 1.0, 1e-12);
    EXPECT_NEAR(down.confidence, up.confidence, 1e-12);
}

TEST_F(StatisticalPredictorTest, DeterministicAndStamped) {
    auto model = with_first_weight(2.5);
    const auto fv = core_vector(unit(0, 0.3), 42 * SECOND_NS);
    const auto a = model.predict(fv);
    const auto b = model.predict(fv);
    EXPECT_EQ(a.direction, b.direction);
    EXPECT_EQ(a.confidence, b.confidence);
    EXPECT_EQ(a.timestamp, from_epoch_ns(42 * SECOND_NS));
    EXPECT_TRUE(model.deterministic());
}

TEST_F(StatisticalPredictorTest, ForeignSchemaRejected) {
    auto fv = core_vector();
    fv.schema_id = "core.v2";
    EXPECT_THROW((void)predictor.predict(fv), SchemaMismatch);
}

TEST_F(StatisticalPredictorTest, WrongDimensionRejected) {
    EXPECT_THROW((void)predictor.predict(core_vector(std::vector<double>(7, 0.0))), SchemaMismatch);

    StatisticalPredictor narrow(spec_for("narrow", "statistical"),
                                LogisticParams{std::vector<double>(5, 1.0), 0.0, 0.05});
    EXPECT_THROW(narrow.validate(features::schema_by_id(features::CORE_V1)), SchemaMismatch);
}

TEST(StatisticalPredictorConfigTest, InvalidParameters) {
    EXPECT_THROW(StatisticalPredictor(spec_for("x", "statistical"), LogisticParams{}), ConfigError);
    EXPECT_THROW(StatisticalPredictor(spec_for("x", "statistical"),
                                      LogisticParams{std::vector<double>(11, 1.0), 0.0, 0.5}),
                 ConfigError);
}

// ============================================================================
// Tree Ensemble
// ============================================================================

TEST(TreePredictorTest, StumpsVote) {
    TreeEnsembleParams params;
    params.stumps = {{4, 0.0, 0.5, -0.5}, {5, 0.0, 0.25, -0.25}};
    params.learning_rate = 1.0;
    TreeEnsemblePredictor model(spec_for("stumps", "tree_ensemble"), params);

    auto x = std::vector<double>(11, 0.0);
    x[4] = -0.2;  // left: +0.5
    x[5] = 0.3;   // right: -0.25
    EXPECT_DOUBLE_EQ(model.score(x), 0.25);

    const auto p = model.predict(core_vector(x));
    EXPECT_EQ(p.direction, Direction::Buy);
    EXPECT_NEAR(p.confidence, std::tanh(0.25), 1e-12);
}

TEST(TreePredictorTest, SplitOutsideSchemaRejected) {
    TreeEnsembleParams params;
    params.stumps = {{11, 0.0, 1.0, -1.0}};
    TreeEnsemblePredictor model(spec_for("wide", "tree_ensemble"), params);
    EXPECT_THROW(model.validate(features::schema_by_id(features::CORE_V1)), SchemaMismatch);
}

// ============================================================================
// Neural
// ============================================================================

TEST(NeuralPredictorTest, ForwardPass) {
    NeuralParams params;
    DenseLayer hidden;
    hidden.inputs = 11;
    hidden.outputs = 2;
    hidden.weights.assign(22, 0.0);
    hidden.weights[0] = 1.0;        // h0 = tanh(x0)
    hidden.weights[11 + 1] = 1.0;   // h1 = tanh(x1)
    hidden.bias = {0.0, 0.0};

    DenseLayer out;
    out.inputs = 2;
    out.outputs = 1;
    out.weights = {1.0, -1.0};
    out.bias = {0.0};
    params.layers = {hidden, out};

    NeuralPredictor model(spec_for("mlp", "neural"), params);
    model.validate(features::schema_by_id(features::CORE_V1));

    auto x = std::vector<double>(11, 0.0);
    x[0] = 0.8;
    x[1] = 0.1;
    const double expected = std::tanh(std::tanh(0.8) - std::tanh(0.1));
    EXPECT_NEAR(model.forward(x), expected, 1e-12);

    const auto p = model.predict(core_vector(x));
    EXPECT_EQ(p.direction, Direction::Buy);
    EXPECT_NEAR(p.confidence, expected, 1e-12);
}

TEST(NeuralPredictorTest, InconsistentShapesRejected) {
    NeuralParams params;
    DenseLayer layer;
    layer.inputs = 11;
    layer.outputs = 1;
    layer.weights.assign(10, 0.0);  // needs 11
    layer.bias = {0.0};
    params.layers = {layer};
    EXPECT_THROW(NeuralPredictor(spec_for("bad", "neural"), params), ConfigError);
}

// ============================================================================
// Advisory
// ============================================================================

TEST(AdvisoryPredictorTest, DecodesServiceReply) {
    auto client = std::make_shared<FakeHttpClient>(ok_response(R"({"direction":"sell","confidence":0.65})"));
    auto spec = spec_for("desk", "advisory");
    spec.timeout = std::chrono::milliseconds(40);
    AdvisoryPredictor model(spec, AdvisoryParams{"127.0.0.1", "8085", "/advise"}, client);

    const auto p = model.predict(core_vector(unit(2, 0.5), 7 * SECOND_NS));
    EXPECT_EQ(p.direction, Direction::Sell);
    EXPECT_DOUBLE_EQ(p.confidence, 0.65);
    EXPECT_FALSE(model.deterministic());

    EXPECT_EQ(client->last_target, "/advise");
    EXPECT_EQ(client->last_timeout, std::chrono::milliseconds(40));
    EXPECT_NE(client->last_body.find(R"("predictor":"desk")"), std::string::npos);
    EXPECT_NE(client->last_body.find(R"("schema":"core.v1")"), std::string::npos);
    EXPECT_NE(client->last_body.find(R"("timestamp":7000000000)"), std::string::npos);
}

TEST(AdvisoryPredictorTest, TimeoutBecomesModelTimeout) {
    network::HttpResponse r;
    r.status_code = -1;
    r.timed_out = true;
    auto client = std::make_shared<FakeHttpClient>(r);
    AdvisoryPredictor model(spec_for("desk", "advisory"), AdvisoryParams{}, client);
    EXPECT_THROW((void)model.predict(core_vector()), ModelTimeout);
}

TEST(AdvisoryPredictorTest, BadRepliesBecomeModelError) {
    const std::vector<std::string> bodies = {
        R"({"direction":"up","confidence":0.5})",
        R"({"direction":"buy","confidence":1.5})",
        R"(not json)",
    };
    for (const auto& body : bodies) {
        auto client = std::make_shared<FakeHttpClient>(ok_response(body));
        AdvisoryPredictor model(spec_for("desk", "advisory"), AdvisoryParams{}, client);
        EXPECT_THROW((void)model.predict(core_vector()), ModelError) << body;
    }

    network::HttpResponse failed;
    failed.status_code = 503;
    failed.body = "unavailable";
    auto client = std::make_shared<FakeHttpClient>(failed);
    AdvisoryPredictor model(spec_for("desk", "advisory"), AdvisoryParams{}, client);
    EXPECT_THROW((void)model.predict(core_vector()), ModelError);
}

// ============================================================================
// Regime validity
// ============================================================================

TEST(PredictorSpecTest, ValidatedRegimes) {
    auto any = scripted("any", Script{});
    auto trend_only = scripted("trend", Script{}, 1.0, {RegimeLabel::Trending});

    EXPECT_TRUE(any->validated_for(RegimeLabel::Illiquid));
    EXPECT_TRUE(trend_only->validated_for(RegimeLabel::Trending));
    EXPECT_FALSE(trend_only->validated_for(RegimeLabel::Ranging));
}
