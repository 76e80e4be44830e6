// ============================================================================
// AURUM - Decision API Unit Tests
// ============================================================================

#include "aurum/api/decision_api.hpp"
#include "aurum/api/json_writer.hpp"
#include "aurum/core/error.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <iomanip>
#include <limits>
#include <sstream>

using namespace aurum;
using namespace aurum::api;
using namespace aurum::test_support;

namespace {

std::string request_for(const std::vector<MarketSnapshot>& snapshots,
                        std::string_view instrument = "XAUUSD") {
    std::ostringstream out;
    out << std::setprecision(17);
    out << "{\"instrument\":\"" << instrument << "\",\"snapshots\":[";
    for (size_t i = 0; i < snapshots.size(); ++i) {
        const auto& s = snapshots[i];
        if (i > 0) out << ',';
        out << "{\"timestamp\":" << to_epoch_ns(s.timestamp)
            << ",\"bid\":" << s.bid << ",\"ask\":" << s.ask << ",\"last\":" << s.last
            << ",\"volume\":" << s.volume << ",\"volatility\":" << s.volatility
            << ",\"spread\":" << s.spread << '}';
    }
    out << "]}";
    return out.str();
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ============================================================================
// Request Parsing
// ============================================================================

TEST(DecisionRequestTest, ParsesSnapshotsOldestFirst) {
    const auto series = drifting_series(3, 2000.0, 0.001);
    const auto request = parse_request(request_for(series));

    EXPECT_FALSE(request.status_query);
    EXPECT_EQ(request.instrument.view(), "XAUUSD");
    ASSERT_EQ(request.snapshots.size(), 3u);
    EXPECT_EQ(request.timestamp, series[2].timestamp);
    EXPECT_DOUBLE_EQ(request.current().bid, series[2].bid);
    EXPECT_EQ(request.current().instrument.view(), "XAUUSD");
}

TEST(DecisionRequestTest, OptionalFieldsDefaultToZero) {
    const auto request = parse_request(
        R"({"instrument":"EURUSD","timestamp":5,"snapshots":[{"timestamp":5,"bid":1.1,"ask":1.1002,"last":1.1001}]})");
    EXPECT_DOUBLE_EQ(request.current().volume, 0.0);
    EXPECT_DOUBLE_EQ(request.current().spread, 0.0);
    EXPECT_EQ(to_epoch_ns(request.timestamp), 5);
}

TEST(DecisionRequestTest, StatusCommand) {
    EXPECT_TRUE(parse_request(R"({"command":"status"})").status_query);
    EXPECT_THROW((void)parse_request(R"({"command":"shutdown"})"), DataError);
}

TEST(DecisionRequestTest, RejectsMalformedRequests) {
    const auto series = drifting_series(2, 2000.0, 0.001);

    EXPECT_THROW((void)parse_request("not json"), DataError);
    EXPECT_THROW((void)parse_request(R"({"snapshots":[]})"), DataError);
    EXPECT_THROW((void)parse_request(R"({"instrument":"XAUUSD","snapshots":[]})"), DataError);
    EXPECT_THROW((void)parse_request(request_for(series, "")), DataError);
    EXPECT_THROW((void)parse_request(request_for(series, "AN_INSTRUMENT_NAME_TOO_LONG")), DataError);
    EXPECT_THROW((void)parse_request(
                     R"({"instrument":"XAUUSD","snapshots":[{"timestamp":1,"bid":"x","ask":1,"last":1}]})"),
                 DataError);
}

TEST(DecisionRequestTest, RejectsInconsistentMarketData) {
    // Crossed book
    EXPECT_THROW((void)parse_request(
                     R"({"instrument":"XAUUSD","snapshots":[{"timestamp":1,"bid":2001,"ask":2000,"last":2000}]})"),
                 DataError);

    // Timestamps must increase
    auto series = drifting_series(2, 2000.0, 0.001);
    std::swap(series[0], series[1]);
    EXPECT_THROW((void)parse_request(request_for(series)), DataError);

    // Declared timestamp must be the decision snapshot's
    EXPECT_THROW((void)parse_request(
                     R"({"instrument":"XAUUSD","timestamp":9,"snapshots":[{"timestamp":1,"bid":1,"ask":1.1,"last":1}]})"),
                 DataError);
}

// ============================================================================
// Responses
// ============================================================================

TEST(DecisionResponseTest, SignalCarriesItsContext) {
    TradeSignal signal;
    signal.instrument = Symbol("XAUUSD");
    signal.timestamp = from_epoch_ns(42);
    signal.direction = Direction::Hold;
    signal.proposed_direction = Direction::Buy;
    signal.risk_action = RiskAction::Veto;
    signal.risk_reason = RiskReason::DrawdownBreaker;
    signal.regime = RegimeLabel::HighVolatility;

    const auto json = decision_json(signal);
    EXPECT_TRUE(contains(json, R"("instrument":"XAUUSD","timestamp":42,"decision":{)"));
    EXPECT_TRUE(contains(json, R"("direction":"hold")"));
    EXPECT_TRUE(contains(json, R"("proposed_direction":"buy")"));
    EXPECT_TRUE(contains(json, R"("risk_action":"veto")"));
    EXPECT_TRUE(contains(json, R"("risk_reason":"drawdown_breaker")"));
    EXPECT_TRUE(contains(json, R"("regime":"high_volatility")"));
}

TEST(DecisionResponseTest, ErrorNamesTheKind) {
    const auto json = error_json(Symbol("XAUUSD"), from_epoch_ns(7), "InsufficientHistory");
    EXPECT_EQ(json, R"({"instrument":"XAUUSD","timestamp":7,"decision":null,"error":"InsufficientHistory"})");

    EXPECT_EQ(error_kind(InsufficientHistory(35, 1)), "InsufficientHistory");
    EXPECT_EQ(error_kind(CycleDeadlineExceeded("late")), "CycleDeadlineExceeded");
    EXPECT_EQ(error_kind(std::runtime_error("x")), "Error");
}

TEST(JsonWriterTest, EscapesAndNonFiniteNumbers) {
    std::string out;
    append_string(out, "a\"b\\c\n");
    EXPECT_EQ(out, R"("a\"b\\c\n")");

    out.clear();
    append_number(out, std::numeric_limits<double>::infinity());
    EXPECT_EQ(out, "null");

    out.clear();
    append_number(out, 0.1);
    EXPECT_EQ(out, "0.10000000000000001");
}

// ============================================================================
// End to End
// ============================================================================

class DecisionApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.engine.checkpoint_path.clear();
        config_.engine.worker_threads = 2;
        auto arbiter = std::make_shared<const engine::SignalArbiter>(
            features::FeatureBuilder(),
            model::PredictorSet{scripted("bull", Script{Direction::Buy, 0.8})},
            ensemble::EnsembleAggregator(),
            std::make_shared<model::InlineExecutor>());
        engine_ = std::make_unique<engine::LiveEngine>(config_, arbiter);
        api_ = std::make_unique<DecisionApi>(*engine_);
    }

    void TearDown() override {
        api_.reset();
        engine_->stop();
    }

    config::AppConfig config_;
    std::unique_ptr<engine::LiveEngine> engine_;
    std::unique_ptr<DecisionApi> api_;
};

TEST_F(DecisionApiTest, ShortHistoryIsReportedNotDecided) {
    const auto response = api_->handle(request_for(drifting_series(5, 2000.0, 0.001)));
    EXPECT_TRUE(contains(response, R"("decision":null,"error":"InsufficientHistory")"));
}

TEST_F(DecisionApiTest, DecidesWithEnoughHistory) {
    const auto series = drifting_series(36, 2000.0, 0.001);
    const auto response = api_->handle(request_for(series));
    EXPECT_TRUE(contains(response, R"("decision":{)")) << response;
    EXPECT_TRUE(contains(response, R"("direction":"buy")")) << response;

    const auto status = api_->handle(R"({"command":"status"})");
    EXPECT_TRUE(contains(status, R"("instrument":"XAUUSD","ticks":1,"decisions":1)")) << status;
    EXPECT_TRUE(contains(status, R"("history":36})")) << status;
    EXPECT_TRUE(contains(status, R"(],"gross_exposure":)")) << status;
}

TEST_F(DecisionApiTest, MalformedLineGetsDataError) {
    const auto response = api_->handle("{\"instrument\":");
    EXPECT_TRUE(contains(response, R"("error":"DataError")"));
}

TEST_F(DecisionApiTest, StaleSnapshotIsADataError) {
    const auto series = drifting_series(3, 2000.0, 0.001);
    (void)api_->handle(request_for({series[2]}));
    const auto response = api_->handle(request_for({series[1]}));
    EXPECT_TRUE(contains(response, R"("error":"DataError")")) << response;
}
