#include "AnalyticsService.h"
#include "JsonValue.h"
#include "NikaExceptions.h"

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {
class ScriptedAssistant : public QueryAssistant {
public:
    explicit ScriptedAssistant(std::string reply, bool fail = false) : reply_(std::move(reply)), fail_(fail) {}

    std::string complete(const std::string& prompt) override {
        lastPrompt = prompt;
        if (fail_) throw std::runtime_error("upstream timeout");
        return reply_;
    }

    std::string lastPrompt;

private:
    std::string reply_;
    bool fail_;
};

AnalyticsConfig serveConfig() {
    return AnalyticsConfig::fromArgs({"nika-analytics", "serve"});
}

class AnalyticsServiceTest : public ::testing::Test {
protected:
    RequestMonitor monitor;
    std::ostringstream log;
};
}

TEST_F(AnalyticsServiceTest, InsightsReturnsCountsAndFindings) {
    AnalyticsService service(serveConfig(), monitor, nullptr, log);
    const ServiceResponse response = service.handle("/api/insights", R"({"data": [{"v": 1}, {"v": 3}]})");
    EXPECT_EQ(response.status, 200);

    const JsonValue body = parseJsonText(response.body);
    EXPECT_DOUBLE_EQ(body.find("row_count")->numberValue, 2.0);
    EXPECT_DOUBLE_EQ(body.find("column_count")->numberValue, 1.0);
    ASSERT_EQ(body.find("insights")->arrayValue.size(), 1u);
    EXPECT_EQ(body.find("insights")->arrayValue[0].stringValue,
              "'v': mean=2.00, median=2.00, std=1.00, min=1.00, max=3.00.");
}

TEST_F(AnalyticsServiceTest, InsightsOnEmptyDataHasZeroCounts) {
    AnalyticsService service(serveConfig(), monitor, nullptr, log);
    const ServiceResponse response = service.handle("/api/insights", R"({"data": []})");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, R"({"row_count":0,"column_count":0,"insights":[]})");
}

TEST_F(AnalyticsServiceTest, ForecastWithoutTargetReturnsMessage) {
    AnalyticsService service(serveConfig(), monitor, nullptr, log);
    const ServiceResponse response = service.handle("/api/forecast", R"({"data": [{"y": 1}]})");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, R"({"message":"No data or missing target.","forecast":[]})");
}

TEST_F(AnalyticsServiceTest, ForecastShortSeriesUsesMovingAverage) {
    AnalyticsService service(serveConfig(), monitor, nullptr, log);
    const ServiceResponse response = service.handle(
        "/api/forecast",
        R"({"data": [{"d": "2024-01-02", "y": 2}, {"d": "2024-01-01", "y": 1}, {"d": "2024-01-03", "y": 4}],
            "target_column": "y", "date_column": "d"})");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.strategy, "moving_average");
    EXPECT_EQ(response.fallbackReason, "too few points (3)");

    const JsonValue body = parseJsonText(response.body);
    EXPECT_DOUBLE_EQ(body.find("steps")->numberValue, 12.0);
    ASSERT_EQ(body.find("forecast")->arrayValue.size(), 12u);
    EXPECT_DOUBLE_EQ(body.find("forecast")->arrayValue[0].numberValue, 3.0);
    EXPECT_EQ(monitor.snapshot().fallbackRequests, 1u);
}

TEST_F(AnalyticsServiceTest, AnomalyReturnsRowIds) {
    AnalyticsService service(serveConfig(), monitor, nullptr, log);
    const ServiceResponse response = service.handle(
        "/api/anomaly",
        R"({"data": [{"v": 1}, {"v": 2}, {"v": 3}, {"v": 2}, {"v": 1}, {"v": 2}, {"v": 3}, {"v": 500}],
            "numeric_columns": ["v"]})");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.strategy, "isolation_forest");
    EXPECT_EQ(response.body, R"({"anomalies":[7]})");
}

TEST_F(AnalyticsServiceTest, AnomalyHonorsDisabledForest) {
    AnalyticsConfig config = AnalyticsConfig::fromArgs({"nika-analytics", "serve", "--disable-isolation-forest"});
    AnalyticsService service(config, monitor, nullptr, log);
    EXPECT_FALSE(service.capabilities().isolationForest);

    const ServiceResponse response = service.handle("/api/anomaly", R"({"data": [{"v": 1}, {"v": 2}, {"v": 3}, {"v": 100}]})");
    EXPECT_EQ(response.strategy, "zscore");
    EXPECT_EQ(response.body, R"({"anomalies":[]})");
}

TEST_F(AnalyticsServiceTest, QueryWithoutAssistantFallsBack) {
    AnalyticsService service(serveConfig(), monitor, nullptr, log);
    const ServiceResponse response = service.handle("/api/query", R"({"data": [{"v": 1}], "question": "why?"})");
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body,
              R"({"answer":"Could not process query: no query assistant configured","suggestions":[]})");
}

TEST_F(AnalyticsServiceTest, QueryRelaysAssistantObject) {
    auto assistant = std::make_shared<ScriptedAssistant>(
        R"({"answer": "Sales grew.", "suggestions": [{"type": "line", "x": "d", "y": "sales", "category": null}]})");
    AnalyticsService service(serveConfig(), monitor, assistant, log);
    const ServiceResponse response = service.handle(
        "/api/query", R"({"data": [{"d": "2024-01-01", "sales": 5}], "question": "How are sales?"})");

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.strategy, "assistant");
    EXPECT_EQ(response.body,
              R"({"answer":"Sales grew.","suggestions":[{"type":"line","x":"d","y":"sales","category":null}]})");
    EXPECT_NE(assistant->lastPrompt.find(R"(Dataset schema: ["d","sales"])"), std::string::npos);
    EXPECT_NE(assistant->lastPrompt.find("User question: How are sales?"), std::string::npos);
}

TEST_F(AnalyticsServiceTest, QueryDegradesOnBadAssistantReply) {
    auto prose = std::make_shared<ScriptedAssistant>("Sure! Sales are up.");
    AnalyticsService proseService(serveConfig(), monitor, prose, log);
    const ServiceResponse unparsable = proseService.handle("/api/query", R"({"data": [], "question": "q"})");
    EXPECT_EQ(unparsable.status, 200);
    EXPECT_EQ(unparsable.strategy, "fallback");
    EXPECT_EQ(parseJsonText(unparsable.body).find("suggestions")->arrayValue.size(), 0u);

    auto array = std::make_shared<ScriptedAssistant>("[1, 2]");
    AnalyticsService arrayService(serveConfig(), monitor, array, log);
    const ServiceResponse notObject = arrayService.handle("/api/query", R"({"data": [], "question": "q"})");
    EXPECT_NE(notObject.body.find("assistant reply is not a JSON object"), std::string::npos);

    auto failing = std::make_shared<ScriptedAssistant>("", true);
    AnalyticsService failingService(serveConfig(), monitor, failing, log);
    const ServiceResponse failed = failingService.handle("/api/query", R"({"data": [], "question": "q"})");
    EXPECT_EQ(failed.body, R"({"answer":"Could not process query: upstream timeout","suggestions":[]})");
}

TEST_F(AnalyticsServiceTest, MalformedRequestsReturn400) {
    AnalyticsService service(serveConfig(), monitor, nullptr, log);

    const ServiceResponse notJson = service.handle("/api/insights", "{not json");
    EXPECT_EQ(notJson.status, 400);
    EXPECT_NE(parseJsonText(notJson.body).find("error"), nullptr);
    EXPECT_NE(parseJsonText(notJson.body).find("latency_ms"), nullptr);

    EXPECT_EQ(service.handle("/api/insights", R"({"rows": []})").status, 400);
    EXPECT_EQ(service.handle("/api/insights", R"({"data": [1, 2]})").status, 400);
    EXPECT_EQ(service.handle("/api/query", R"({"data": []})").status, 400);
    EXPECT_EQ(service.handle("/api/anomaly", R"({"data": [], "numeric_columns": "v"})").status, 400);
    EXPECT_EQ(service.handle("/api/forecast", R"({"data": [], "target_column": 3})").status, 400);
    EXPECT_EQ(service.handle("/api/predict", R"({"data": []})").status, 400);

    const MonitoringSnapshot snapshot = monitor.snapshot();
    EXPECT_EQ(snapshot.totalRequests, 7u);
    EXPECT_EQ(snapshot.errorRequests, 7u);
    EXPECT_EQ(snapshot.endpointRequests.at("/api/insights"), 3u);
}

TEST_F(AnalyticsServiceTest, LogsMonitoringAndFallbackLines) {
    AnalyticsConfig config = AnalyticsConfig::fromArgs({"nika-analytics", "serve", "--verbose", "true", "--disable-arima"});
    AnalyticsService service(config, monitor, nullptr, log);
    service.handle("/api/forecast", R"({"data": [{"y": 1}, {"y": 2}], "target_column": "y"})");

    const std::string text = log.str();
    EXPECT_NE(text.find("[NikaService][Fallback] endpoint=/api/forecast reason=arima disabled"), std::string::npos);
    EXPECT_NE(text.find("[NikaService][Monitor] endpoint=/api/forecast strategy=moving_average total_requests=1"),
              std::string::npos);
}

TEST_F(AnalyticsServiceTest, DeeplyNestedBodyIsRejectedWith400) {
    AnalyticsService service(serveConfig(), monitor, nullptr, log);
    const std::string body = "{\"data\":" + std::string(200000, '[') + std::string(200000, ']') + "}";

    const ServiceResponse response = service.handle("/api/insights", body);
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(parseJsonText(response.body).find("error")->stringValue, "JSON nesting too deep");
    EXPECT_EQ(monitor.snapshot().errorRequests, 1u);
}
