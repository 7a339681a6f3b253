#include "AnomalyEngine.h"

#include <gtest/gtest.h>

namespace {
TypedDataset valueTable(const std::vector<RawScalar>& values) {
    std::vector<Record> records;
    for (const auto& v : values) records.push_back({{"v", v}, {"label", std::string("x")}});
    return TypedDataset::fromRecords(records);
}
}

TEST(AnomalyEngineTest, IsolationForestFlagsSpike) {
    const AnomalyResult result = AnomalyEngine::detect(valueTable({1.0, 2.0, 3.0, 2.0, 1.0, 2.0, 3.0, 500.0}));
    EXPECT_EQ(result.strategy, "isolation_forest");
    EXPECT_TRUE(result.fallbackReason.empty());
    EXPECT_EQ(result.columns, (std::vector<std::string>{"v"}));
    EXPECT_EQ(result.rowsUsed, 8u);
    EXPECT_EQ(result.anomalies, (std::vector<size_t>{7}));
}

TEST(AnomalyEngineTest, DroppedRowsKeepOriginalIds) {
    const AnomalyResult result = AnomalyEngine::detect(
        valueTable({1.0, 2.0, std::monostate{}, 3.0, 2.0, 1.0, 2.0, 3.0, 500.0}));
    EXPECT_EQ(result.rowsUsed, 8u);
    EXPECT_EQ(result.anomalies, (std::vector<size_t>{8}));
}

TEST(AnomalyEngineTest, DisabledForestUsesZScore) {
    AnomalyOptions options;
    options.isolationForestEnabled = false;
    const AnomalyResult result = AnomalyEngine::detect(valueTable({1.0, 2.0, 3.0, 100.0}), {}, options);
    EXPECT_EQ(result.strategy, "zscore");
    EXPECT_EQ(result.fallbackReason, "isolation forest disabled");
    EXPECT_TRUE(result.anomalies.empty());
}

TEST(AnomalyEngineTest, ZScoreFlagsDistantValue) {
    std::vector<RawScalar> values;
    for (int i = 0; i < 19; ++i) values.push_back(10.0 + (i % 3) - 1.0);
    values.push_back(1000.0);

    AnomalyOptions options;
    options.isolationForestEnabled = false;
    const AnomalyResult result = AnomalyEngine::detect(valueTable(values), {"v"}, options);
    EXPECT_EQ(result.anomalies, (std::vector<size_t>{19}));
}

TEST(AnomalyEngineTest, ZScoreOutliersChecksEveryColumn) {
    const std::vector<std::vector<double>> rows = {
        {1.0, 5.0}, {1.0, 5.0}, {1.0, 5.0}, {1.0, 5.0}, {1.0, 5.0},
        {1.0, 5.0}, {1.0, 5.0}, {1.0, 5.0}, {1.0, 5.0}, {1.0, 5.0},
        {1.0, 50.0},
    };
    EXPECT_EQ(AnomalyEngine::zScoreOutliers(rows, 3.0, 1e-9), (std::vector<size_t>{10}));
    EXPECT_TRUE(AnomalyEngine::zScoreOutliers({}, 3.0, 1e-9).empty());
}

TEST(AnomalyEngineTest, InvalidRequestedColumnsYieldNothing) {
    const AnomalyResult result = AnomalyEngine::detect(valueTable({1.0, 2.0, 500.0}), {"missing", "label"});
    EXPECT_EQ(result.strategy, "none");
    EXPECT_TRUE(result.columns.empty());
    EXPECT_TRUE(result.anomalies.empty());
}

TEST(AnomalyEngineTest, ResolveColumnsDropsDuplicatesAndNonNumeric) {
    const TypedDataset data = TypedDataset::fromRecords({
        {{"a", 1.0}, {"b", std::string("x")}, {"c", 2.0}},
    });
    EXPECT_EQ(AnomalyEngine::resolveColumns(data, {}), (std::vector<size_t>{0, 2}));
    EXPECT_EQ(AnomalyEngine::resolveColumns(data, {"c", "b", "c", "a"}), (std::vector<size_t>{2, 0}));
}

TEST(AnomalyEngineTest, EmptyTableYieldsNothing) {
    const AnomalyResult result = AnomalyEngine::detect(TypedDataset::fromRecords({}));
    EXPECT_EQ(result.strategy, "none");
    EXPECT_TRUE(result.anomalies.empty());
}

TEST(AnomalyEngineTest, SingleRowIsNotAnomalous) {
    const AnomalyResult result = AnomalyEngine::detect(valueTable({42.0}));
    EXPECT_EQ(result.strategy, "isolation_forest");
    EXPECT_TRUE(result.anomalies.empty());
}
