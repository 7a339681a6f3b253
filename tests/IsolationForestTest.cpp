#include "IsolationForest.h"
#include "NikaExceptions.h"

#include <gtest/gtest.h>

#include <cmath>

namespace {
std::vector<std::vector<double>> column(const std::vector<double>& values) {
    std::vector<std::vector<double>> rows;
    for (double v : values) rows.push_back({v});
    return rows;
}
}

TEST(IsolationForestTest, AveragePathLengthMatchesHarmonicApproximation) {
    EXPECT_DOUBLE_EQ(IsolationForest::averagePathLength(0), 0.0);
    EXPECT_DOUBLE_EQ(IsolationForest::averagePathLength(1), 0.0);
    EXPECT_DOUBLE_EQ(IsolationForest::averagePathLength(2), 1.0);
    EXPECT_NEAR(IsolationForest::averagePathLength(256), 10.2448, 1e-3);
}

TEST(IsolationForestTest, RejectsInvalidConfiguration) {
    EXPECT_THROW(IsolationForest(0, 256, 42), Nika::ModelingException);
    EXPECT_THROW(IsolationForest(10, 1, 42), Nika::ModelingException);
}

TEST(IsolationForestTest, RejectsInvalidSamples) {
    IsolationForest forest;
    EXPECT_THROW(forest.fit({}), Nika::ModelingException);
    EXPECT_THROW(forest.fit({{1.0, 2.0}, {3.0}}), Nika::ModelingException);
    EXPECT_THROW(forest.fit({{}, {}}), Nika::ModelingException);
    EXPECT_THROW(forest.fit({{1.0}, {std::nan("")}}), Nika::ModelingException);
    EXPECT_THROW(forest.scoreSamples({{1.0}}), Nika::ModelingException);
}

TEST(IsolationForestTest, FlagsIsolatedSpike) {
    const auto rows = column({1, 2, 3, 2, 1, 2, 3, 500});
    IsolationForest forest(100, 256, 42);
    forest.fit(rows);

    EXPECT_EQ(forest.treeCount(), 100u);
    EXPECT_EQ(forest.samplesPerTree(), 8u);
    EXPECT_EQ(forest.detect(rows), (std::vector<size_t>{7}));

    const std::vector<double> scores = forest.scoreSamples(rows);
    ASSERT_EQ(scores.size(), rows.size());
    for (size_t i = 0; i + 1 < scores.size(); ++i) EXPECT_LT(scores[i], scores[7]);
}

TEST(IsolationForestTest, SameSeedGivesSameScores) {
    std::vector<std::vector<double>> rows;
    for (int i = 0; i < 300; ++i) rows.push_back({std::sin(i * 0.37) * 5.0, std::cos(i * 0.11) * 2.0});

    IsolationForest a(50, 64, 7);
    IsolationForest b(50, 64, 7);
    a.fit(rows);
    b.fit(rows);
    EXPECT_EQ(a.samplesPerTree(), 64u);
    EXPECT_EQ(a.scoreSamples(rows), b.scoreSamples(rows));
}

TEST(IsolationForestTest, FlagsFarPointInTwoDimensions) {
    std::vector<std::vector<double>> rows;
    for (int i = 0; i < 200; ++i) rows.push_back({std::sin(i * 0.37) * 5.0, std::cos(i * 0.11) * 2.0});
    rows.push_back({40.0, -30.0});

    IsolationForest forest;
    forest.fit(rows);
    const std::vector<size_t> flagged = forest.detect(rows);
    ASSERT_FALSE(flagged.empty());
    EXPECT_EQ(flagged.back(), 200u);
}

TEST(IsolationForestTest, SingleRowIsNeverAnomalous) {
    IsolationForest forest;
    forest.fit({{3.0, 4.0}});
    EXPECT_TRUE(forest.detect({{3.0, 4.0}}).empty());
}

TEST(IsolationForestTest, ScoringRejectsFeatureMismatch) {
    IsolationForest forest(10, 16, 1);
    forest.fit(column({1, 2, 3, 4}));
    EXPECT_THROW(forest.scoreSamples({{1.0, 2.0}}), Nika::ModelingException);
}
