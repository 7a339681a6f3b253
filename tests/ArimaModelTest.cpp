#include "ArimaModel.h"
#include "NikaExceptions.h"

#include <gtest/gtest.h>

#include <cmath>

namespace {
std::vector<double> wavySeries(size_t n) {
    std::vector<double> out(n);
    for (size_t t = 0; t < n; ++t) {
        const double x = static_cast<double>(t);
        out[t] = 10.0 + 0.5 * x + 3.0 * std::sin(1.3 * x) + 2.0 * std::cos(0.7 * x);
    }
    return out;
}
}

TEST(ArimaModelTest, RejectsShortSeries) {
    ArimaModel model;
    EXPECT_THROW(model.fit({1, 2, 3, 4, 5, 6, 7}), Nika::ModelingException);
    EXPECT_FALSE(model.fitted());
}

TEST(ArimaModelTest, RejectsNonFiniteValues) {
    std::vector<double> series = wavySeries(12);
    series[4] = std::nan("");
    ArimaModel model;
    EXPECT_THROW(model.fit(series), Nika::ModelingException);
}

TEST(ArimaModelTest, ConstantSeriesForecastsFlat) {
    ArimaModel model;
    ASSERT_NO_THROW(model.fit(std::vector<double>(12, 5.0)));
    EXPECT_EQ(model.forecast(3), (std::vector<double>{5.0, 5.0, 5.0}));
}

TEST(ArimaModelTest, LinearSeriesContinuesIncrements) {
    ArimaModel model;
    model.fit({10, 12, 14, 16, 18, 20, 22, 24, 26, 28, 30, 32});
    EXPECT_DOUBLE_EQ(model.phi(), 1.0);
    EXPECT_DOUBLE_EQ(model.theta(), 0.0);
    EXPECT_EQ(model.forecast(3), (std::vector<double>{34.0, 36.0, 38.0}));
}

TEST(ArimaModelTest, AlternatingIncrementsStillFit) {
    // Alternating steps leave no innovations once the lag-2 term explains them.
    ArimaModel model;
    ASSERT_NO_THROW(model.fit({0, 1, 3, 4, 6, 7, 9, 10, 12, 13, 15, 16}));
    EXPECT_LE(std::abs(model.phi()), ArimaModel::kCoefficientBound);
    for (double v : model.forecast(4)) EXPECT_TRUE(std::isfinite(v));
}

TEST(ArimaModelTest, UnsolvableDifferencesThrow) {
    ArimaModel model;
    EXPECT_THROW(model.fit({1, 1, 1, 1, 1, 1, 1, 6}), Nika::ModelingException);
    EXPECT_FALSE(model.fitted());
}

TEST(ArimaModelTest, ForecastBeforeFitThrows) {
    ArimaModel model;
    EXPECT_THROW(model.forecast(3), Nika::ModelingException);
}

TEST(ArimaModelTest, FitsWavySeriesWithBoundedCoefficients) {
    const std::vector<double> series = wavySeries(30);
    ArimaModel model;
    ASSERT_NO_THROW(model.fit(series));
    EXPECT_TRUE(model.fitted());
    EXPECT_LE(std::abs(model.phi()), ArimaModel::kCoefficientBound);
    EXPECT_LE(std::abs(model.theta()), ArimaModel::kCoefficientBound);
    EXPECT_GE(model.sigma2(), 0.0);

    const std::vector<double> out = model.forecast(6);
    ASSERT_EQ(out.size(), 6u);
    for (double v : out) EXPECT_TRUE(std::isfinite(v));
    EXPECT_TRUE(model.forecast(0).empty());
}

TEST(ArimaModelTest, LaterIncrementsScaleByPhi) {
    ArimaModel model;
    model.fit(wavySeries(40));
    const std::vector<double> out = model.forecast(4);
    ASSERT_EQ(out.size(), 4u);
    // Increment h+1 is phi times increment h.
    const double d1 = out[1] - out[0];
    const double d2 = out[2] - out[1];
    const double d3 = out[3] - out[2];
    EXPECT_NEAR(d2, model.phi() * d1, 1e-9);
    EXPECT_NEAR(d3, model.phi() * d2, 1e-9);
}
