#include "MathUtils.h"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {
MathUtils::Matrix designMatrix(const std::vector<std::vector<double>>& rows) {
    MathUtils::Matrix m(rows.size(), rows.front().size());
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t c = 0; c < rows[r].size(); ++c) m.at(r, c) = rows[r][c];
    }
    return m;
}
}

TEST(MathUtilsTest, RegressionRecoversExactCoefficients) {
    const MathUtils::Matrix X = designMatrix({{1, 0}, {1, 1}, {1, 2}, {1, 3}, {1, 4}});
    const MathUtils::Matrix Y = designMatrix({{1}, {3}, {5}, {7}, {9}});
    const std::vector<double> beta = MathUtils::multipleLinearRegression(X, Y);
    ASSERT_EQ(beta.size(), 2u);
    EXPECT_NEAR(beta[0], 1.0, 1e-10);
    EXPECT_NEAR(beta[1], 2.0, 1e-10);
}

TEST(MathUtilsTest, RegressionReturnsEmptyWhenUnsolvable) {
    const MathUtils::Matrix wide = designMatrix({{1, 2, 3}});
    EXPECT_TRUE(MathUtils::multipleLinearRegression(wide, designMatrix({{1}})).empty());

    const MathUtils::Matrix collinear = designMatrix({{0, 0}, {0, 0}, {0, 0}});
    EXPECT_TRUE(MathUtils::multipleLinearRegression(collinear, designMatrix({{1}, {2}, {3}})).empty());

    EXPECT_THROW(MathUtils::multipleLinearRegression(collinear, designMatrix({{1}})), std::invalid_argument);
}

TEST(MathUtilsTest, MultiplyChecksShapes) {
    const MathUtils::Matrix a = designMatrix({{1, 2}, {3, 4}});
    const MathUtils::Matrix b = designMatrix({{5}, {6}});
    const MathUtils::Matrix product = a.multiply(b);
    EXPECT_DOUBLE_EQ(product.at(0, 0), 17.0);
    EXPECT_DOUBLE_EQ(product.at(1, 0), 39.0);
    EXPECT_THROW(b.multiply(b), std::invalid_argument);
    EXPECT_DOUBLE_EQ(a.transpose().at(0, 1), 3.0);
}
