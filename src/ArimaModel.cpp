#include "ArimaModel.h"
#include "MathUtils.h"
#include "NikaExceptions.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace {
// Long-AR order for the innovation stage, bounded by the differenced length.
size_t longArOrder(size_t m) {
    const size_t byLength = (m >= 2) ? (m - 2) / 3 : 0;
    return std::max<size_t>(1, std::min<size_t>(4, byLength));
}

// Residuals of the highest-order long autoregression that is full rank, starting at order k.
std::vector<double> innovationEstimates(const std::vector<double>& d, size_t k) {
    const size_t m = d.size();
    for (size_t order = k; order >= 1; --order) {
        const size_t rows = m - order;
        MathUtils::Matrix X(rows, order);
        MathUtils::Matrix Y(rows, 1);
        for (size_t t = order; t < m; ++t) {
            for (size_t j = 1; j <= order; ++j) X.at(t - order, j - 1) = d[t - j];
            Y.at(t - order, 0) = d[t];
        }

        const std::vector<double> a = MathUtils::multipleLinearRegression(X, Y);
        if (a.size() != order) continue;

        std::vector<double> eps(m, 0.0);
        for (size_t t = order; t < m; ++t) {
            double pred = 0.0;
            for (size_t j = 1; j <= order; ++j) pred += a[j - 1] * d[t - j];
            eps[t] = d[t] - pred;
        }
        return eps;
    }
    throw Nika::ModelingException("long autoregression is rank deficient at every order up to " + std::to_string(k));
}

// AR(1) on the differences with theta fixed at zero.
double fitPhiOnly(const std::vector<double>& d) {
    const size_t m = d.size();
    MathUtils::Matrix X(m - 1, 1);
    MathUtils::Matrix Y(m - 1, 1);
    for (size_t t = 1; t < m; ++t) {
        X.at(t - 1, 0) = d[t - 1];
        Y.at(t - 1, 0) = d[t];
    }
    const std::vector<double> beta = MathUtils::multipleLinearRegression(X, Y);
    if (beta.size() != 1 || !std::isfinite(beta[0])) {
        throw Nika::ModelingException("AR(1) regression on differenced series is rank deficient");
    }
    return beta[0];
}

double maxAbs(const std::vector<double>& values) {
    double out = 0.0;
    for (double v : values) out = std::max(out, std::abs(v));
    return out;
}
} // namespace

void ArimaModel::fit(const std::vector<double>& series) {
    fitted_ = false;
    const size_t n = series.size();
    if (n < kMinObservations) {
        throw Nika::ModelingException("ARIMA(1,1,1) needs at least " + std::to_string(kMinObservations) +
                                      " observations, got " + std::to_string(n));
    }
    for (double v : series) {
        if (!std::isfinite(v)) throw Nika::ModelingException("series contains non-finite values");
    }

    std::vector<double> d(n - 1, 0.0);
    for (size_t i = 1; i < n; ++i) d[i - 1] = series[i] - series[i - 1];
    const size_t m = d.size();

    // Constant increments: pure drift, continued exactly.
    const double scale = std::max(1.0, maxAbs(d));
    const bool constantSteps = std::all_of(d.begin(), d.end(), [&](double v) {
        return std::abs(v - d.front()) <= kDriftTolerance * scale;
    });
    if (constantSteps) {
        phi_ = 1.0;
        theta_ = 0.0;
        sigma2_ = 0.0;
        lastLevel_ = series.back();
        lastDiff_ = d.back();
        lastResidual_ = 0.0;
        fitted_ = true;
        return;
    }

    const size_t k = longArOrder(m);
    const std::vector<double> eps = innovationEstimates(d, k);

    std::vector<double> beta;
    if (maxAbs(eps) > kDriftTolerance * scale) {
        // Stage two: d_t = phi * d_{t-1} + theta * e_{t-1}
        const size_t start = k + 1;
        MathUtils::Matrix X(m - start, 2);
        MathUtils::Matrix Y(m - start, 1);
        for (size_t t = start; t < m; ++t) {
            X.at(t - start, 0) = d[t - 1];
            X.at(t - start, 1) = eps[t - 1];
            Y.at(t - start, 0) = d[t];
        }
        beta = MathUtils::multipleLinearRegression(X, Y);
    }
    // Innovations that vanish or track the lag carry no MA signal.
    if (beta.size() != 2) {
        beta = {fitPhiOnly(d), 0.0};
    }
    if (!std::isfinite(beta[0]) || !std::isfinite(beta[1])) {
        throw Nika::ModelingException("ARMA(1,1) coefficients are not finite");
    }

    phi_ = std::clamp(beta[0], -kCoefficientBound, kCoefficientBound);
    theta_ = std::clamp(beta[1], -kCoefficientBound, kCoefficientBound);

    // CSS residuals with e_0 = 0
    std::vector<double> resid(m, 0.0);
    double sse = 0.0;
    for (size_t t = 1; t < m; ++t) {
        resid[t] = d[t] - phi_ * d[t - 1] - theta_ * resid[t - 1];
        sse += resid[t] * resid[t];
    }
    sigma2_ = (m > 1) ? sse / static_cast<double>(m - 1) : 0.0;
    if (!std::isfinite(sigma2_)) {
        throw Nika::ModelingException("conditional residuals diverged");
    }

    lastLevel_ = series.back();
    lastDiff_ = d.back();
    lastResidual_ = resid.back();
    fitted_ = true;
}

std::vector<double> ArimaModel::forecast(size_t horizon) const {
    if (!fitted_) throw Nika::ModelingException("forecast requested before fit");

    std::vector<double> out;
    out.reserve(horizon);
    double level = lastLevel_;
    double diff = phi_ * lastDiff_ + theta_ * lastResidual_;
    for (size_t h = 0; h < horizon; ++h) {
        if (h > 0) diff = phi_ * diff;
        level += diff;
        if (!std::isfinite(level)) throw Nika::ModelingException("forecast diverged at step " + std::to_string(h + 1));
        out.push_back(level);
    }
    return out;
}
