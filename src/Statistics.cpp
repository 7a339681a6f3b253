#include "Statistics.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    ColumnStats stats;
    if (col.empty()) return stats;

    std::vector<double> finite;
    finite.reserve(col.size());
    for (double value : col) {
        if (std::isfinite(value)) {
            finite.push_back(value);
        }
    }
    if (finite.empty()) return stats;

    double mean = 0.0;
    double m2 = 0.0;
    size_t count = 0;
    for (double value : finite) {
        ++count;
        double delta = value - mean;
        mean += delta / static_cast<double>(count);
        double delta2 = value - mean;
        m2 += delta * delta2;
    }
    stats.count = count;
    stats.mean = mean;
    stats.variance = m2 / static_cast<double>(count);
    stats.stddev = std::sqrt(stats.variance);

    const auto [minIt, maxIt] = std::minmax_element(finite.begin(), finite.end());
    stats.min = *minIt;
    stats.max = *maxIt;
    stats.median = CommonUtils::medianByNth(std::move(finite));
    return stats;
}

std::optional<double> Statistics::pearson(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;

    const ColumnStats sx = calculateStats(x);
    const ColumnStats sy = calculateStats(y);
    if (sx.count != x.size() || sy.count != y.size()) return std::nullopt;
    if (sx.stddev <= 0.0 || sy.stddev <= 0.0) return std::nullopt;

    double cov = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        cov += (x[i] - sx.mean) * (y[i] - sy.mean);
    }
    cov /= static_cast<double>(x.size());

    const double r = cov / (sx.stddev * sy.stddev);
    if (!std::isfinite(r)) return std::nullopt;
    return std::clamp(r, -1.0, 1.0);
}

std::vector<double> Statistics::rollingMean(const std::vector<double>& values, size_t window) {
    std::vector<double> out;
    if (window == 0 || values.size() < window) return out;

    out.reserve(values.size() - window + 1);
    long double sum = 0.0L;
    for (size_t i = 0; i < values.size(); ++i) {
        sum += values[i];
        if (i >= window) sum -= values[i - window];
        if (i + 1 >= window) out.push_back(static_cast<double>(sum / static_cast<long double>(window)));
    }
    return out;
}
