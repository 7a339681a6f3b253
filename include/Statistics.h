#pragma once

#include <cstddef>
#include <optional>
#include <vector>

struct ColumnStats {
    double mean = 0.0;
    double median = 0.0;
    double variance = 0.0;   // population (divides by N)
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
    size_t count = 0;
};

namespace Statistics {
/**
 * @brief Descriptive stats over the finite entries of col.
 * @post Returns zero-initialized stats (count == 0) when no finite value exists.
 */
ColumnStats calculateStats(const std::vector<double>& col);

/**
 * @brief Pearson r over paired samples.
 * @pre x.size() == y.size().
 * @post std::nullopt when fewer than 2 pairs or either side is constant.
 */
std::optional<double> pearson(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Trailing rolling mean; element i averages values[i-window+1..i].
 * @post Empty when values.size() < window or window == 0.
 */
std::vector<double> rollingMean(const std::vector<double>& values, size_t window);
}
