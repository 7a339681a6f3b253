#pragma once
#include "TypedDataset.h"

#include <cstddef>
#include <string>
#include <vector>

struct ForecastOptions {
    bool arimaEnabled = true;
    size_t horizon = 12;
};

/**
 * @brief Time-ordered target values plus the axis they were ordered by.
 */
struct ForecastSeries {
    std::vector<double> axis;
    std::vector<double> values;
    std::string axisName;          // column name, or empty for the positional axis
    bool regular = false;
    double inferredStep = 0.0;
};

struct ForecastResult {
    std::vector<double> forecast;
    size_t steps = 0;
    std::string message;           // set only when no projection was produced
    std::string strategy = "none"; // "arima", "moving_average" or "none"
    std::string fallbackReason;
    ForecastSeries series;

    bool hasForecast() const noexcept { return message.empty(); }
};

class ForecastEngine {
public:
    static constexpr const char* kMissingTargetMessage = "No data or missing target.";

    /**
     * @brief Projects target forward by options.horizon steps.
     * @details ARIMA(1,1,1) runs when enabled and at least 8 observations exist; any modeling
     *          failure degrades to a flat moving-average projection. Caller input problems
     *          (empty table, absent or non-numeric target, no observations) return a message
     *          and an empty forecast instead of throwing.
     * @param timeColumn optional explicit time axis; empty selects the first datetime column.
     */
    static ForecastResult forecast(const TypedDataset& data,
                                   const std::string& target,
                                   const std::string& timeColumn = "",
                                   const ForecastOptions& options = ForecastOptions());

    /**
     * @brief Ordered series for target; rows missing the target or the time value are dropped.
     * @pre target names a numeric column.
     */
    static ForecastSeries buildSeries(const TypedDataset& data, size_t targetIdx, int timeIdx);

    /**
     * @brief Flat projection of the last rolling mean (window clamp(n/4, 2, 5)).
     * @post Falls back to the last observation when the rolling mean is empty.
     */
    static std::vector<double> movingAverageForecast(const std::vector<double>& values, size_t horizon);

    static size_t movingAverageWindow(size_t n) noexcept;
};
