#include "ForecastEngine.h"
#include "ArimaModel.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <numeric>

namespace {
// Explicit column when usable, else first datetime column, else -1 (positional axis).
int resolveTimeColumn(const TypedDataset& data, const std::string& timeColumn) {
    if (!timeColumn.empty()) {
        const int idx = data.findColumnIndex(timeColumn);
        if (idx < 0) return -1;
        const ColumnType type = data.columns()[static_cast<size_t>(idx)].type;
        return (type == ColumnType::DATETIME || type == ColumnType::NUMERIC) ? idx : -1;
    }
    const std::vector<size_t> datetimeIdx = data.datetimeColumnIndices();
    return datetimeIdx.empty() ? -1 : static_cast<int>(datetimeIdx.front());
}

double axisValue(const TypedColumn& col, size_t row) {
    if (col.type == ColumnType::DATETIME) {
        return static_cast<double>(std::get<std::vector<int64_t>>(col.values)[row]);
    }
    return std::get<std::vector<double>>(col.values)[row];
}
} // namespace

size_t ForecastEngine::movingAverageWindow(size_t n) noexcept {
    if (n < 2) return 2;
    return std::clamp<size_t>(n / 4, 2, 5);
}

std::vector<double> ForecastEngine::movingAverageForecast(const std::vector<double>& values, size_t horizon) {
    if (values.empty()) return {};
    const std::vector<double> rolling = Statistics::rollingMean(values, movingAverageWindow(values.size()));
    const double last = rolling.empty() ? values.back() : rolling.back();
    return std::vector<double>(horizon, last);
}

ForecastSeries ForecastEngine::buildSeries(const TypedDataset& data, size_t targetIdx, int timeIdx) {
    const TypedColumn& targetCol = data.columns()[targetIdx];
    const auto& target = std::get<std::vector<double>>(targetCol.values);

    ForecastSeries series;
    std::vector<std::pair<double, double>> points;
    if (timeIdx >= 0) {
        const TypedColumn& timeCol = data.columns()[static_cast<size_t>(timeIdx)];
        series.axisName = timeCol.name;
        for (size_t r = 0; r < data.rowCount(); ++r) {
            if (targetCol.isMissing(r) || timeCol.isMissing(r)) continue;
            points.push_back({axisValue(timeCol, r), target[r]});
        }
        std::stable_sort(points.begin(), points.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    } else {
        for (size_t r = 0; r < data.rowCount(); ++r) {
            if (targetCol.isMissing(r)) continue;
            points.push_back({static_cast<double>(points.size()), target[r]});
        }
    }

    series.axis.reserve(points.size());
    series.values.reserve(points.size());
    for (const auto& p : points) {
        series.axis.push_back(p.first);
        series.values.push_back(p.second);
    }

    // Regular when every step equals the first positive step.
    if (series.axis.size() >= 2) {
        double step = 0.0;
        for (size_t i = 1; i < series.axis.size() && step <= 0.0; ++i) {
            step = series.axis[i] - series.axis[i - 1];
        }
        if (step > 0.0) {
            series.inferredStep = step;
            series.regular = true;
            for (size_t i = 1; i < series.axis.size(); ++i) {
                if (series.axis[i] - series.axis[i - 1] != step) {
                    series.regular = false;
                    break;
                }
            }
        }
    }
    return series;
}

ForecastResult ForecastEngine::forecast(const TypedDataset& data,
                                        const std::string& target,
                                        const std::string& timeColumn,
                                        const ForecastOptions& options) {
    ForecastResult result;
    const int targetIdx = data.empty() ? -1 : data.findColumnIndex(target);
    if (targetIdx < 0) {
        result.message = kMissingTargetMessage;
        return result;
    }
    if (data.columns()[static_cast<size_t>(targetIdx)].type != ColumnType::NUMERIC) {
        result.message = "Target column '" + target + "' is not numeric.";
        return result;
    }

    result.series = buildSeries(data, static_cast<size_t>(targetIdx), resolveTimeColumn(data, timeColumn));
    const std::vector<double>& values = result.series.values;
    if (values.empty()) {
        result.message = "Target column '" + target + "' has no observations.";
        return result;
    }

    if (!options.arimaEnabled) {
        result.fallbackReason = "arima disabled";
    } else if (values.size() < ArimaModel::kMinObservations) {
        result.fallbackReason = "too few points (" + std::to_string(values.size()) + ")";
    } else {
        try {
            ArimaModel model;
            model.fit(values);
            result.forecast = model.forecast(options.horizon);
            result.strategy = "arima";
        } catch (const std::exception& e) {
            result.fallbackReason = e.what();
        }
    }

    if (result.strategy != "arima") {
        result.forecast = movingAverageForecast(values, options.horizon);
        result.strategy = "moving_average";
    }
    result.steps = options.horizon;
    return result;
}
