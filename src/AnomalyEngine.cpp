#include "AnomalyEngine.h"
#include "IsolationForest.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <exception>

std::vector<size_t> AnomalyEngine::resolveColumns(const TypedDataset& data, const std::vector<std::string>& requestedColumns) {
    if (requestedColumns.empty()) return data.numericColumnIndices();

    std::vector<size_t> out;
    for (const auto& name : requestedColumns) {
        const int idx = data.findColumnIndex(name);
        if (idx < 0) continue;
        const size_t col = static_cast<size_t>(idx);
        if (data.columns()[col].type != ColumnType::NUMERIC) continue;
        if (std::find(out.begin(), out.end(), col) == out.end()) out.push_back(col);
    }
    return out;
}

std::vector<size_t> AnomalyEngine::zScoreOutliers(const std::vector<std::vector<double>>& rows, double threshold, double epsilon) {
    std::vector<size_t> out;
    if (rows.empty()) return out;

    const size_t features = rows.front().size();
    std::vector<ColumnStats> stats(features);
    std::vector<double> column(rows.size());
    for (size_t f = 0; f < features; ++f) {
        for (size_t i = 0; i < rows.size(); ++i) column[i] = rows[i][f];
        stats[f] = Statistics::calculateStats(column);
    }

    for (size_t i = 0; i < rows.size(); ++i) {
        for (size_t f = 0; f < features; ++f) {
            const double z = (rows[i][f] - stats[f].mean) / (stats[f].stddev + epsilon);
            if (std::abs(z) > threshold) {
                out.push_back(i);
                break;
            }
        }
    }
    return out;
}

AnomalyResult AnomalyEngine::detect(const TypedDataset& data,
                                    const std::vector<std::string>& requestedColumns,
                                    const AnomalyOptions& options) {
    AnomalyResult result;
    if (data.empty()) return result;

    const std::vector<size_t> selected = resolveColumns(data, requestedColumns);
    if (selected.empty()) return result;
    for (size_t idx : selected) result.columns.push_back(data.columns()[idx].name);

    MissingMask keep(data.rowCount(), static_cast<uint8_t>(1));
    for (size_t idx : selected) {
        const TypedColumn& col = data.columns()[idx];
        for (size_t r = 0; r < data.rowCount(); ++r) {
            if (col.isMissing(r)) keep[r] = 0;
        }
    }
    const TypedDataset subset = data.select(selected, keep);
    result.rowsUsed = subset.rowCount();
    if (subset.rowCount() == 0) return result;

    std::vector<std::vector<double>> rows(subset.rowCount(), std::vector<double>(selected.size(), 0.0));
    for (size_t c = 0; c < subset.colCount(); ++c) {
        const auto& values = std::get<std::vector<double>>(subset.columns()[c].values);
        for (size_t r = 0; r < subset.rowCount(); ++r) rows[r][c] = values[r];
    }

    std::vector<size_t> positions;
    if (!options.isolationForestEnabled) {
        result.fallbackReason = "isolation forest disabled";
    } else {
        try {
            IsolationForest forest(options.isolationTrees, options.isolationMaxSamples, options.isolationSeed);
            forest.fit(rows);
            positions = forest.detect(rows);
            result.strategy = "isolation_forest";
        } catch (const std::exception& e) {
            result.fallbackReason = e.what();
        }
    }

    if (result.strategy != "isolation_forest") {
        positions = zScoreOutliers(rows, options.zThreshold, options.zEpsilon);
        result.strategy = "zscore";
    }

    const std::vector<size_t>& ids = subset.rowIds();
    result.anomalies.reserve(positions.size());
    for (size_t p : positions) result.anomalies.push_back(ids[p]);
    std::sort(result.anomalies.begin(), result.anomalies.end());
    return result;
}
