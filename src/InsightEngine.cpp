#include "InsightEngine.h"
#include "CommonUtils.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {
const std::vector<double>& numericValues(const TypedColumn& col) {
    return std::get<std::vector<double>>(col.values);
}

std::vector<double> presentValues(const TypedColumn& col) {
    const auto& values = numericValues(col);
    std::vector<double> out;
    out.reserve(values.size());
    for (size_t r = 0; r < values.size(); ++r) {
        if (!col.isMissing(r)) out.push_back(values[r]);
    }
    return out;
}

struct CorrelationPair {
    size_t a;
    size_t b;
    double absR;
};

// Pairwise-complete samples of two numeric columns.
void pairedValues(const TypedColumn& a, const TypedColumn& b, std::vector<double>& x, std::vector<double>& y) {
    const auto& va = numericValues(a);
    const auto& vb = numericValues(b);
    x.clear();
    y.clear();
    for (size_t r = 0; r < va.size(); ++r) {
        if (a.isMissing(r) || b.isMissing(r)) continue;
        x.push_back(va[r]);
        y.push_back(vb[r]);
    }
}
} // namespace

InsightReport InsightEngine::generate(const TypedDataset& data, const InsightOptions& options) {
    InsightReport report;
    if (data.empty()) return report;

    report.rowCount = data.rowCount();
    report.columnCount = data.colCount();

    auto append = [&report](std::vector<std::string>&& lines) {
        report.insights.insert(report.insights.end(),
                               std::make_move_iterator(lines.begin()),
                               std::make_move_iterator(lines.end()));
    };
    append(summaryInsights(data, options));
    append(trendInsights(data, options));
    append(correlationInsights(data));
    append(outlierInsights(data, options));
    return report;
}

std::vector<std::string> InsightEngine::summaryInsights(const TypedDataset& data, const InsightOptions& options) {
    std::vector<std::string> out;
    const std::vector<size_t> numericIdx = data.numericColumnIndices();
    const size_t limit = std::min(options.maxSummaryColumns, numericIdx.size());
    for (size_t i = 0; i < limit; ++i) {
        const TypedColumn& col = data.columns()[numericIdx[i]];
        const ColumnStats stats = Statistics::calculateStats(presentValues(col));
        if (stats.count == 0) continue;

        out.push_back("'" + col.name + "': mean=" + CommonUtils::formatFixed(stats.mean) +
                      ", median=" + CommonUtils::formatFixed(stats.median) +
                      ", std=" + CommonUtils::formatFixed(stats.stddev) +
                      ", min=" + CommonUtils::formatFixed(stats.min) +
                      ", max=" + CommonUtils::formatFixed(stats.max) + ".");
    }
    return out;
}

std::vector<std::string> InsightEngine::trendInsights(const TypedDataset& data, const InsightOptions& options) {
    const std::vector<size_t> datetimeIdx = data.datetimeColumnIndices();
    const std::vector<size_t> numericIdx = data.numericColumnIndices();
    if (datetimeIdx.empty() || numericIdx.empty()) return {};

    const TypedColumn& timeCol = data.columns()[datetimeIdx.front()];
    const TypedColumn& valueCol = data.columns()[numericIdx.front()];
    const auto& times = std::get<std::vector<int64_t>>(timeCol.values);
    const auto& values = numericValues(valueCol);

    std::vector<std::pair<int64_t, double>> points;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (timeCol.isMissing(r) || valueCol.isMissing(r)) continue;
        points.push_back({times[r], values[r]});
    }
    if (points.size() < options.minTrendPoints) return {};

    std::stable_sort(points.begin(), points.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

    const double first = points.front().second;
    const double last = points.back().second;
    // A zero baseline is replaced by 1.
    const double base = (first == 0.0) ? 1.0 : first;
    const double change = (last - first) / base * 100.0;

    return {"Time trend on '" + valueCol.name + "' shows a " + CommonUtils::formatFixed(change) + "% change from start to end."};
}

std::vector<std::string> InsightEngine::correlationInsights(const TypedDataset& data) {
    const std::vector<size_t> numericIdx = data.numericColumnIndices();
    if (numericIdx.size() < 2) return {};

    std::vector<CorrelationPair> pairs;
    std::vector<double> x;
    std::vector<double> y;
    for (size_t i = 0; i < numericIdx.size(); ++i) {
        for (size_t j = i + 1; j < numericIdx.size(); ++j) {
            pairedValues(data.columns()[numericIdx[i]], data.columns()[numericIdx[j]], x, y);
            // Columns identical on every shared row are duplicates, not findings.
            if (x == y) continue;
            const auto r = Statistics::pearson(x, y);
            if (!r.has_value()) continue;
            pairs.push_back({numericIdx[i], numericIdx[j], std::abs(*r)});
        }
    }
    if (pairs.empty()) return {};

    std::stable_sort(pairs.begin(), pairs.end(), [](const CorrelationPair& lhs, const CorrelationPair& rhs) {
        return lhs.absR > rhs.absR;
    });
    const CorrelationPair& best = pairs.front();
    return {"Strongest correlation: " + data.columns()[best.a].name + " ~ " + data.columns()[best.b].name +
            " (|r|=" + CommonUtils::formatFixed(best.absR) + ")."};
}

std::vector<std::string> InsightEngine::outlierInsights(const TypedDataset& data, const InsightOptions& options) {
    std::vector<std::string> out;
    const std::vector<size_t> numericIdx = data.numericColumnIndices();
    const size_t limit = std::min(options.maxOutlierColumns, numericIdx.size());
    for (size_t i = 0; i < limit; ++i) {
        const TypedColumn& col = data.columns()[numericIdx[i]];
        const std::vector<double> values = presentValues(col);
        if (values.size() < options.minOutlierSamples) continue;

        const double q1 = CommonUtils::quantileByNth(values, 0.25);
        const double q3 = CommonUtils::quantileByNth(values, 0.75);
        const double iqr = q3 - q1;
        const double lower = q1 - options.outlierIqrMultiplier * iqr;
        const double upper = q3 + options.outlierIqrMultiplier * iqr;

        const size_t outliers = static_cast<size_t>(std::count_if(values.begin(), values.end(), [&](double v) {
            return v < lower || v > upper;
        }));
        if (outliers > 0) {
            out.push_back(std::to_string(outliers) + " potential outliers detected in '" + col.name + "' via IQR fence.");
        }
    }
    return out;
}
