#pragma once
#include "TypedDataset.h"

#include <cstddef>
#include <string>
#include <vector>

struct InsightOptions {
    double outlierIqrMultiplier = 1.5;
    size_t maxSummaryColumns = 10;
    size_t maxOutlierColumns = 5;
    size_t minOutlierSamples = 8;
    size_t minTrendPoints = 4;
};

struct InsightReport {
    size_t rowCount = 0;
    size_t columnCount = 0;
    std::vector<std::string> insights;
};

class InsightEngine {
public:
    /**
     * @brief Produces the ordered findings for a typed table.
     * @details Order is fixed: per-column summaries, time trend, strongest correlation, IQR outliers.
     *          Each step is skipped independently when its preconditions do not hold.
     * @post Empty table yields zero counts and no insights.
     */
    static InsightReport generate(const TypedDataset& data, const InsightOptions& options = InsightOptions());

    static std::vector<std::string> summaryInsights(const TypedDataset& data, const InsightOptions& options);
    static std::vector<std::string> trendInsights(const TypedDataset& data, const InsightOptions& options);
    static std::vector<std::string> correlationInsights(const TypedDataset& data);
    static std::vector<std::string> outlierInsights(const TypedDataset& data, const InsightOptions& options);
};
