#pragma once
#include "TypedDataset.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct AnomalyOptions {
    bool isolationForestEnabled = true;
    size_t isolationTrees = 100;
    size_t isolationMaxSamples = 256;
    uint32_t isolationSeed = 42;
    double zThreshold = 3.0;
    double zEpsilon = 1e-9;
};

struct AnomalyResult {
    std::vector<size_t> anomalies;   // original row identifiers, ascending
    std::vector<std::string> columns;
    size_t rowsUsed = 0;
    std::string strategy = "none";   // "isolation_forest", "zscore" or "none"
    std::string fallbackReason;
};

class AnomalyEngine {
public:
    /**
     * @brief Flags anomalous rows over the selected numeric columns.
     * @details Rows missing any selected value are dropped locally; identifiers of the
     *          remaining rows are preserved so results refer to the caller's input positions.
     * @param requestedColumns empty selects every numeric column; absent or non-numeric
     *        names are ignored and duplicates collapse.
     */
    static AnomalyResult detect(const TypedDataset& data,
                                const std::vector<std::string>& requestedColumns = {},
                                const AnomalyOptions& options = AnomalyOptions());

    static std::vector<size_t> resolveColumns(const TypedDataset& data, const std::vector<std::string>& requestedColumns);

    /**
     * @brief Positions whose |z| exceeds threshold in any column, z = (v - mean) / (pop_std + epsilon).
     */
    static std::vector<size_t> zScoreOutliers(const std::vector<std::vector<double>>& rows, double threshold, double epsilon);
};
