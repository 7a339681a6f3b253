#pragma once
#include "TypedDataset.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct AnalyticsTuning {
    // Isolation forest ensemble size and per-tree sample cap.
    size_t isolationTrees = 100;
    size_t isolationMaxSamples = 256;
    uint32_t isolationSeed = 42;

    // z-score fallback: |z| threshold and denominator guard.
    double anomalyZThreshold = 3.0;
    double anomalyZEpsilon = 1e-9;

    // Tukey fence multiplier for the outlier insight.
    double outlierIqrMultiplier = 1.5;
};

struct AnalyticsConfig {
    std::string mode;              // serve|run
    std::string operation;         // insights|forecast|anomaly|query (run mode)
    std::string requestPath;       // request JSON file (run mode)

    std::string host = "0.0.0.0";
    int port = 8000;
    size_t threadCount = 8;
    std::string dateLocaleHint = "auto"; // auto|dmy|mdy
    bool verbose = false;

    bool arimaEnabled = true;
    bool isolationForestEnabled = true;

    AnalyticsTuning tuning;

    TypedDataset::DateLocaleHint localeHint() const;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argv[1] is the mode (serve|run); run mode takes <operation> <request.json> next.
     * @post Returns a validated config object.
     * @throws Nika::ConfigurationException on invalid arguments or values.
     */
    static AnalyticsConfig fromArgs(int argc, char* argv[]);
    static AnalyticsConfig fromArgs(const std::vector<std::string>& args);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws Nika::ConfigurationException on parse/validation failures.
     */
    static AnalyticsConfig fromFile(const std::string& configPath, const AnalyticsConfig& base);

    /**
     * @brief Validates ranges and enum-like fields.
     * @throws Nika::ConfigurationException on invalid values.
     */
    void validate() const;
};

/**
 * @brief Modeling capabilities resolved once at startup; engines only read these flags.
 */
struct AnalyticsCapabilities {
    bool arima = true;
    bool isolationForest = true;

    static AnalyticsCapabilities resolve(const AnalyticsConfig& config);
};
