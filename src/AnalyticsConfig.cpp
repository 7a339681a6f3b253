#include "AnalyticsConfig.h"
#include "CommonUtils.h"
#include "NikaExceptions.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <unordered_map>

namespace {
const char* kUsage =
    "Usage: nika-analytics serve [options] | nika-analytics run <insights|forecast|anomaly|query> <request.json> [options]\n"
    "Options: [--config path] [--host H] [--port N] [--threads N] [--date-locale auto|dmy|mdy] [--verbose true|false] "
    "[--disable-arima] [--disable-isolation-forest] [--isolation-trees N] [--isolation-max-samples N] [--isolation-seed N] "
    "[--anomaly-z-threshold >0] [--anomaly-z-epsilon >0] [--outlier-iqr-multiplier >0]";

template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Nika::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Nika::NikaException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Nika::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Nika::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw Nika::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw Nika::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < minValue) {
        throw Nika::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Nika::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

void assignKeyValue(AnalyticsConfig& config, const std::string& key, const std::string& value) {
    if (key == "host") {
        config.host = value;
        return;
    }
    if (key == "port") {
        config.port = parseIntStrict(value, "port", 1);
        return;
    }
    if (key == "threads") {
        config.threadCount = static_cast<size_t>(parseIntStrict(value, "threads", 1));
        return;
    }
    if (key == "date_locale" || key == "date_locale_hint") {
        config.dateLocaleHint = CommonUtils::toLower(value);
        return;
    }
    if (key == "isolation_seed") {
        config.tuning.isolationSeed = parseUIntStrict(value, "isolation_seed");
        return;
    }

    struct SizeRule {
        size_t AnalyticsTuning::*member;
        int minValue;
    };
    struct DoubleRule {
        double AnalyticsTuning::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, bool AnalyticsConfig::*> boolFields = {
        {"verbose", &AnalyticsConfig::verbose},
        {"arima", &AnalyticsConfig::arimaEnabled},
        {"isolation_forest", &AnalyticsConfig::isolationForestEnabled}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"isolation_trees", {&AnalyticsTuning::isolationTrees, 1}},
        {"isolation_max_samples", {&AnalyticsTuning::isolationMaxSamples, 2}}
    };
    static const std::unordered_map<std::string, DoubleRule> doubleFields = {
        {"anomaly_z_threshold", {&AnalyticsTuning::anomalyZThreshold, 0.0}},
        {"anomaly_z_epsilon", {&AnalyticsTuning::anomalyZEpsilon, 0.0}},
        {"outlier_iqr_multiplier", {&AnalyticsTuning::outlierIqrMultiplier, 0.0}}
    };

    if (auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.tuning.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.tuning.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    throw Nika::ConfigurationException("Unknown config key: " + key);
}
} // namespace

TypedDataset::DateLocaleHint AnalyticsConfig::localeHint() const {
    if (dateLocaleHint == "dmy") return TypedDataset::DateLocaleHint::DMY;
    if (dateLocaleHint == "mdy") return TypedDataset::DateLocaleHint::MDY;
    return TypedDataset::DateLocaleHint::AUTO;
}

AnalyticsConfig AnalyticsConfig::fromArgs(int argc, char* argv[]) {
    std::vector<std::string> args;
    args.reserve(static_cast<size_t>(std::max(0, argc)));
    for (int i = 0; i < argc; ++i) args.emplace_back(argv[i]);
    return fromArgs(args);
}

AnalyticsConfig AnalyticsConfig::fromArgs(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        throw Nika::ConfigurationException(kUsage);
    }

    AnalyticsConfig config;
    config.mode = CommonUtils::toLower(args[1]);
    size_t i = 2;
    if (config.mode == "run") {
        if (args.size() < 4) {
            throw Nika::ConfigurationException(kUsage);
        }
        config.operation = CommonUtils::toLower(args[2]);
        config.requestPath = args[3];
        i = 4;
    } else if (config.mode != "serve") {
        throw Nika::ConfigurationException(kUsage);
    }

    std::string configPath;
    const size_t argc = args.size();
    for (; i < argc; ++i) {
        const std::string& arg = args[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = args[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            config.host = args[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            config.port = parseIntStrict(args[++i], "--port", 1);
        } else if (arg == "--threads" && i + 1 < argc) {
            config.threadCount = static_cast<size_t>(parseIntStrict(args[++i], "--threads", 1));
        } else if (arg == "--date-locale" && i + 1 < argc) {
            config.dateLocaleHint = CommonUtils::toLower(args[++i]);
        } else if (arg == "--verbose" && i + 1 < argc) {
            config.verbose = parseBoolStrict(args[++i], "--verbose");
        } else if (arg == "--disable-arima") {
            config.arimaEnabled = false;
        } else if (arg == "--disable-isolation-forest") {
            config.isolationForestEnabled = false;
        } else if (arg == "--isolation-trees" && i + 1 < argc) {
            config.tuning.isolationTrees = static_cast<size_t>(parseIntStrict(args[++i], "--isolation-trees", 1));
        } else if (arg == "--isolation-max-samples" && i + 1 < argc) {
            config.tuning.isolationMaxSamples = static_cast<size_t>(parseIntStrict(args[++i], "--isolation-max-samples", 2));
        } else if (arg == "--isolation-seed" && i + 1 < argc) {
            config.tuning.isolationSeed = parseUIntStrict(args[++i], "--isolation-seed");
        } else if (arg == "--anomaly-z-threshold" && i + 1 < argc) {
            config.tuning.anomalyZThreshold = parseDoubleStrict(args[++i], "--anomaly-z-threshold", 0.0);
        } else if (arg == "--anomaly-z-epsilon" && i + 1 < argc) {
            config.tuning.anomalyZEpsilon = parseDoubleStrict(args[++i], "--anomaly-z-epsilon", 0.0);
        } else if (arg == "--outlier-iqr-multiplier" && i + 1 < argc) {
            config.tuning.outlierIqrMultiplier = parseDoubleStrict(args[++i], "--outlier-iqr-multiplier", 0.0);
        } else {
            throw Nika::ConfigurationException("Unknown or incomplete argument: " + arg + "\n" + kUsage);
        }
    }

    if (!configPath.empty()) {
        config = fromFile(configPath, config);
    }

    config.validate();
    return config;
}

AnalyticsConfig AnalyticsConfig::fromFile(const std::string& configPath, const AnalyticsConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Nika::ConfigurationException("Could not open config file: " + configPath);

    AnalyticsConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Nika::NikaException& ex) {
            throw Nika::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void AnalyticsConfig::validate() const {
    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(mode, {"serve", "run"})) {
        throw Nika::ConfigurationException("mode must be one of: serve, run");
    }
    if (mode == "run") {
        if (!isIn(operation, {"insights", "forecast", "anomaly", "query"})) {
            throw Nika::ConfigurationException("operation must be one of: insights, forecast, anomaly, query");
        }
        if (requestPath.empty()) {
            throw Nika::ConfigurationException("run mode requires a request file path");
        }
    }
    if (host.empty()) {
        throw Nika::ConfigurationException("host cannot be empty");
    }
    if (port < 1 || port > 65535) {
        throw Nika::ConfigurationException("port must be within [1, 65535]");
    }
    if (threadCount < 1) {
        throw Nika::ConfigurationException("threads must be >= 1");
    }
    if (!isIn(dateLocaleHint, {"auto", "dmy", "mdy"})) {
        throw Nika::ConfigurationException("date_locale must be one of: auto, dmy, mdy");
    }
    if (tuning.isolationTrees < 1) {
        throw Nika::ConfigurationException("isolation_trees must be >= 1");
    }
    if (tuning.isolationMaxSamples < 2) {
        throw Nika::ConfigurationException("isolation_max_samples must be >= 2");
    }
    if (tuning.anomalyZThreshold <= 0.0) {
        throw Nika::ConfigurationException("anomaly_z_threshold must be > 0");
    }
    if (tuning.anomalyZEpsilon <= 0.0) {
        throw Nika::ConfigurationException("anomaly_z_epsilon must be > 0");
    }
    if (tuning.outlierIqrMultiplier <= 0.0) {
        throw Nika::ConfigurationException("outlier_iqr_multiplier must be > 0");
    }
}

AnalyticsCapabilities AnalyticsCapabilities::resolve(const AnalyticsConfig& config) {
    AnalyticsCapabilities caps;
    caps.arima = config.arimaEnabled;
    caps.isolationForest = config.isolationForestEnabled;
    return caps;
}
