#include "AnalyticsService.h"

#include "AnomalyEngine.h"
#include "ForecastEngine.h"
#include "InsightEngine.h"
#include "JsonValue.h"
#include "NikaExceptions.h"
#include "Record.h"
#include "TypedDataset.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace {
using Clock = std::chrono::steady_clock;

constexpr size_t kQueryPreviewRows = 10;

RawScalar scalarFromJson(const JsonValue& value) {
    switch (value.type) {
        case JsonValue::Type::Null: return std::monostate{};
        case JsonValue::Type::Bool: return value.booleanValue;
        case JsonValue::Type::Number: return value.numberValue;
        case JsonValue::Type::String: return value.stringValue;
        case JsonValue::Type::Array:
        case JsonValue::Type::Object: return value.dump();
    }
    return std::monostate{};
}

JsonValue scalarToJson(const RawScalar& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        JsonValue out;
        out.type = JsonValue::Type::Bool;
        out.booleanValue = *b;
        return out;
    }
    if (const auto* d = std::get_if<double>(&value)) return JsonValue::makeNumber(*d);
    if (const auto* s = std::get_if<std::string>(&value)) return JsonValue::makeString(*s);
    return JsonValue{};
}

JsonValue parseRequestObject(const std::string& body) {
    JsonValue payload = parseJsonText(body);
    if (!payload.isObject()) {
        throw Nika::RequestException("Request body must be a JSON object");
    }
    return payload;
}

std::vector<Record> recordsFromRequest(const JsonValue& payload) {
    const JsonValue* dataNode = payload.find("data");
    if (dataNode == nullptr || !dataNode->isArray()) {
        throw Nika::RequestException("Request requires 'data' array of row objects");
    }

    std::vector<Record> records;
    records.reserve(dataNode->arrayValue.size());
    for (size_t i = 0; i < dataNode->arrayValue.size(); ++i) {
        const JsonValue& row = dataNode->arrayValue[i];
        if (!row.isObject()) {
            throw Nika::RequestException("data[" + std::to_string(i) + "] must be an object");
        }
        Record record;
        record.reserve(row.objectValue.size());
        for (const auto& kv : row.objectValue) {
            record.push_back({kv.first, scalarFromJson(kv.second)});
        }
        records.push_back(std::move(record));
    }
    return records;
}

// Optional string field; absent or null yields empty.
std::string optionalString(const JsonValue& payload, const std::string& key) {
    const JsonValue* node = payload.find(key);
    if (node == nullptr || node->isNull()) return "";
    if (!node->isString()) {
        throw Nika::RequestException("'" + key + "' must be a string");
    }
    return node->stringValue;
}

JsonValue numberArray(const std::vector<double>& values) {
    JsonValue out = JsonValue::makeArray();
    for (double v : values) out.push(JsonValue::makeNumber(v));
    return out;
}

std::string buildQueryPrompt(const std::vector<Record>& records, const std::string& question) {
    std::vector<std::string> schema;
    std::unordered_set<std::string> seen;
    for (const auto& record : records) {
        for (const auto& field : record) {
            if (seen.insert(field.name).second) schema.push_back(field.name);
        }
    }

    JsonValue schemaJson = JsonValue::makeArray();
    for (const auto& name : schema) schemaJson.push(JsonValue::makeString(name));

    JsonValue preview = JsonValue::makeArray();
    const size_t previewRows = std::min(kQueryPreviewRows, records.size());
    for (size_t i = 0; i < previewRows; ++i) {
        JsonValue row = JsonValue::makeObject();
        for (const auto& field : records[i]) row.set(field.name, scalarToJson(field.value));
        preview.push(std::move(row));
    }

    std::ostringstream prompt;
    prompt << "You are an AI data analyst.\n"
           << "Dataset schema: " << schemaJson.dump() << "\n"
           << "Sample rows (first " << kQueryPreviewRows << "): " << preview.dump() << "\n"
           << "User question: " << question << "\n\n"
           << "Task:\n"
           << "1) Provide a concise, business-friendly answer.\n"
           << "2) Suggest up to 3 useful visualizations based on the data and question.\n"
           << "3) Each suggestion must include fields: type (bar/line/pie/scatter/table/none), x, y, category (nullable).\n\n"
           << "Respond with JSON ONLY in this exact structure:\n"
           << "{\"answer\": \"...\", \"suggestions\": [{\"type\": \"bar/line/pie/scatter/table/none\", "
           << "\"x\": \"column_name or null\", \"y\": \"column_name or null\", \"category\": \"column_name or null\"}]}\n";
    return prompt.str();
}

std::string makeQueryFallback(const std::string& reason) {
    JsonValue out = JsonValue::makeObject();
    out.set("answer", JsonValue::makeString("Could not process query: " + reason));
    out.set("suggestions", JsonValue::makeArray());
    return out.dump();
}

std::string makeErrorResponse(const std::string& error, double latencyMs) {
    std::ostringstream out;
    out << "{"
        << "\"error\":\"" << escapeJsonString(error) << "\","
        << "\"latency_ms\":" << formatJsonNumber(latencyMs)
        << "}";
    return out.str();
}

long long toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<long long>(std::llround(latencyMs * 1000.0));
}

void logMonitoringLine(std::ostream& log,
                       const std::string& endpoint,
                       const std::string& strategy,
                       double latencyMs,
                       const MonitoringSnapshot& snapshot) {
    std::ostringstream line;
    line << "[NikaService][Monitor] endpoint=" << endpoint
         << " strategy=" << (strategy.empty() ? "none" : strategy)
         << " total_requests=" << snapshot.totalRequests
         << " errors=" << snapshot.errorRequests
         << " fallbacks=" << snapshot.fallbackRequests
         << " latency_ms=" << latencyMs
         << " avg_latency_ms=" << snapshot.averageLatencyMs
         << "\n";
    log << line.str();
}
} // namespace

void RequestMonitor::countEndpoint(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(endpointMutex);
    endpointRequests[endpoint] += 1;
}

void RequestMonitor::recordSuccess(const std::string& endpoint, double latencyMs, bool usedFallback) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    if (usedFallback) {
        fallbackRequests.fetch_add(1, std::memory_order_relaxed);
    }
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
    countEndpoint(endpoint);
}

void RequestMonitor::recordError(const std::string& endpoint, double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    errorRequests.fetch_add(1, std::memory_order_relaxed);
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
    countEndpoint(endpoint);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);
    out.fallbackRequests = fallbackRequests.load(std::memory_order_relaxed);

    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }

    std::lock_guard<std::mutex> lock(endpointMutex);
    out.endpointRequests = endpointRequests;
    return out;
}

AnalyticsService::AnalyticsService(const AnalyticsConfig& config,
                                   RequestMonitor& monitor,
                                   std::shared_ptr<QueryAssistant> assistant,
                                   std::ostream& log)
    : config_(config),
      capabilities_(AnalyticsCapabilities::resolve(config)),
      monitor_(monitor),
      assistant_(std::move(assistant)),
      log_(log) {}

ServiceResponse AnalyticsService::handleInsights(const std::string& body) const {
    const JsonValue payload = parseRequestObject(body);
    const TypedDataset data = TypedDataset::fromRecords(recordsFromRequest(payload), config_.localeHint());

    InsightOptions options;
    options.outlierIqrMultiplier = config_.tuning.outlierIqrMultiplier;
    const InsightReport report = InsightEngine::generate(data, options);

    JsonValue out = JsonValue::makeObject();
    out.set("row_count", JsonValue::makeNumber(static_cast<double>(report.rowCount)));
    out.set("column_count", JsonValue::makeNumber(static_cast<double>(report.columnCount)));
    JsonValue insights = JsonValue::makeArray();
    for (const auto& line : report.insights) insights.push(JsonValue::makeString(line));
    out.set("insights", std::move(insights));

    ServiceResponse response;
    response.body = out.dump();
    response.strategy = "descriptive";
    return response;
}

ServiceResponse AnalyticsService::handleForecast(const std::string& body) const {
    const JsonValue payload = parseRequestObject(body);
    const TypedDataset data = TypedDataset::fromRecords(recordsFromRequest(payload), config_.localeHint());
    const std::string target = optionalString(payload, "target_column");
    const std::string dateColumn = optionalString(payload, "date_column");

    ForecastOptions options;
    options.arimaEnabled = capabilities_.arima;
    const ForecastResult result = ForecastEngine::forecast(data, target, dateColumn, options);

    JsonValue out = JsonValue::makeObject();
    if (!result.hasForecast()) {
        out.set("message", JsonValue::makeString(result.message));
        out.set("forecast", JsonValue::makeArray());
    } else {
        out.set("forecast", numberArray(result.forecast));
        out.set("steps", JsonValue::makeNumber(static_cast<double>(result.steps)));
    }

    ServiceResponse response;
    response.body = out.dump();
    response.strategy = result.strategy;
    response.fallbackReason = result.fallbackReason;
    return response;
}

ServiceResponse AnalyticsService::handleAnomaly(const std::string& body) const {
    const JsonValue payload = parseRequestObject(body);
    const TypedDataset data = TypedDataset::fromRecords(recordsFromRequest(payload), config_.localeHint());

    std::vector<std::string> columns;
    if (const JsonValue* node = payload.find("numeric_columns"); node != nullptr && !node->isNull()) {
        if (!node->isArray()) {
            throw Nika::RequestException("'numeric_columns' must be an array of strings");
        }
        for (const auto& item : node->arrayValue) {
            if (!item.isString()) {
                throw Nika::RequestException("'numeric_columns' must contain strings only");
            }
            columns.push_back(item.stringValue);
        }
    }

    AnomalyOptions options;
    options.isolationForestEnabled = capabilities_.isolationForest;
    options.isolationTrees = config_.tuning.isolationTrees;
    options.isolationMaxSamples = config_.tuning.isolationMaxSamples;
    options.isolationSeed = config_.tuning.isolationSeed;
    options.zThreshold = config_.tuning.anomalyZThreshold;
    options.zEpsilon = config_.tuning.anomalyZEpsilon;
    const AnomalyResult result = AnomalyEngine::detect(data, columns, options);

    JsonValue ids = JsonValue::makeArray();
    for (size_t id : result.anomalies) ids.push(JsonValue::makeNumber(static_cast<double>(id)));
    JsonValue out = JsonValue::makeObject();
    out.set("anomalies", std::move(ids));

    ServiceResponse response;
    response.body = out.dump();
    response.strategy = result.strategy;
    response.fallbackReason = result.fallbackReason;
    return response;
}

ServiceResponse AnalyticsService::handleQuery(const std::string& body) const {
    const JsonValue payload = parseRequestObject(body);
    const std::vector<Record> records = recordsFromRequest(payload);
    const JsonValue* questionNode = payload.find("question");
    if (questionNode == nullptr || !questionNode->isString()) {
        throw Nika::RequestException("Request requires string field 'question'");
    }

    ServiceResponse response;
    if (!assistant_) {
        response.strategy = "fallback";
        response.fallbackReason = "no query assistant configured";
        response.body = makeQueryFallback(response.fallbackReason);
        return response;
    }

    try {
        const std::string reply = assistant_->complete(buildQueryPrompt(records, questionNode->stringValue));
        const JsonValue parsed = parseJsonText(reply);
        if (!parsed.isObject()) {
            throw Nika::RequestException("assistant reply is not a JSON object");
        }
        response.strategy = "assistant";
        response.body = parsed.dump();
    } catch (const std::exception& e) {
        response.strategy = "fallback";
        response.fallbackReason = e.what();
        response.body = makeQueryFallback(response.fallbackReason);
    }
    return response;
}

ServiceResponse AnalyticsService::handle(const std::string& endpoint, const std::string& body) {
    const auto started = Clock::now();
    ServiceResponse response;
    try {
        if (endpoint == "/api/insights") {
            response = handleInsights(body);
        } else if (endpoint == "/api/forecast") {
            response = handleForecast(body);
        } else if (endpoint == "/api/anomaly") {
            response = handleAnomaly(body);
        } else if (endpoint == "/api/query") {
            response = handleQuery(body);
        } else {
            throw Nika::RequestException("Unknown endpoint: " + endpoint);
        }

        const double latencyMs = std::chrono::duration<double, std::milli>(Clock::now() - started).count();
        monitor_.recordSuccess(endpoint, latencyMs, !response.fallbackReason.empty());
        if (config_.verbose && !response.fallbackReason.empty()) {
            log_ << ("[NikaService][Fallback] endpoint=" + endpoint + " reason=" + response.fallbackReason + "\n");
        }
        logMonitoringLine(log_, endpoint, response.strategy, latencyMs, monitor_.snapshot());
    } catch (const std::exception& e) {
        const double latencyMs = std::chrono::duration<double, std::milli>(Clock::now() - started).count();
        monitor_.recordError(endpoint, latencyMs);
        response = ServiceResponse{};
        response.status = 400;
        response.strategy = "error";
        response.body = makeErrorResponse(e.what(), latencyMs);
        logMonitoringLine(log_, endpoint, response.strategy, latencyMs, monitor_.snapshot());
    }
    return response;
}
