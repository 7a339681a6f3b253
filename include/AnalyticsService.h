#pragma once

#include "AnalyticsConfig.h"

#include <atomic>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Natural-language collaborator behind /api/query.
 * @details complete() receives the prompt and returns the raw model reply, expected to be a JSON object.
 *          Implementations may throw; the service degrades to a fixed fallback answer.
 */
class QueryAssistant {
public:
    virtual ~QueryAssistant() = default;
    virtual std::string complete(const std::string& prompt) = 0;
};

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t errorRequests = 0;
    uint64_t fallbackRequests = 0;
    double averageLatencyMs = 0.0;
    std::map<std::string, uint64_t> endpointRequests;
};

class RequestMonitor {
public:
    void recordSuccess(const std::string& endpoint, double latencyMs, bool usedFallback);
    void recordError(const std::string& endpoint, double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> fallbackRequests{0};
    std::atomic<uint64_t> totalLatencyMicros{0};

    mutable std::mutex endpointMutex;
    std::map<std::string, uint64_t> endpointRequests;

    void countEndpoint(const std::string& endpoint);
};

struct ServiceResponse {
    int status = 200;
    std::string body;
    std::string strategy;
    std::string fallbackReason;
};

class AnalyticsService {
public:
    AnalyticsService(const AnalyticsConfig& config,
                     RequestMonitor& monitor,
                     std::shared_ptr<QueryAssistant> assistant = nullptr,
                     std::ostream& log = std::cout);

    /**
     * @brief Routes one request body to its endpoint, records monitoring and logs one line.
     * @post Transport errors (malformed body, unknown endpoint) yield status 400 with {"error","latency_ms"}.
     */
    ServiceResponse handle(const std::string& endpoint, const std::string& body);

    /**
     * @brief Endpoint handlers. Each returns the response JSON and fills strategy/fallback details.
     * @throws Nika::RequestException when the body is not an object with a `data` array of row objects.
     */
    ServiceResponse handleInsights(const std::string& body) const;
    ServiceResponse handleForecast(const std::string& body) const;
    ServiceResponse handleAnomaly(const std::string& body) const;
    ServiceResponse handleQuery(const std::string& body) const;

    /**
     * @brief Starts the blocking HTTP server on the configured host/port.
     * @return 0 on clean shutdown, 1 when binding fails.
     */
    int start();

    const AnalyticsCapabilities& capabilities() const noexcept { return capabilities_; }

private:
    AnalyticsConfig config_;
    AnalyticsCapabilities capabilities_;
    RequestMonitor& monitor_;
    std::shared_ptr<QueryAssistant> assistant_;
    std::ostream& log_;
};
