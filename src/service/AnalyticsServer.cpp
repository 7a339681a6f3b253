#include "AnalyticsService.h"

#include <algorithm>
#include <iostream>
#include <string>

#include <httplib.h>

namespace {
void setJsonResponse(httplib::Response& response, int status, const std::string& payload) {
    response.status = status;
    response.set_content(payload, "application/json");
}
} // namespace

int AnalyticsService::start() {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config_.threadCount)] {
        return new httplib::ThreadPool(static_cast<int>(threadCount));
    };

    for (const char* endpoint : {"/api/insights", "/api/forecast", "/api/anomaly", "/api/query"}) {
        const std::string path = endpoint;
        server.Post(path, [this, path](const httplib::Request& request, httplib::Response& response) {
            const ServiceResponse result = handle(path, request.body);
            setJsonResponse(response, result.status, result.body);
        });
    }

    std::cout << "[NikaService] host=" << config_.host
              << " port=" << config_.port
              << " threads=" << std::max<size_t>(1, config_.threadCount)
              << " arima=" << (capabilities_.arima ? "on" : "off")
              << " isolation_forest=" << (capabilities_.isolationForest ? "on" : "off")
              << "\n";

    if (!server.listen(config_.host.c_str(), config_.port)) {
        std::cerr << "[NikaService] failed_to_bind host=" << config_.host << " port=" << config_.port << "\n";
        return 1;
    }

    return 0;
}
