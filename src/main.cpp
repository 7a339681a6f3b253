#include "AnalyticsConfig.h"
#include "AnalyticsService.h"
#include "NikaExceptions.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {
std::string readRequestFile(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw Nika::ConfigurationException("Failed to open request file: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}
} // namespace

int main(int argc, char* argv[]) {
    AnalyticsConfig config;
    try {
        config = AnalyticsConfig::fromArgs(argc, argv);
    } catch (const Nika::NikaException& e) {
        std::cerr << "[Nika Error] " << e.what() << "\n";
        return 1;
    }

    RequestMonitor monitor;
    if (config.mode == "serve") {
        AnalyticsService service(config, monitor);
        return service.start();
    }

    std::string body;
    try {
        body = readRequestFile(config.requestPath);
    } catch (const Nika::NikaException& e) {
        std::cerr << "[Nika Error] " << e.what() << "\n";
        return 1;
    }

    // Response JSON goes to stdout; monitoring lines go to stderr.
    AnalyticsService service(config, monitor, nullptr, std::cerr);
    const ServiceResponse response = service.handle("/api/" + config.operation, body);
    std::cout << response.body << "\n";
    return response.status == 200 ? 0 : 1;
}
