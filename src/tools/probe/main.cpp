/// @file main.cpp
/// @brief bulwark-probe entry point.
///
/// Sends GET requests through a ResilientHttpClient built from the
/// "http_client" config section. Each URL also gets its own circuit in a
/// CircuitBreakerManager built from the "manager" section, so one failing
/// endpoint does not trip the others. Prints each outcome, the circuit
/// states and the metrics. With --watch the URLs are probed repeatedly
/// until SIGINT/SIGTERM.
///
///   bulwark-probe [--config probe.yaml] [--watch 5s] URL...

#include "bulwark/foundation/config_manager.hpp"
#include "bulwark/foundation/logger.hpp"
#include "bulwark/http/resilient_http_client.hpp"
#include "bulwark/resilience/circuit_breaker_manager.hpp"
#include "bulwark/service/config_loader.hpp"
#include "bulwark/service/service_runner.hpp"
#include "bulwark/version.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

constexpr const char* kDefaultConfigPath = "/etc/bulwark/probe.yaml";

void printUsage() {
    std::cerr << "usage: bulwark-probe [--config <path>] [--watch <interval>] URL...\n";
}

using bulwark::foundation::ResilienceResult;
using bulwark::http::Response;

void printOutcome(const std::string& url, const ResilienceResult<Response>& result,
                  const std::optional<Response>& response) {
    if (response) {
        std::cout << "  " << url << " -> " << response->statusCode << " in "
                  << response->duration.count() << "ms"
                  << " (retries: " << response->retryCount
                  << ", correlation: " << response->correlationId << ")";
        if (response->error) {
            std::cout << " [" << response->error->message() << "]";
        }
        std::cout << "\n";
        return;
    }
    const auto& error = result.error();
    std::cout << "  " << url << " -> error "
              << bulwark::foundation::errorCodeName(error.code()) << ": "
              << error.message() << "\n";
}

void probe(bulwark::resilience::CircuitBreakerManager& manager,
           bulwark::http::ResilientHttpClient& client, const std::string& url) {
    std::optional<Response> response;
    // A status failure arrives as a Response with error set; surface it as
    // an error so the per-URL circuit counts it.
    auto result = manager.execute(url, [&]() -> ResilienceResult<Response> {
        auto sent = client.get(url);
        if (!sent) {
            return sent;
        }
        response = sent.value();
        if (response->error) {
            return ResilienceResult<Response>::err(*response->error);
        }
        return sent;
    });
    printOutcome(url, result, response);
}

void printSummary(bulwark::resilience::CircuitBreakerManager& manager,
                  const bulwark::http::ResilientHttpClient& client) {
    for (const auto& [name, stats] : manager.allStats()) {
        std::cout << "circuit " << name << ": " << bulwark::resilience::toString(stats.state)
                  << " (requests " << stats.requestCount << ", failures "
                  << stats.totalFailures << ", rejected " << stats.rejectedCount << ")\n";
    }
    if (auto breaker = client.circuitBreaker()) {
        auto stats = breaker->stats();
        std::cout << "client circuit " << stats.name << ": "
                  << bulwark::resilience::toString(stats.state) << "\n";
    }
    if (auto* limiter = client.rateLimiter()) {
        std::cout << limiter->summary() << "\n";
    }
    std::cout << manager.metrics().scrape();
    if (auto* metrics = client.metrics()) {
        std::cout << metrics->scrape();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    bulwark::service::SignalHandler signals;

    auto cmd = bulwark::service::parseCommandLine(argc, argv);
    if (!cmd) {
        std::cerr << cmd.error().message() << "\n";
        printUsage();
        return EXIT_FAILURE;
    }
    if (cmd.value().positional.empty()) {
        printUsage();
        return EXIT_FAILURE;
    }

    // --config flag > BULWARK_CONFIG_PATH env > default. A missing default
    // file leaves every setting at its default.
    auto configPath = bulwark::service::resolveConfigPath(cmd.value().configPath,
                                                          kDefaultConfigPath);
    bulwark::foundation::ConfigManager config;
    if (configPath != kDefaultConfigPath || std::filesystem::exists(configPath)) {
        auto loadResult = bulwark::service::loadConfig(config, configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto jsonLogs = config.get<bool>("logging.json");
    if (jsonLogs) {
        bulwark::foundation::Logger::instance().setJsonOutput(jsonLogs.value());
    }

    auto clientConfig = bulwark::service::loadHttpClientConfig(config);
    if (!clientConfig) {
        std::cerr << "Invalid http_client config: " << clientConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto client = bulwark::http::ResilientHttpClient::create(std::move(clientConfig).value());
    if (!client) {
        std::cerr << "Failed to create HTTP client: " << client.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto managerConfig = bulwark::service::loadManagerConfig(config);
    if (!managerConfig) {
        std::cerr << "Invalid manager config: " << managerConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }
    // The client bounds every call with its own deadline.
    managerConfig.value().defaultConfig.requestTimeout = std::chrono::milliseconds::zero();
    bulwark::resilience::CircuitBreakerManager manager(std::move(managerConfig).value());

    const auto& urls = cmd.value().positional;
    for (const auto& url : urls) {
        auto created = manager.create(url);
        if (!created && created.error().code() != bulwark::foundation::ErrorCode::AlreadyExists) {
            std::cerr << "Failed to create circuit for " << url << ": "
                      << created.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    std::cout << "bulwark-probe " << bulwark::Version::string << " (config: "
              << configPath.string() << ")\n";

    const auto watch = cmd.value().watch;
    do {
        for (const auto& url : urls) {
            if (signals.shutdownRequested()) {
                break;
            }
            probe(manager, *client.value(), url);
        }
    } while (watch && !signals.sleepUnlessShutdown(*watch));

    printSummary(manager, *client.value());
    manager.stop();
    client.value()->close();
    return EXIT_SUCCESS;
}
