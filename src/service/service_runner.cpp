/// @file service_runner.cpp
/// @brief Implementation of shared executable utilities.

#include "bulwark/service/service_runner.hpp"

#include <csignal>
#include <cstdlib>
#include <thread>

namespace bulwark::service {

using foundation::ErrorCode;
using foundation::ResilienceError;
using foundation::ResilienceResult;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

bool SignalHandler::sleepUnlessShutdown(std::chrono::milliseconds duration) const {
    using namespace std::chrono_literals;
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!shutdownRequested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            100ms, deadline - now));
    }
    return true;
}

// -- Config loading ----------------------------------------------------------

std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath,
                                        const std::filesystem::path& defaultPath) {
    if (!cliPath.empty()) {
        return cliPath;
    }
    const char* envPath = std::getenv("BULWARK_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        return envPath;
    }
    return defaultPath;
}

ResilienceResult<void> loadConfig(foundation::ConfigManager& config,
                                  const std::filesystem::path& path) {
    return config.load(path);
}

// -- CLI argument parsing ----------------------------------------------------

ResilienceResult<CommandLine> parseCommandLine(int argc, char* argv[]) {
    using R = ResilienceResult<CommandLine>;
    CommandLine cmd;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        if (arg == "--config" || arg == "--watch") {
            if (i + 1 >= argc) {
                return R::err(ResilienceError(ErrorCode::InvalidArgument,
                                              std::string(arg) + " requires a value"));
            }
            std::string_view value(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            if (arg == "--config") {
                cmd.configPath = std::string(value);
                continue;
            }
            auto interval = foundation::parseDuration(value);
            if (interval.hasError() || interval.value().count() <= 0) {
                return R::err(ResilienceError(ErrorCode::InvalidArgument,
                                              "invalid --watch interval: " + std::string(value)));
            }
            cmd.watch = interval.value();
        } else if (arg.size() > 1 && arg.front() == '-') {
            return R::err(ResilienceError(ErrorCode::InvalidArgument,
                                          "unknown option: " + std::string(arg)));
        } else {
            cmd.positional.emplace_back(arg);
        }
    }
    return R::ok(std::move(cmd));
}

} // namespace bulwark::service
