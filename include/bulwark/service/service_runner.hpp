#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for bulwark executables.
///
/// Provides signal handling, configuration path resolution and CLI argument
/// parsing.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bulwark/foundation/config_manager.hpp"
#include "bulwark/foundation/resilience_result.hpp"

namespace bulwark::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. After it is
/// destroyed the default handlers are restored.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Sleep up to @p duration, returning early on shutdown.
    /// @return true if shutdown was requested.
    bool sleepUnlessShutdown(std::chrono::milliseconds duration) const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Resolve the configuration file path:
///   1. @p cliPath (from --config) if not empty
///   2. BULWARK_CONFIG_PATH environment variable if set
///   3. @p defaultPath
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath,
                                                      const std::filesystem::path& defaultPath);

/// Load @p path into @p config.
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] foundation::ResilienceResult<void> loadConfig(foundation::ConfigManager& config,
                                                            const std::filesystem::path& path);

/// Parsed command line of a bulwark tool.
struct CommandLine {
    std::filesystem::path configPath;                 ///< --config <path>
    std::optional<std::chrono::milliseconds> watch;   ///< --watch <duration>
    std::vector<std::string> positional;
};

/// Parse `--config <path>`, `--watch <duration>` and positional arguments.
/// @return InvalidArgument for a flag without a value, an unknown flag or
///         a malformed duration.
[[nodiscard]] foundation::ResilienceResult<CommandLine> parseCommandLine(int argc, char* argv[]);

} // namespace bulwark::service
