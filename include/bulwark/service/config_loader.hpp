#pragma once

/// @file config_loader.hpp
/// @brief Builds resilience and HTTP client configs from a ConfigManager.
///
/// Keys are read below a dotted prefix using snake_case names, e.g.
///
/// @code{.yaml}
///   circuit_breaker:
///     failure_threshold: 5
///     open_timeout: 30s
///   manager:
///     enable_monitoring: true
///     monitor_interval: 30s
///   http_client:
///     base_url: https://api.example.com
///     retry_on_status: [429, 500, 502, 503, 504]
///     default_headers:
///       Accept: application/json
/// @endcode
///
/// Absent keys keep their defaults. A present key of the wrong type is a
/// ConfigTypeMismatch error; the finished config is validated.

#include <string_view>

#include "bulwark/foundation/config_manager.hpp"
#include "bulwark/foundation/resilience_result.hpp"
#include "bulwark/http/http_client_config.hpp"
#include "bulwark/resilience/circuit_breaker.hpp"
#include "bulwark/resilience/circuit_breaker_manager.hpp"

namespace bulwark::service {

[[nodiscard]] foundation::ResilienceResult<resilience::CircuitBreakerConfig>
loadCircuitBreakerConfig(const foundation::ConfigManager& config,
                         std::string_view prefix = "circuit_breaker");

/// Reads the manager keys and, below "<prefix>.default_config", the
/// default breaker config.
[[nodiscard]] foundation::ResilienceResult<resilience::CircuitBreakerManagerConfig>
loadManagerConfig(const foundation::ConfigManager& config, std::string_view prefix = "manager");

[[nodiscard]] foundation::ResilienceResult<http::HttpClientConfig>
loadHttpClientConfig(const foundation::ConfigManager& config,
                     std::string_view prefix = "http_client");

} // namespace bulwark::service
