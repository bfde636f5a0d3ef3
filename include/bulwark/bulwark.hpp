#pragma once

/// @file bulwark.hpp
/// @brief Umbrella header for the Bulwark resilience library.

#include "bulwark/version.hpp"
#include "bulwark/core/result.hpp"
#include "bulwark/foundation/config_manager.hpp"
#include "bulwark/foundation/logger.hpp"
#include "bulwark/foundation/resilience_result.hpp"
#include "bulwark/resilience/circuit_breaker.hpp"
#include "bulwark/resilience/circuit_breaker_manager.hpp"
#include "bulwark/resilience/rate_limiter.hpp"
#include "bulwark/http/resilient_http_client.hpp"
