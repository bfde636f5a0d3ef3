#pragma once

/// @file transport.hpp
/// @brief Abstract network transport consumed by the HTTP client.

#include <chrono>
#include <cstdint>
#include <string>

#include "bulwark/foundation/cancellation.hpp"
#include "bulwark/foundation/resilience_result.hpp"
#include "bulwark/http/http_types.hpp"

namespace bulwark::http {

/// Connection and TLS parameters applied by a transport.
struct TransportOptions {
    uint32_t maxIdleConns = 100;
    uint32_t maxIdleConnsPerHost = 10;
    std::chrono::milliseconds idleConnTimeout{90000};
    bool disableKeepAlives = false;

    bool insecureSkipVerify = false;
    std::string certFile;
    std::string keyFile;
    std::string caFile;
};

/// A fully built request: absolute URL, final headers, encoded body.
struct TransportRequest {
    Method method = Method::Get;
    std::string url;
    Headers headers;
    std::string body;
};

struct TransportResponse {
    int statusCode = 0;
    Headers headers;
    std::string body;
};

/// One network round trip.
///
/// Implementations must honor @p token: stop promptly once it is
/// cancelled or its deadline passes, and report Cancelled or Timeout.
/// Any other failure below HTTP is a TransportError. A response with any
/// status, including 5xx, is a success at this level.
class Transport {
public:
    virtual ~Transport() = default;

    virtual foundation::ResilienceResult<TransportResponse> execute(
        const TransportRequest& request, const foundation::CancellationToken& token) = 0;

    /// Drop pooled idle connections.
    virtual void closeIdleConnections() {}
};

} // namespace bulwark::http
