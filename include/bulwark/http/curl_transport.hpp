#pragma once

/// @file curl_transport.hpp
/// @brief libcurl implementation of Transport with a pool of easy handles.

#include <memory>

#include "bulwark/foundation/resilience_result.hpp"
#include "bulwark/http/transport.hpp"

namespace bulwark::http {

/// Transport backed by libcurl easy handles.
///
/// Handles are pooled (up to maxIdleConns) so that libcurl can keep their
/// connections alive between calls. Cancellation and deadlines are
/// enforced through the transfer progress callback and CURLOPT_TIMEOUT_MS.
///
/// Thread-safe: each call borrows its own handle.
class CurlTransport : public Transport {
public:
    /// @return TlsSetupFailed for an incomplete or missing client
    ///         certificate/key or CA file, TransportError if libcurl fails
    ///         to initialize.
    static foundation::ResilienceResult<std::unique_ptr<CurlTransport>> create(
        TransportOptions options = {});

    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    foundation::ResilienceResult<TransportResponse> execute(
        const TransportRequest& request, const foundation::CancellationToken& token) override;

    void closeIdleConnections() override;

    [[nodiscard]] const TransportOptions& options() const noexcept;

private:
    explicit CurlTransport(TransportOptions options);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bulwark::http
