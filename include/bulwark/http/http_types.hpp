#pragma once

/// @file http_types.hpp
/// @brief Request and response value types for the resilient HTTP client.

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "bulwark/foundation/resilience_result.hpp"

namespace bulwark::http {

enum class Method : uint8_t { Get, Post, Put, Patch, Delete, Head, Options };

/// "GET", "POST", ...
[[nodiscard]] std::string_view toString(Method method) noexcept;

/// Header map; one value per name.
using Headers = std::map<std::string, std::string>;

/// Query parameters, encoded in key order.
using QueryParams = std::map<std::string, std::string>;

/// Request payload: nothing, raw text, raw bytes, or a JSON document.
using Body = std::variant<std::monostate, std::string, std::vector<uint8_t>, nlohmann::json>;

/// An outbound request plus its per-call overrides.
///
/// The with*() setters chain, so a request reads as a sentence:
/// @code
///   Request req;
///   req.withHeader("Accept", "application/json")
///      .withQueryParam("page", 2)
///      .withTimeout(std::chrono::seconds(5));
/// @endcode
struct Request {
    Method method = Method::Get;
    std::string url;
    Headers headers;
    QueryParams queryParams;
    Body body;

    /// Overrides the client timeout when positive.
    std::chrono::milliseconds timeout{0};

    /// Overrides the client retry budget when positive.
    uint32_t retries = 0;

    /// Assigned by the client when empty and correlation IDs are enabled.
    std::string correlationId;

    Request& withHeader(std::string key, std::string value);
    Request& withHeaders(const Headers& extra);
    Request& withQueryParam(std::string key, std::string value);

    template <typename T, typename = std::enable_if_t<std::is_arithmetic_v<T>>>
    Request& withQueryParam(std::string key, T value) {
        return withQueryParam(std::move(key), std::to_string(value));
    }

    Request& withBody(std::string text);
    Request& withBody(const char* text) { return withBody(std::string(text)); }
    Request& withBody(std::vector<uint8_t> bytes);
    Request& withJson(nlohmann::json document);

    Request& withTimeout(std::chrono::milliseconds value);
    Request& withRetries(uint32_t value);
    Request& withCorrelationId(std::string id);
    Request& withBearerToken(const std::string& token);
    Request& withContentType(std::string contentType);
    Request& withAccept(std::string accept);

    [[nodiscard]] bool hasBody() const noexcept {
        return !std::holds_alternative<std::monostate>(body);
    }
};

/// Per-call options passed to the convenience verbs. Method and URL are
/// filled in by the verb.
using RequestOptions = Request;

/// Final outcome of a request that reached the server.
struct Response {
    int statusCode = 0;
    Headers headers;
    std::string body;

    /// The request as sent (after correlation ID assignment).
    std::shared_ptr<const Request> request;

    /// Wall-clock time of the whole call, retries and backoff included.
    std::chrono::milliseconds duration{0};

    /// Retries used; attempts = retryCount + 1.
    uint32_t retryCount = 0;

    std::string correlationId;

    /// Set when the final status counts as a failure.
    std::optional<foundation::ResilienceError> error;

    /// 2xx or 3xx.
    [[nodiscard]] bool isSuccess() const noexcept { return statusCode >= 200 && statusCode < 400; }

    /// Parse the body as JSON. @return EncodingFailed on malformed input.
    [[nodiscard]] foundation::ResilienceResult<nlohmann::json> json() const;
};

// ── Wire helpers ────────────────────────────────────────────────────────────

/// RFC 3986 percent-encoding of everything but unreserved characters.
[[nodiscard]] std::string urlEncode(std::string_view text);

/// Join a base URL and a request path with exactly one '/' between them.
/// An empty base returns @p path unchanged.
[[nodiscard]] std::string joinUrl(std::string_view base, std::string_view path);

/// Append encoded query parameters, honoring an existing '?' and dropping
/// any fragment. @return InvalidUrl for an empty URL or one without a
/// scheme.
[[nodiscard]] foundation::ResilienceResult<std::string> buildUrl(std::string_view base,
                                                                 const Request& request);

/// Serialize the body. Text and bytes pass through; JSON is dumped.
/// @return EncodingFailed if the JSON document cannot be serialized.
[[nodiscard]] foundation::ResilienceResult<std::string> encodeBody(const Body& body);

} // namespace bulwark::http
