/// @file http_types.cpp
/// @brief Request builders and URL/body encoding.

#include "bulwark/http/http_types.hpp"

#include <cctype>

namespace bulwark::http {

using foundation::ErrorCode;
using foundation::ResilienceError;
using foundation::ResilienceResult;

std::string_view toString(Method method) noexcept {
    switch (method) {
        case Method::Get:
            return "GET";
        case Method::Post:
            return "POST";
        case Method::Put:
            return "PUT";
        case Method::Patch:
            return "PATCH";
        case Method::Delete:
            return "DELETE";
        case Method::Head:
            return "HEAD";
        case Method::Options:
            return "OPTIONS";
    }
    return "UNKNOWN";
}

// ── Request builders ────────────────────────────────────────────────────────

Request& Request::withHeader(std::string key, std::string value) {
    headers[std::move(key)] = std::move(value);
    return *this;
}

Request& Request::withHeaders(const Headers& extra) {
    for (const auto& [key, value] : extra) {
        headers[key] = value;
    }
    return *this;
}

Request& Request::withQueryParam(std::string key, std::string value) {
    queryParams[std::move(key)] = std::move(value);
    return *this;
}

Request& Request::withBody(std::string text) {
    body = std::move(text);
    return *this;
}

Request& Request::withBody(std::vector<uint8_t> bytes) {
    body = std::move(bytes);
    return *this;
}

Request& Request::withJson(nlohmann::json document) {
    body = std::move(document);
    return withHeader("Content-Type", "application/json");
}

Request& Request::withTimeout(std::chrono::milliseconds value) {
    timeout = value;
    return *this;
}

Request& Request::withRetries(uint32_t value) {
    retries = value;
    return *this;
}

Request& Request::withCorrelationId(std::string id) {
    correlationId = std::move(id);
    return *this;
}

Request& Request::withBearerToken(const std::string& token) {
    return withHeader("Authorization", "Bearer " + token);
}

Request& Request::withContentType(std::string contentType) {
    return withHeader("Content-Type", std::move(contentType));
}

Request& Request::withAccept(std::string accept) {
    return withHeader("Accept", std::move(accept));
}

// ── Response ────────────────────────────────────────────────────────────────

ResilienceResult<nlohmann::json> Response::json() const {
    try {
        return ResilienceResult<nlohmann::json>::ok(nlohmann::json::parse(body));
    } catch (const nlohmann::json::parse_error& e) {
        return ResilienceResult<nlohmann::json>::err(ResilienceError(
            ErrorCode::EncodingFailed, std::string("invalid JSON response body: ") + e.what()));
    }
}

// ── Wire helpers ────────────────────────────────────────────────────────────

std::string urlEncode(std::string_view text) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string joinUrl(std::string_view base, std::string_view path) {
    if (base.empty()) {
        return std::string(path);
    }
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    std::string out(base);
    out.push_back('/');
    out.append(path);
    return out;
}

ResilienceResult<std::string> buildUrl(std::string_view base, const Request& request) {
    std::string url = joinUrl(base, request.url);
    if (url.empty()) {
        return ResilienceResult<std::string>::err(
            ResilienceError(ErrorCode::InvalidUrl, "request URL is empty"));
    }
    auto scheme = url.find("://");
    if (scheme == std::string::npos || scheme == 0) {
        return ResilienceResult<std::string>::err(
            ResilienceError(ErrorCode::InvalidUrl, "URL has no scheme: " + url));
    }

    if (auto hash = url.find('#'); hash != std::string::npos) {
        url.erase(hash);
    }

    if (!request.queryParams.empty()) {
        char separator = url.find('?') == std::string::npos ? '?' : '&';
        for (const auto& [key, value] : request.queryParams) {
            url.push_back(separator);
            url += urlEncode(key);
            url.push_back('=');
            url += urlEncode(value);
            separator = '&';
        }
    }
    return ResilienceResult<std::string>::ok(std::move(url));
}

ResilienceResult<std::string> encodeBody(const Body& body) {
    if (const auto* text = std::get_if<std::string>(&body)) {
        return ResilienceResult<std::string>::ok(*text);
    }
    if (const auto* bytes = std::get_if<std::vector<uint8_t>>(&body)) {
        return ResilienceResult<std::string>::ok(std::string(bytes->begin(), bytes->end()));
    }
    if (const auto* document = std::get_if<nlohmann::json>(&body)) {
        try {
            return ResilienceResult<std::string>::ok(document->dump());
        } catch (const nlohmann::json::type_error& e) {
            return ResilienceResult<std::string>::err(ResilienceError(
                ErrorCode::EncodingFailed, std::string("failed to encode JSON body: ") + e.what()));
        }
    }
    return ResilienceResult<std::string>::ok(std::string{});
}

} // namespace bulwark::http
