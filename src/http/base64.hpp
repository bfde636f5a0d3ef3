#pragma once

/// @file base64.hpp
/// @brief Internal Base64 encoder (RFC 4648 §4) for Basic authentication.

#include <cstdint>
#include <string>
#include <string_view>

namespace bulwark::http::detail {

/// Encode bytes to standard base64 with '=' padding.
[[nodiscard]] inline std::string base64Encode(std::string_view input) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    const auto* data = reinterpret_cast<const uint8_t*>(input.data());
    const std::size_t length = input.size();

    std::string result;
    result.reserve(((length + 2) / 3) * 4);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        result.push_back(i + 1 < length ? table[(n >> 6) & 0x3F] : '=');
        result.push_back(i + 2 < length ? table[n & 0x3F] : '=');
    }
    return result;
}

} // namespace bulwark::http::detail
