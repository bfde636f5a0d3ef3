#pragma once

/// @file correlation_id.hpp
/// @brief Correlation ID generation for outbound requests.

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace bulwark::http {

/// Generates request correlation IDs.
///
/// The default layout is `<prefix>-<unix-nanos>-<counter>-<hex>`, e.g.
/// `bulwark-1718000000000000000-42-9f86d081884c7d65`. The counter is
/// shared by every generate*() call and makes IDs from one generator
/// unique even within the same nanosecond.
///
/// Thread-safe.
class CorrelationIdGenerator {
public:
    static constexpr std::string_view kDefaultPrefix = "bulwark";
    static constexpr std::size_t kDefaultRandomLength = 16;

    explicit CorrelationIdGenerator(std::string prefix = std::string(kDefaultPrefix),
                                    std::size_t randomLength = kDefaultRandomLength);

    [[nodiscard]] std::string generate();

    /// Same layout with @p prefix in place of the configured one.
    [[nodiscard]] std::string generateWithPrefix(std::string_view prefix);

    /// `<16 hex>-<counter>`.
    [[nodiscard]] std::string generateShort();

    /// RFC 4122 version 4 UUID.
    [[nodiscard]] std::string generateUuid();

    /// At least 8 characters, only ASCII letters, digits and '-'.
    [[nodiscard]] static bool validate(std::string_view id) noexcept;

    [[nodiscard]] uint64_t counter() const;

    /// Reset the counter to zero.
    void reset();

    [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }

private:
    std::string compose(std::string_view prefix);
    std::string randomHex(std::size_t length);

    std::string prefix_;
    std::size_t randomLength_;

    mutable std::mutex mutex_;
    uint64_t counter_ = 0;
    std::mt19937_64 rng_;
};

} // namespace bulwark::http
