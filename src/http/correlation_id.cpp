/// @file correlation_id.cpp
/// @brief CorrelationIdGenerator implementation.

#include "bulwark/http/correlation_id.hpp"

#include "bulwark/foundation/json_log_formatter.hpp"

#include <chrono>

namespace bulwark::http {

CorrelationIdGenerator::CorrelationIdGenerator(std::string prefix, std::size_t randomLength)
    : prefix_(std::move(prefix)), randomLength_(randomLength), rng_(std::random_device{}()) {}

std::string CorrelationIdGenerator::generate() {
    return compose(prefix_);
}

std::string CorrelationIdGenerator::generateWithPrefix(std::string_view prefix) {
    return compose(prefix);
}

std::string CorrelationIdGenerator::generateShort() {
    std::lock_guard lock(mutex_);
    ++counter_;
    return randomHex(16) + "-" + std::to_string(counter_);
}

std::string CorrelationIdGenerator::generateUuid() {
    return foundation::generateUuidV4();
}

bool CorrelationIdGenerator::validate(std::string_view id) noexcept {
    if (id.size() < 8) {
        return false;
    }
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

uint64_t CorrelationIdGenerator::counter() const {
    std::lock_guard lock(mutex_);
    return counter_;
}

void CorrelationIdGenerator::reset() {
    std::lock_guard lock(mutex_);
    counter_ = 0;
}

// ── Internals ───────────────────────────────────────────────────────────────

std::string CorrelationIdGenerator::compose(std::string_view prefix) {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count();

    std::lock_guard lock(mutex_);
    ++counter_;

    std::string id;
    if (!prefix.empty()) {
        id.append(prefix);
        id.push_back('-');
    }
    id += std::to_string(nanos);
    id.push_back('-');
    id += std::to_string(counter_);
    if (randomLength_ > 0) {
        id.push_back('-');
        id += randomHex(randomLength_);
    }
    return id;
}

std::string CorrelationIdGenerator::randomHex(std::size_t length) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length);
    uint64_t bits = 0;
    for (std::size_t i = 0; i < length; ++i) {
        if (i % 16 == 0) {
            bits = rng_();
        }
        out.push_back(kHex[bits & 0x0F]);
        bits >>= 4;
    }
    return out;
}

} // namespace bulwark::http
