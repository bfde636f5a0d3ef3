#pragma once

/// @file metrics_format.hpp
/// @brief Histogram storage and Prometheus text-format helpers shared by
///        the breaker and HTTP client metrics.

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace bulwark::foundation {

/// Bucket boundaries for histogram metrics (le = "less than or equal").
struct HistogramBuckets {
    /// Default latency buckets in milliseconds: {1,5,10,25,50,100,250,500,1000}.
    static HistogramBuckets defaultLatency();

    std::vector<double> boundaries;
};

/// Cumulative histogram. Not thread-safe; owners guard it with their lock.
class Histogram {
public:
    explicit Histogram(HistogramBuckets buckets = HistogramBuckets::defaultLatency());

    void record(double value);

    void reset();

    [[nodiscard]] uint64_t count() const noexcept { return totalCount_; }
    [[nodiscard]] double sum() const noexcept { return totalSum_; }
    [[nodiscard]] const std::vector<double>& boundaries() const noexcept { return boundaries_; }

    /// Cumulative count for each boundary followed by the +Inf bucket.
    [[nodiscard]] const std::vector<uint64_t>& bucketCounts() const noexcept { return bucketCounts_; }

    /// Write "_bucket", "_sum" and "_count" series for @p name.
    /// @p labels is inserted inside the braces (e.g. "client=\"api\"").
    void writePrometheus(std::ostream& out, std::string_view name,
                         std::string_view labels = {}) const;

private:
    std::vector<double> boundaries_;
    std::vector<uint64_t> bucketCounts_; // one per boundary + 1 for +Inf
    uint64_t totalCount_{0};
    double totalSum_{0.0};
};

/// Format a double for Prometheus output, removing trailing zeros.
[[nodiscard]] std::string formatDouble(double value);

/// Escape a label value (backslash, quote, newline).
[[nodiscard]] std::string escapeLabelValue(std::string_view value);

/// Write "# HELP" and "# TYPE" lines for a metric family.
void writeMetricHeader(std::ostream& out, std::string_view name,
                       std::string_view type, std::string_view help);

} // namespace bulwark::foundation
