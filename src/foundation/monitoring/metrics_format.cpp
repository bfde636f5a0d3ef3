/// @file metrics_format.cpp
/// @brief Histogram and Prometheus text-format helpers.

#include "bulwark/foundation/metrics_format.hpp"

#include <algorithm>
#include <cmath>
#include <ostream>
#include <sstream>

namespace bulwark::foundation {

HistogramBuckets HistogramBuckets::defaultLatency() {
    return HistogramBuckets{{1, 5, 10, 25, 50, 100, 250, 500, 1000}};
}

// ── Histogram ───────────────────────────────────────────────────────────────

Histogram::Histogram(HistogramBuckets buckets)
    : boundaries_(std::move(buckets.boundaries)),
      bucketCounts_(boundaries_.size() + 1, 0) {}

void Histogram::record(double value) {
    for (std::size_t i = 0; i < boundaries_.size(); ++i) {
        if (value <= boundaries_[i]) {
            ++bucketCounts_[i];
        }
    }
    // +Inf bucket always incremented
    ++bucketCounts_.back();
    ++totalCount_;
    totalSum_ += value;
}

void Histogram::reset() {
    std::fill(bucketCounts_.begin(), bucketCounts_.end(), 0);
    totalCount_ = 0;
    totalSum_ = 0.0;
}

void Histogram::writePrometheus(std::ostream& out, std::string_view name,
                                std::string_view labels) const {
    std::string prefix(labels);
    if (!prefix.empty()) {
        prefix += ',';
    }
    for (std::size_t i = 0; i < boundaries_.size(); ++i) {
        out << name << "_bucket{" << prefix << "le=\"" << formatDouble(boundaries_[i])
            << "\"} " << bucketCounts_[i] << "\n";
    }
    out << name << "_bucket{" << prefix << "le=\"+Inf\"} " << bucketCounts_.back() << "\n";

    if (labels.empty()) {
        out << name << "_sum " << formatDouble(totalSum_) << "\n";
        out << name << "_count " << totalCount_ << "\n";
    } else {
        out << name << "_sum{" << labels << "} " << formatDouble(totalSum_) << "\n";
        out << name << "_count{" << labels << "} " << totalCount_ << "\n";
    }
}

// ── Formatting ──────────────────────────────────────────────────────────────

std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string escapeLabelValue(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    return out;
}

void writeMetricHeader(std::ostream& out, std::string_view name,
                       std::string_view type, std::string_view help) {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " " << type << "\n";
}

} // namespace bulwark::foundation
