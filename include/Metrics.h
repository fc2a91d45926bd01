#pragma once

#include <vector>

#include "GridSimulator.h"

namespace rdscan {

struct MetricsVector {
    double meanU = 0.0;
    double meanV = 0.0;
    double stdU = 0.0;
    double stdV = 0.0;
    double activity = 0.0;
    double entropy = 0.0;
};

struct MetricsResult {
    MetricsVector metrics{};
    // Copy of the input, to be passed back as `previous` on the next call.
    Snapshot snapshot{};
};

class MetricsExtractor {
public:
    static constexpr int kHistogramBins = 32;
    static constexpr double kActivityScale = 0.5;
    static constexpr double kLuminanceUWeight = 0.6;

    // Stateless. A `previous` of another shape counts as absent (activity 0).
    static MetricsResult extract(const Snapshot& current, const Snapshot* previous = nullptr);

    // Field-wise arithmetic mean; empty input gives all-zero metrics.
    static MetricsVector average(const std::vector<MetricsVector>& samples);
};

} // namespace rdscan
