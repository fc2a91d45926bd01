#include "Metrics.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace rdscan {

namespace {

static inline double clamp01(double x) {
    return (x < 0.0) ? 0.0 : (x > 1.0) ? 1.0 : x;
}

} // namespace

MetricsResult MetricsExtractor::extract(const Snapshot& current, const Snapshot* previous) {
    MetricsResult result;
    result.snapshot = current;

    const std::size_t count = std::min(current.u.size(), current.v.size());
    if (count == 0) {
        return result;
    }
    const double inv = 1.0 / static_cast<double>(count);

    double sumU = 0.0;
    double sumV = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        sumU += current.u[i];
        sumV += current.v[i];
    }
    const double meanU = sumU * inv;
    const double meanV = sumV * inv;

    const bool havePrev = previous != nullptr && previous->sameShape(current);

    double varU = 0.0;
    double varV = 0.0;
    double activity = 0.0;
    std::array<std::size_t, kHistogramBins> histogram{};

    for (std::size_t i = 0; i < count; ++i) {
        const double u = current.u[i];
        const double v = current.v[i];

        const double du = u - meanU;
        const double dv = v - meanV;
        varU += du * du;
        varV += dv * dv;

        if (havePrev) {
            activity += std::fabs(u - previous->u[i]) + std::fabs(v - previous->v[i]);
        }

        const double lum = clamp01(v - kLuminanceUWeight * u);
        const int bin = std::min(kHistogramBins - 1, static_cast<int>(std::floor(lum * kHistogramBins)));
        histogram[static_cast<std::size_t>(bin)] += 1;
    }

    double entropy = 0.0;
    for (std::size_t c : histogram) {
        if (c == 0) continue;
        const double p = static_cast<double>(c) * inv;
        entropy -= p * std::log2(p);
    }

    MetricsVector& m = result.metrics;
    m.meanU = meanU;
    m.meanV = meanV;
    m.stdU = std::sqrt(varU * inv);
    m.stdV = std::sqrt(varV * inv);
    m.activity = havePrev ? activity * inv * kActivityScale : 0.0;
    m.entropy = entropy;
    return result;
}

MetricsVector MetricsExtractor::average(const std::vector<MetricsVector>& samples) {
    MetricsVector avg{};
    if (samples.empty()) {
        return avg;
    }
    for (const auto& s : samples) {
        avg.meanU += s.meanU;
        avg.meanV += s.meanV;
        avg.stdU += s.stdU;
        avg.stdV += s.stdV;
        avg.activity += s.activity;
        avg.entropy += s.entropy;
    }
    const double inv = 1.0 / static_cast<double>(samples.size());
    avg.meanU *= inv;
    avg.meanV *= inv;
    avg.stdU *= inv;
    avg.stdV *= inv;
    avg.activity *= inv;
    avg.entropy *= inv;
    return avg;
}

} // namespace rdscan
