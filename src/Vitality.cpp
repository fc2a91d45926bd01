#include "Vitality.h"

#include <cmath>

namespace rdscan {

namespace {

// --------------------
// Classifier tuning constants
// --------------------
constexpr double kStillActivity = 0.006;
constexpr double kStructuredStd = 0.15;
constexpr double kStructuredEntropy = 0.8;

constexpr double kChaoticActivity = 0.14;
constexpr double kChaoticStd = 0.32;
constexpr double kChaoticEntropy = 4.4;

constexpr double kDormantStd = 0.03;
constexpr double kDormantEntropy = 0.7;

static inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return (x < 0.0) ? 0.0 : (x > 1.0) ? 1.0 : x;
}

} // namespace

const char* vitalityName(VitalityCategory c) {
    switch (c) {
        case VitalityCategory::Dormant:    return "dormant";
        case VitalityCategory::Balanced:   return "balanced";
        case VitalityCategory::Chaotic:    return "chaotic";
        case VitalityCategory::Structured: return "structured";
        default:                           return "dormant";
    }
}

bool parseVitality(const std::string& name, VitalityCategory& out) {
    if (name == "dormant")    { out = VitalityCategory::Dormant;    return true; }
    if (name == "balanced")   { out = VitalityCategory::Balanced;   return true; }
    if (name == "chaotic")    { out = VitalityCategory::Chaotic;    return true; }
    if (name == "structured") { out = VitalityCategory::Structured; return true; }
    return false;
}

VitalityAssessment classify(const MetricsVector& m) {
    const double avgStd = (m.stdU + m.stdV) * 0.5;
    const double activity = m.activity;
    const double entropy = m.entropy;

    VitalityAssessment a;
    if (activity < kStillActivity) {
        const bool textured = avgStd > kStructuredStd || entropy > kStructuredEntropy;
        a.category = textured ? VitalityCategory::Structured : VitalityCategory::Dormant;
    } else if (activity > kChaoticActivity || avgStd > kChaoticStd || entropy > kChaoticEntropy) {
        a.category = VitalityCategory::Chaotic;
    } else if (avgStd < kDormantStd || entropy < kDormantEntropy) {
        a.category = VitalityCategory::Dormant;
    } else {
        a.category = VitalityCategory::Balanced;
    }

    if (a.category == VitalityCategory::Structured) {
        const double entropyScore = clamp01((entropy - 0.6) / 2.2);
        const double textureScore = clamp01((avgStd - 0.15) / 0.25);
        a.score = clamp01(0.65 * entropyScore + 0.35 * textureScore);
    } else {
        const double activityScore = clamp01((activity - kStillActivity) / 0.09);
        const double entropyScore = 1.0 - clamp01(std::fabs(entropy - 2.4) / 2.0);
        const double stdScore = 1.0 - clamp01(std::fabs(avgStd - 0.1) / 0.08);
        a.score = clamp01(0.5 * activityScore + 0.3 * entropyScore + 0.2 * stdScore);
    }
    return a;
}

} // namespace rdscan
