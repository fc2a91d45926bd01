#pragma once

#include <optional>
#include <string>

#include "Metrics.h"
#include "Params.h"
#include "Vitality.h"

namespace rdscan {

// One evaluated parameter set in the ranked queue.
struct Candidate {
    std::string id;
    SimulationParams params{};
    MetricsVector metrics{};       // averaged over the evaluation samples
    VitalityCategory classification = VitalityCategory::Dormant;

    // Filled in by normalization when absent (e.g. restored candidates).
    std::optional<double> vitalityScore;
    std::optional<double> specialLikelihood;

    // Blended ranking score.
    double score = 0.0;
};

constexpr double kVitalityBlendWeight = 0.7;
constexpr double kSpecialBlendWeight = 0.3;

inline double blendedScore(double vitalityScore, double specialLikelihood) {
    return kVitalityBlendWeight * vitalityScore + kSpecialBlendWeight * specialLikelihood;
}

} // namespace rdscan
