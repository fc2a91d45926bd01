#pragma once

#include <string>

#include "Metrics.h"

namespace rdscan {

enum class VitalityCategory : int {
    Dormant = 0,
    Balanced = 1,
    Chaotic = 2,
    Structured = 3,
};

struct VitalityAssessment {
    VitalityCategory category = VitalityCategory::Dormant;
    double score = 0.0; // [0,1]
};

const char* vitalityName(VitalityCategory c);
bool parseVitality(const std::string& name, VitalityCategory& out);

// Rule-based, pure. Thresholds are fixed tuning constants.
VitalityAssessment classify(const MetricsVector& m);

} // namespace rdscan
