#pragma once

#include <string>
#include <vector>

#include <json/forwards.h>

#include "Metrics.h"
#include "Params.h"

namespace rdscan {

// Externally trained logistic model over standardized features.
// Treated as immutable configuration once loaded.
struct SpecialModel {
    std::vector<std::string> features;
    std::vector<double> weights;
    double bias = 0.0;
    std::vector<double> means;
    std::vector<double> stds;

    bool valid(std::string* why = nullptr) const;
};

// Compiled-in coefficients (same values as data/special-model.json).
const SpecialModel& defaultSpecialModel();

bool specialModelFromJson(const Json::Value& root, SpecialModel& out, std::string* why = nullptr);
bool specialModelFromString(const std::string& text, SpecialModel& out, std::string* why = nullptr);
bool loadSpecialModel(const std::string& path, SpecialModel& out, std::string* why = nullptr);

Json::Value specialModelToJson(const SpecialModel& model);
bool saveSpecialModel(const std::string& path, const SpecialModel& model);

// Raw (unstandardized) value of a named feature. Unknown names fall back to
// the missing-value default: dt, contrast, gamma -> 1, everything else -> 0.
double featureValue(const std::string& feature, const MetricsVector& m, const SimulationParams& p);
double missingFeatureDefault(const std::string& feature);

double logistic(double z);

class SpecialScorer {
public:
    static constexpr double kStdEpsilon = 1e-6;

    SpecialScorer();
    explicit SpecialScorer(SpecialModel model);

    const SpecialModel& model() const { return model_; }

    // Probability in [0,1].
    double score(const MetricsVector& m, const SimulationParams& p) const;

private:
    SpecialModel model_;
};

} // namespace rdscan
