#pragma once

#include <array>
#include <string>

namespace rdscan {

// Gray-Scott parameter set. The display fields (threshold, contrast, gamma,
// invert) are carried through the core unchanged.
struct SimulationParams {
    double du = 0.16;
    double dv = 0.08;
    double feed = 0.06;
    double kill = 0.062;
    double dt = 1.0;
    double threshold = 0.2;
    double contrast = 1.5;
    double gamma = 1.1;
    bool invert = false;
};

enum class ParamKey : int {
    Du = 0,
    Dv,
    Feed,
    Kill,
    Dt,
    Threshold,
    Contrast,
    Gamma,
    Invert,
    Count
};

constexpr int kNumParamKeys = static_cast<int>(ParamKey::Count);

struct ParamRange {
    double min = 0.0;
    double max = 0.0;

    double span() const { return max - min; }
};

const char* paramKeyName(ParamKey key);
bool parseParamKey(const std::string& name, ParamKey& out);

// invert reads as 0/1.
double paramValue(const SimulationParams& p, ParamKey key);
void setParamValue(SimulationParams& p, ParamKey key, double value);

// Global valid range per numeric field. Invert has no range ([0,1]).
ParamRange validRange(ParamKey key);

// Non-finite or negative (where disallowed) fields fail. `why` is optional.
bool validateParams(const SimulationParams& p, std::string* why = nullptr);

SimulationParams defaultParams();

} // namespace rdscan
