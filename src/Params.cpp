#include "Params.h"

#include <cmath>

namespace rdscan {

namespace {

constexpr std::array<const char*, kNumParamKeys> kKeyNames{{
    "du", "dv", "feed", "kill", "dt", "threshold", "contrast", "gamma", "invert"
}};

constexpr std::array<ParamRange, kNumParamKeys> kValidRanges{{
    {0.02, 1.0},   // du
    {0.005, 0.4},  // dv
    {0.001, 0.12}, // feed
    {0.02, 0.08},  // kill
    {0.5, 2.0},    // dt
    {0.05, 0.4},   // threshold
    {0.8, 5.0},    // contrast
    {0.2, 1.5},    // gamma
    {0.0, 1.0},    // invert
}};

bool checkField(const char* name, double v, std::string* why) {
    if (!std::isfinite(v)) {
        if (why) *why = std::string(name) + " is not finite";
        return false;
    }
    if (v < 0.0) {
        if (why) *why = std::string(name) + " is negative";
        return false;
    }
    return true;
}

} // namespace

const char* paramKeyName(ParamKey key) {
    const int i = static_cast<int>(key);
    if (i < 0 || i >= kNumParamKeys) return "unknown";
    return kKeyNames[static_cast<std::size_t>(i)];
}

bool parseParamKey(const std::string& name, ParamKey& out) {
    for (int i = 0; i < kNumParamKeys; ++i) {
        if (name == kKeyNames[static_cast<std::size_t>(i)]) {
            out = static_cast<ParamKey>(i);
            return true;
        }
    }
    return false;
}

double paramValue(const SimulationParams& p, ParamKey key) {
    switch (key) {
        case ParamKey::Du:        return p.du;
        case ParamKey::Dv:        return p.dv;
        case ParamKey::Feed:      return p.feed;
        case ParamKey::Kill:      return p.kill;
        case ParamKey::Dt:        return p.dt;
        case ParamKey::Threshold: return p.threshold;
        case ParamKey::Contrast:  return p.contrast;
        case ParamKey::Gamma:     return p.gamma;
        case ParamKey::Invert:    return p.invert ? 1.0 : 0.0;
        default:                  return 0.0;
    }
}

void setParamValue(SimulationParams& p, ParamKey key, double value) {
    switch (key) {
        case ParamKey::Du:        p.du = value; break;
        case ParamKey::Dv:        p.dv = value; break;
        case ParamKey::Feed:      p.feed = value; break;
        case ParamKey::Kill:      p.kill = value; break;
        case ParamKey::Dt:        p.dt = value; break;
        case ParamKey::Threshold: p.threshold = value; break;
        case ParamKey::Contrast:  p.contrast = value; break;
        case ParamKey::Gamma:     p.gamma = value; break;
        case ParamKey::Invert:    p.invert = value >= 0.5; break;
        default: break;
    }
}

ParamRange validRange(ParamKey key) {
    const int i = static_cast<int>(key);
    if (i < 0 || i >= kNumParamKeys) return ParamRange{};
    return kValidRanges[static_cast<std::size_t>(i)];
}

bool validateParams(const SimulationParams& p, std::string* why) {
    return checkField("du", p.du, why) &&
           checkField("dv", p.dv, why) &&
           checkField("feed", p.feed, why) &&
           checkField("kill", p.kill, why) &&
           checkField("dt", p.dt, why) &&
           checkField("threshold", p.threshold, why) &&
           checkField("contrast", p.contrast, why) &&
           checkField("gamma", p.gamma, why);
}

SimulationParams defaultParams() {
    return SimulationParams{};
}

} // namespace rdscan
