#include "Sampling.h"

namespace rdscan {

namespace {

static inline double clamp(double x, double lo, double hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

static inline double uniform(std::mt19937& rng, double lo, double hi) {
    std::uniform_real_distribution<double> d(0.0, 1.0);
    return lo + d(rng) * (hi - lo);
}

static inline double unit(std::mt19937& rng) {
    std::uniform_real_distribution<double> d(0.0, 1.0);
    return d(rng);
}

static inline double normal(std::mt19937& rng) {
    std::normal_distribution<double> d(0.0, 1.0);
    return d(rng);
}

double jittered(std::mt19937& rng, const BandSpec& spec) {
    const double span = spec.band.span();
    if (span <= 0.0) return spec.band.min;
    const double base = uniform(rng, spec.band.min, spec.band.max);
    const double offset = normal(rng) * span * spec.jitter;
    return clamp(base + offset, spec.band.min, spec.band.max);
}

double clampToRange(double v, ParamKey key) {
    const ParamRange r = validRange(key);
    return clamp(v, r.min, r.max);
}

double perturb(double v, ParamKey key, double scale, std::mt19937& rng) {
    const ParamRange r = validRange(key);
    return clamp(v + normal(rng) * r.span() * scale, r.min, r.max);
}

} // namespace

const GoldilocksBand& goldilocksBand() {
    static const GoldilocksBand band{};
    return band;
}

const char* sampleStrategyName(SampleStrategy s) {
    switch (s) {
        case SampleStrategy::Goldilocks:     return "goldilocks";
        case SampleStrategy::PerturbSpecial: return "perturb";
        case SampleStrategy::Uniform:        return "uniform";
        default:                             return "unknown";
    }
}

SimulationParams sampleGoldilocks(std::mt19937& rng, const GoldilocksBand& band) {
    SimulationParams p;
    p.du = clampToRange(uniform(rng, band.du.min, band.du.max), ParamKey::Du);
    p.dv = clampToRange(uniform(rng, band.dv.min, band.dv.max), ParamKey::Dv);
    p.feed = clampToRange(jittered(rng, band.feed), ParamKey::Feed);
    p.kill = clampToRange(jittered(rng, band.kill), ParamKey::Kill);
    p.dt = clampToRange(jittered(rng, band.dt), ParamKey::Dt);
    p.threshold = clampToRange(jittered(rng, band.threshold), ParamKey::Threshold);
    p.contrast = clampToRange(jittered(rng, band.contrast), ParamKey::Contrast);
    p.gamma = clampToRange(jittered(rng, band.gamma), ParamKey::Gamma);
    p.invert = (unit(rng) < band.invertRollChance) ? (unit(rng) < 0.5) : false;
    return p;
}

SimulationParams samplePerturbed(const SimulationParams& base, std::mt19937& rng,
                                 const SamplingPolicy& policy) {
    SimulationParams p;
    const double s = policy.perturbScale;
    p.du = perturb(base.du, ParamKey::Du, s, rng);
    p.dv = perturb(base.dv, ParamKey::Dv, s, rng);
    p.feed = perturb(base.feed, ParamKey::Feed, s, rng);
    p.kill = perturb(base.kill, ParamKey::Kill, s, rng);
    p.dt = perturb(base.dt, ParamKey::Dt, s, rng);
    p.threshold = perturb(base.threshold, ParamKey::Threshold, s, rng);
    p.contrast = perturb(base.contrast, ParamKey::Contrast, s, rng);
    p.gamma = perturb(base.gamma, ParamKey::Gamma, s, rng);
    p.invert = (unit(rng) < policy.invertFlipChance) ? !base.invert : base.invert;
    return p;
}

SimulationParams sampleUniform(std::mt19937& rng, const SamplingPolicy& policy) {
    SimulationParams p;
    for (int i = 0; i < kNumParamKeys; ++i) {
        const ParamKey key = static_cast<ParamKey>(i);
        if (key == ParamKey::Invert) continue;
        const ParamRange r = validRange(key);
        setParamValue(p, key, uniform(rng, r.min, r.max));
    }
    p.invert = unit(rng) < policy.uniformInvertChance;
    return p;
}

SimulationParams sampleCandidate(std::mt19937& rng,
                                 const std::vector<SimulationParams>& specials,
                                 const SamplingPolicy& policy,
                                 SampleStrategy* used) {
    if (unit(rng) < policy.goldilocksChance) {
        if (used) *used = SampleStrategy::Goldilocks;
        return sampleGoldilocks(rng);
    }

    if (static_cast<int>(specials.size()) >= policy.minSpecials && unit(rng) < policy.perturbChance) {
        std::uniform_int_distribution<std::size_t> pick(0, specials.size() - 1);
        if (used) *used = SampleStrategy::PerturbSpecial;
        return samplePerturbed(specials[pick(rng)], rng, policy);
    }

    if (used) *used = SampleStrategy::Uniform;
    return sampleUniform(rng, policy);
}

} // namespace rdscan
