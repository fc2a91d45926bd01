#pragma once

#include <random>
#include <vector>

#include "Params.h"

namespace rdscan {

// Narrowed sub-range of a field plus its Gaussian jitter (fraction of span).
struct BandSpec {
    ParamRange band{};
    double jitter = 0.0;
};

struct GoldilocksBand {
    ParamRange du{0.04, 0.95};
    ParamRange dv{0.009, 0.32};
    BandSpec feed{{0.001, 0.1}, 0.10};
    BandSpec kill{{0.021, 0.077}, 0.10};
    BandSpec dt{{1.3, 1.7}, 0.25};
    BandSpec threshold{{0.16, 0.24}, 0.35};
    BandSpec contrast{{1.5, 5.0}, 0.20};
    BandSpec gamma{{0.2, 1.1}, 0.25};
    // Chance of drawing invert at all; the draw is then a fair coin.
    double invertRollChance = 0.18;
};

const GoldilocksBand& goldilocksBand();

struct SamplingPolicy {
    double goldilocksChance = 0.5;
    // Second, independent coin for the perturb-around-special strategy.
    double perturbChance = 0.7;
    int minSpecials = 5;
    // Perturbation sigma as a fraction of each field's valid range.
    double perturbScale = 0.12;
    double invertFlipChance = 0.3;
    double uniformInvertChance = 0.45;
};

enum class SampleStrategy : int {
    Goldilocks = 0,
    PerturbSpecial = 1,
    Uniform = 2,
};

const char* sampleStrategyName(SampleStrategy s);

SimulationParams sampleGoldilocks(std::mt19937& rng, const GoldilocksBand& band = goldilocksBand());

SimulationParams samplePerturbed(const SimulationParams& base, std::mt19937& rng,
                                 const SamplingPolicy& policy = SamplingPolicy());

SimulationParams sampleUniform(std::mt19937& rng, const SamplingPolicy& policy = SamplingPolicy());

// Mixture of the three strategies. `specials` are the parameter sets of
// special-labelled records; `used` (optional) reports the chosen strategy.
SimulationParams sampleCandidate(std::mt19937& rng,
                                 const std::vector<SimulationParams>& specials,
                                 const SamplingPolicy& policy = SamplingPolicy(),
                                 SampleStrategy* used = nullptr);

} // namespace rdscan
