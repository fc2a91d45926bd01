#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "GridSimulator.h"
#include "Metrics.h"
#include "Params.h"

namespace rdscan {

struct EvaluationOptions {
    int resolution = 128;
    int totalIterations = 200;
    int sampleInterval = 20;
    // Every candidate is seeded from this value so runs are comparable.
    std::uint32_t seed = 1337u;
};

struct EvaluationResult {
    SimulationParams params{};
    std::vector<MetricsVector> samples;
    MetricsVector average{};

    // Read-backs that failed; excluded from `samples` and `average`.
    int failedSamples = 0;

    // False when the parameters were rejected before any grid work.
    bool valid = true;
    std::string error;
};

class Evaluator {
public:
    using ProgressFn = std::function<void(int processed, int total)>;
    // Copies the grid into `out`; returning false marks a failed sample.
    using SnapshotReader = std::function<bool(const GridState& state, Snapshot& out)>;

    Evaluator();
    explicit Evaluator(const EvaluationOptions& options);

    void setOptions(const EvaluationOptions& options) { options_ = options; }
    const EvaluationOptions& options() const { return options_; }

    void setSnapshotReader(SnapshotReader reader);

    // Sequential; each parameter set gets its own grid for the run.
    std::vector<EvaluationResult> evaluate(const std::vector<SimulationParams>& paramsList,
                                           const ProgressFn& onProgress = ProgressFn()) const;

    EvaluationResult evaluateOne(const SimulationParams& params) const;

    // Default reader: copy, fail on non-finite cells.
    static bool readSnapshot(const GridState& state, Snapshot& out);

    // True on the steps where a sample is taken (1-based step index).
    static bool isSampleStep(int step, int totalIterations, int sampleInterval);

private:
    EvaluationOptions options_{};
    SnapshotReader reader_;
};

} // namespace rdscan
