#include "Evaluator.h"

#include <cmath>
#include <random>

namespace rdscan {

Evaluator::Evaluator()
    : reader_(&Evaluator::readSnapshot) {}

Evaluator::Evaluator(const EvaluationOptions& options)
    : options_(options), reader_(&Evaluator::readSnapshot) {}

void Evaluator::setSnapshotReader(SnapshotReader reader) {
    reader_ = reader ? std::move(reader) : SnapshotReader(&Evaluator::readSnapshot);
}

bool Evaluator::readSnapshot(const GridState& state, Snapshot& out) {
    if (state.empty()) return false;
    out = state.snapshot();
    for (std::size_t i = 0; i < out.u.size(); ++i) {
        if (!std::isfinite(out.u[i]) || !std::isfinite(out.v[i])) {
            return false;
        }
    }
    return true;
}

bool Evaluator::isSampleStep(int step, int totalIterations, int sampleInterval) {
    const int interval = sampleInterval < 1 ? 1 : sampleInterval;
    return (step % interval) == 0 || step == totalIterations;
}

EvaluationResult Evaluator::evaluateOne(const SimulationParams& params) const {
    EvaluationResult result;
    result.params = params;

    if (!validateParams(params, &result.error)) {
        result.valid = false;
        return result;
    }
    if (options_.resolution <= 0) {
        result.valid = false;
        result.error = "resolution must be positive";
        return result;
    }

    // Grid lives for this candidate only; released on every return path.
    GridState grid;
    std::mt19937 rng(options_.seed);
    GridSimulator::seed(grid, options_.resolution, rng);

    Snapshot previous;
    bool havePrevious = false;
    const int total = options_.totalIterations;

    for (int step = 1; step <= total; ++step) {
        GridSimulator::step(grid, params, 1);

        if (!isSampleStep(step, total, options_.sampleInterval)) continue;

        Snapshot current;
        if (!reader_(grid, current)) {
            ++result.failedSamples;
            continue;
        }
        MetricsResult m = MetricsExtractor::extract(current, havePrevious ? &previous : nullptr);
        result.samples.push_back(m.metrics);
        previous = std::move(m.snapshot);
        havePrevious = true;
    }

    result.average = MetricsExtractor::average(result.samples);
    return result;
}

std::vector<EvaluationResult> Evaluator::evaluate(const std::vector<SimulationParams>& paramsList,
                                                  const ProgressFn& onProgress) const {
    std::vector<EvaluationResult> results;
    results.reserve(paramsList.size());
    const int total = static_cast<int>(paramsList.size());

    for (int i = 0; i < total; ++i) {
        if (onProgress) onProgress(i, total);
        results.push_back(evaluateOne(paramsList[static_cast<std::size_t>(i)]));
    }
    if (onProgress) onProgress(total, total);
    return results;
}

} // namespace rdscan
