#include "SimulationSession.h"

#include <algorithm>
#include <utility>

namespace rdscan {

SimulationSession::SimulationSession(int resolution, std::uint32_t seed)
    : params_(defaultParams()),
      resolution_(resolution > 0 ? resolution : kDefaultResolution),
      rng_(seed) {
    GridSimulator::seed(grid_, resolution_, rng_);
}

bool SimulationSession::isResolutionOption(int resolution) {
    return std::find(kResolutionOptions.begin(), kResolutionOptions.end(), resolution) != kResolutionOptions.end();
}

bool SimulationSession::applyParameters(const SimulationParams& params, std::string* why) {
    if (!validateParams(params, why)) return false;
    params_ = params;
    return true;
}

void SimulationSession::resetState() {
    GridSimulator::reset(grid_, resolution_, rng_);
    previous_.reset();
    iterations_ = 0;
}

void SimulationSession::resetToDefaults() {
    params_ = defaultParams();
    resetState();
}

bool SimulationSession::setResolution(int resolution) {
    if (resolution <= 0) return false;
    resolution_ = resolution;
    resetState();
    return true;
}

bool SimulationSession::setStepsPerFrame(int steps) {
    if (steps < 1) return false;
    steps_per_frame_ = steps;
    return true;
}

int SimulationSession::advanceFrame() {
    if (!running_) return 0;
    if (!GridSimulator::step(grid_, params_, steps_per_frame_)) return 0;
    iterations_ += static_cast<std::uint64_t>(steps_per_frame_);
    return steps_per_frame_;
}

MetricsVector SimulationSession::collectMetrics() {
    MetricsResult r = MetricsExtractor::extract(grid_.snapshot(), previous_ ? &*previous_ : nullptr);
    previous_ = std::move(r.snapshot);
    return r.metrics;
}

bool SimulationSession::loadBookmark(const SessionLoadRequest& request, std::string* why) {
    if (request.resolution <= 0) {
        if (why) *why = "resolution must be positive";
        return false;
    }
    if (!applyParameters(request.params, why)) return false;
    running_ = false;
    resolution_ = request.resolution;
    resetState();
    return true;
}

} // namespace rdscan
