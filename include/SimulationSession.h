#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "GridSimulator.h"
#include "Metrics.h"
#include "Params.h"

namespace rdscan {

// Parameters + resolution handed back by the bookmark collaborator.
struct SessionLoadRequest {
    SimulationParams params{};
    int resolution = 512;
};

// Live simulation behind the interactive view. Owns exactly one grid; the
// view reads snapshots and pushes parameter edits, it never draws through us.
class SimulationSession {
public:
    static constexpr int kDefaultResolution = 512;
    static constexpr std::array<int, 5> kResolutionOptions{256, 384, 512, 768, 1024};
    static constexpr std::array<int, 4> kSpeedOptions{1, 2, 4, 8};

    explicit SimulationSession(int resolution = kDefaultResolution, std::uint32_t seed = 0x5eedu);

    SimulationSession(const SimulationSession&) = delete;
    SimulationSession& operator=(const SimulationSession&) = delete;

    // Rejected (state unchanged) when validation fails.
    bool applyParameters(const SimulationParams& params, std::string* why = nullptr);
    const SimulationParams& params() const { return params_; }

    // Re-seeds in place and forgets the previous metrics snapshot.
    void resetState();
    void resetToDefaults();

    bool setResolution(int resolution);
    int resolution() const { return resolution_; }

    void setRunning(bool running) { running_ = running; }
    bool running() const { return running_; }

    bool setStepsPerFrame(int steps);
    int stepsPerFrame() const { return steps_per_frame_; }

    // Steps `stepsPerFrame` iterations when running. Returns iterations run.
    int advanceFrame();
    std::uint64_t iterations() const { return iterations_; }

    Snapshot currentSnapshot() const { return grid_.snapshot(); }
    const GridState& grid() const { return grid_; }

    // Metrics against the last collected snapshot; keeps the new one.
    MetricsVector collectMetrics();

    // Apply, resize, pause, reset.
    bool loadBookmark(const SessionLoadRequest& request, std::string* why = nullptr);

    static bool isResolutionOption(int resolution);

private:
    GridState grid_;
    SimulationParams params_{};
    int resolution_ = kDefaultResolution;
    bool running_ = true;
    int steps_per_frame_ = 1;
    std::uint64_t iterations_ = 0;
    std::mt19937 rng_;
    std::optional<Snapshot> previous_;
};

} // namespace rdscan
