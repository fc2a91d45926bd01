#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "Params.h"

namespace rdscan {

// Planar copy of both fields, row-major, width*height each.
struct Snapshot {
    int width = 0;
    int height = 0;
    std::vector<float> u;
    std::vector<float> v;

    std::size_t cellCount() const { return u.size(); }
    bool sameShape(const Snapshot& o) const {
        return width == o.width && height == o.height &&
               u.size() == o.u.size() && v.size() == o.v.size();
    }
};

// N x N toroidal grid of two scalar fields. Owned by exactly one run.
class GridState {
public:
    GridState() = default;
    explicit GridState(int size);

    // Re-sizes only when `size` differs from the current footprint.
    void allocate(int size);
    void release();

    int size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ <= 0; }
    std::size_t cellCount() const noexcept { return u_.size(); }

    float u(int x, int y) const { return u_[index(x, y)]; }
    float v(int x, int y) const { return v_[index(x, y)]; }
    void set(int x, int y, float u, float v);
    void fill(float u, float v);

    const std::vector<float>& uField() const { return u_; }
    const std::vector<float>& vField() const { return v_; }

    Snapshot snapshot() const;

private:
    friend class GridSimulator;

    std::size_t index(int x, int y) const {
        return static_cast<std::size_t>(x) + static_cast<std::size_t>(y) * static_cast<std::size_t>(size_);
    }

    int size_ = 0;
    std::vector<float> u_;
    std::vector<float> v_;
    // Scratch targets for the double-buffered update.
    std::vector<float> u_next_;
    std::vector<float> v_next_;
};

class GridSimulator {
public:
    // Disk radius as a fraction of the grid size.
    static constexpr double kSeedRadiusFraction = 0.12;
    static constexpr double kSeedNoiseAmplitude = 0.02;

    // Advances the fields by `iterations` updates in place. Returns false
    // (grid untouched) for invalid params, iterations < 1 or an empty grid.
    static bool step(GridState& state, const SimulationParams& params, int iterations = 1);

    // U ~ 1, V raised inside a centred disk of radius 0.12*size.
    static void seed(GridState& state, int size, std::mt19937& rng);

    // Re-seeds, keeping the allocation when the size is unchanged.
    static void reset(GridState& state, int size, std::mt19937& rng);

private:
    static void stepOnce(GridState& state, const SimulationParams& params);
};

} // namespace rdscan
