#include "GridSimulator.h"

#include <algorithm>
#include <cmath>

namespace rdscan {

namespace {

// 9-point stencil weights; they sum to 1 so a flat field gives zero.
constexpr float kOrthoWeight = 0.2f;
constexpr float kDiagWeight = 0.05f;

static inline float clamp01f(float x) {
    return (x < 0.0f) ? 0.0f : (x > 1.0f) ? 1.0f : x;
}

static inline float laplacian(const std::vector<float>& f, int n, int x, int y,
                              int xm, int xp, int ym, int yp) {
    const auto at = [&](int cx, int cy) {
        return f[static_cast<std::size_t>(cx) + static_cast<std::size_t>(cy) * static_cast<std::size_t>(n)];
    };
    const float ortho = at(xm, y) + at(xp, y) + at(x, ym) + at(x, yp);
    const float diag = at(xm, ym) + at(xp, ym) + at(xm, yp) + at(xp, yp);
    return kOrthoWeight * ortho + kDiagWeight * diag - at(x, y);
}

} // namespace

GridState::GridState(int size) {
    allocate(size);
}

void GridState::allocate(int size) {
    if (size <= 0) {
        release();
        return;
    }
    if (size == size_ && u_.size() == static_cast<std::size_t>(size) * static_cast<std::size_t>(size)) {
        return;
    }
    const std::size_t n = static_cast<std::size_t>(size) * static_cast<std::size_t>(size);
    size_ = size;
    u_.assign(n, 0.0f);
    v_.assign(n, 0.0f);
    u_next_.assign(n, 0.0f);
    v_next_.assign(n, 0.0f);
}

void GridState::release() {
    size_ = 0;
    std::vector<float>().swap(u_);
    std::vector<float>().swap(v_);
    std::vector<float>().swap(u_next_);
    std::vector<float>().swap(v_next_);
}

void GridState::set(int x, int y, float u, float v) {
    const std::size_t i = index(x, y);
    u_[i] = u;
    v_[i] = v;
}

void GridState::fill(float u, float v) {
    std::fill(u_.begin(), u_.end(), u);
    std::fill(v_.begin(), v_.end(), v);
}

Snapshot GridState::snapshot() const {
    Snapshot s;
    s.width = size_;
    s.height = size_;
    s.u = u_;
    s.v = v_;
    return s;
}

bool GridSimulator::step(GridState& state, const SimulationParams& params, int iterations) {
    if (iterations < 1 || state.empty()) return false;
    if (!validateParams(params)) return false;

    for (int i = 0; i < iterations; ++i) {
        stepOnce(state, params);
    }
    return true;
}

void GridSimulator::stepOnce(GridState& state, const SimulationParams& params) {
    const int n = state.size_;
    const float du = static_cast<float>(params.du);
    const float dv = static_cast<float>(params.dv);
    const float feed = static_cast<float>(params.feed);
    const float kill = static_cast<float>(params.kill);
    const float dt = static_cast<float>(params.dt);

    const std::vector<float>& U = state.u_;
    const std::vector<float>& V = state.v_;
    std::vector<float>& Un = state.u_next_;
    std::vector<float>& Vn = state.v_next_;

    for (int y = 0; y < n; ++y) {
        // Toroidal wrap.
        const int ym = (y == 0) ? n - 1 : y - 1;
        const int yp = (y == n - 1) ? 0 : y + 1;
        for (int x = 0; x < n; ++x) {
            const int xm = (x == 0) ? n - 1 : x - 1;
            const int xp = (x == n - 1) ? 0 : x + 1;
            const std::size_t i = state.index(x, y);

            const float u = U[i];
            const float v = V[i];
            const float lapU = laplacian(U, n, x, y, xm, xp, ym, yp);
            const float lapV = laplacian(V, n, x, y, xm, xp, ym, yp);
            const float reaction = u * v * v;

            const float nu = u + dt * (du * lapU - reaction + feed * (1.0f - u));
            const float nv = v + dt * (dv * lapV + reaction - (feed + kill) * v);
            Un[i] = clamp01f(nu);
            Vn[i] = clamp01f(nv);
        }
    }

    state.u_.swap(state.u_next_);
    state.v_.swap(state.v_next_);
}

void GridSimulator::seed(GridState& state, int size, std::mt19937& rng) {
    state.allocate(size);
    if (state.empty()) return;

    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    const float center = static_cast<float>(size) * 0.5f;
    const float radius = static_cast<float>(size * kSeedRadiusFraction);
    const float amp = static_cast<float>(kSeedNoiseAmplitude);

    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            const float dx = static_cast<float>(x) - center;
            const float dy = static_cast<float>(y) - center;
            const float dist = std::sqrt(dx * dx + dy * dy);
            const float noise = unit(rng) * amp;
            const float u = 1.0f - noise;
            const float v = (dist < radius) ? 0.6f + unit(rng) * 0.2f : noise;
            state.set(x, y, u, v);
        }
    }
}

void GridSimulator::reset(GridState& state, int size, std::mt19937& rng) {
    seed(state, size, rng);
}

} // namespace rdscan
