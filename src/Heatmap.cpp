#include "Heatmap.h"

#include <cmath>
#include <cstdio>

namespace rdscan {

int heatmapBinIndex(const HeatmapAxis& axis, double value) {
    const double range = axis.max - axis.min;
    if (axis.bins <= 0 || !(range > 0.0) || !std::isfinite(range) || !std::isfinite(value)) return 0;
    const double raw = std::floor(static_cast<double>(axis.bins) * (value - axis.min) / range);
    if (raw < 0.0) return 0;
    if (raw > static_cast<double>(axis.bins - 1)) return axis.bins - 1;
    return static_cast<int>(raw);
}

std::vector<std::string> heatmapTicks(const HeatmapAxis& axis) {
    std::vector<std::string> ticks;
    if (axis.bins <= 0) return ticks;
    const double step = (axis.max - axis.min) / axis.bins;
    ticks.reserve(static_cast<std::size_t>(axis.bins));
    for (int i = 0; i < axis.bins; ++i) {
        const double center = axis.min + step * (i + 0.5);
        char buf[32];
        std::snprintf(buf, sizeof(buf), center >= 1.0 ? "%.2f" : "%.3f", center);
        ticks.emplace_back(buf);
    }
    return ticks;
}

std::optional<Heatmap> buildHeatmap(const std::vector<SimulationParams>& points,
                                    const HeatmapAxis& axisX,
                                    const HeatmapAxis& axisY) {
    if (points.empty()) return std::nullopt;
    if (axisX.bins <= 0 || axisY.bins <= 0) return std::nullopt;
    if (!(axisX.max - axisX.min > 0.0) || !(axisY.max - axisY.min > 0.0)) return std::nullopt;

    Heatmap h;
    h.labelX = axisX.label.empty() ? paramKeyName(axisX.key) : axisX.label;
    h.labelY = axisY.label.empty() ? paramKeyName(axisY.key) : axisY.label;
    h.width = axisX.bins;
    h.height = axisY.bins;
    h.grid.assign(static_cast<std::size_t>(h.width) * static_cast<std::size_t>(h.height), HeatmapCell{});

    for (const auto& p : points) {
        const double x = paramValue(p, axisX.key);
        const double y = paramValue(p, axisY.key);
        if (!std::isfinite(x) || !std::isfinite(y)) continue;
        // Inclusive on both ends.
        if (x < axisX.min || x > axisX.max || y < axisY.min || y > axisY.max) continue;

        const int ix = heatmapBinIndex(axisX, x);
        const int iy = heatmapBinIndex(axisY, y);
        HeatmapCell& cell = h.grid[static_cast<std::size_t>(iy) * static_cast<std::size_t>(h.width) +
                                   static_cast<std::size_t>(ix)];
        cell.count += 1;
        h.total += 1;
        if (cell.count > h.maxCount) h.maxCount = cell.count;
    }

    if (h.total == 0 || h.maxCount == 0) return std::nullopt;

    const double inv = 1.0 / static_cast<double>(h.maxCount);
    for (auto& cell : h.grid) {
        cell.normalized = (cell.count == h.maxCount) ? 1.0 : cell.count * inv;
    }

    h.ticksX = heatmapTicks(axisX);
    h.ticksY = heatmapTicks(axisY);
    return h;
}

std::optional<Heatmap> buildHeatmap(const std::vector<FeedbackRecord>& records,
                                    const HeatmapAxis& axisX,
                                    const HeatmapAxis& axisY) {
    std::vector<SimulationParams> points;
    points.reserve(records.size());
    for (const auto& r : records) {
        points.push_back(r.params);
    }
    return buildHeatmap(points, axisX, axisY);
}

} // namespace rdscan
