#pragma once

#include <optional>
#include <string>
#include <vector>

#include "FeedbackStore.h"
#include "Params.h"

namespace rdscan {

struct HeatmapAxis {
    ParamKey key = ParamKey::Feed;
    std::string label;
    double min = 0.0;
    double max = 0.0;
    int bins = 0;
};

struct HeatmapCell {
    int count = 0;
    double normalized = 0.0; // count / maxCount
};

struct Heatmap {
    std::string labelX;
    std::string labelY;
    std::vector<std::string> ticksX;
    std::vector<std::string> ticksY;
    int width = 0;  // bins along X
    int height = 0; // bins along Y
    // Row-major, grid[y * width + x].
    std::vector<HeatmapCell> grid;
    int total = 0;    // accepted (in-range) records
    int maxCount = 0;

    const HeatmapCell& at(int x, int y) const {
        return grid[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)];
    }
};

// Bin index for `value` on `axis`, clamped to [0, bins-1]. Degenerate axes
// (no bins, empty or inverted range) and non-finite values map to 0.
int heatmapBinIndex(const HeatmapAxis& axis, double value);
std::vector<std::string> heatmapTicks(const HeatmapAxis& axis);

// std::nullopt means "nothing to show": no records, no bins, a
// non-positive range, or nothing in range.
std::optional<Heatmap> buildHeatmap(const std::vector<SimulationParams>& points,
                                    const HeatmapAxis& axisX,
                                    const HeatmapAxis& axisY);

std::optional<Heatmap> buildHeatmap(const std::vector<FeedbackRecord>& records,
                                    const HeatmapAxis& axisX,
                                    const HeatmapAxis& axisY);

} // namespace rdscan
