#pragma once

#include "geoliner/core/types.h"
#include "geoliner/interaction/snap_types.h"

#include <cstdint>
#include <vector>

namespace geoliner {

struct SnapResult {
    float dx{0.0f};
    float dy{0.0f};
    bool snappedX{false};
    bool snappedY{false};
    // Panel whose edge won on each axis (0 when the axis did not fire).
    std::uint32_t targetX{0};
    std::uint32_t targetY{0};
};

SnapOptions snapOptionsFromSite(const SiteConfig& site);

// round(v / gridSize) * gridSize; identity for a non-positive grid.
float snapToGrid(float value, float gridSize) noexcept;
Point2 snapPointToGrid(Point2 p, float gridSize) noexcept;

// Neighbor-edge snap of an axis-aligned footprint against every other
// non-degenerate panel. Axes are independent; the closest edge pair per axis
// wins. Guides span `guideSpan` along the opposite axis.
SnapResult computeEdgeSnap(
    const SnapOptions& options,
    std::uint32_t movingId,
    const AABB& moving,
    const std::vector<Panel>& panels,
    const AABB& guideSpan,
    std::vector<SnapGuide>& outGuides);

// Position for a dragged panel whose unsnapped top-left is `raw`.
// Grid snap first; a neighbor-edge hit detected on the raw footprint then
// overrides the grid value on its axis.
Point2 solveDragSnap(
    const SnapOptions& options,
    const Panel& moving,
    Point2 raw,
    const std::vector<Panel>& panels,
    const AABB& guideSpan,
    std::vector<SnapGuide>& outGuides);

} // namespace geoliner
