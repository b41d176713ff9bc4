#include "geoliner/interaction/snap_solver.h"
#include "geoliner/geometry/panel_geometry.h"

#include <cmath>
#include <limits>

namespace geoliner {

namespace {
    struct SnapAxisBest {
        bool snapped{false};
        float delta{0.0f};
        float guide{0.0f};
        float dist{std::numeric_limits<float>::infinity()};
        std::uint32_t targetId{0};
    };

    inline void considerAxis(float candidate, std::uint32_t targetId, const float* movingEdges, std::uint32_t count, float tol, SnapAxisBest& best) {
        for (std::uint32_t i = 0; i < count; i++) {
            const float delta = candidate - movingEdges[i];
            const float dist = std::abs(delta);
            if (dist <= tol && dist < best.dist) {
                best.dist = dist;
                best.delta = delta;
                best.guide = candidate;
                best.snapped = true;
                best.targetId = targetId;
            }
        }
    }

    inline bool isFiniteAabb(const AABB& b) {
        return std::isfinite(b.minX) && std::isfinite(b.minY) && std::isfinite(b.maxX) && std::isfinite(b.maxY);
    }
}

SnapOptions snapOptionsFromSite(const SiteConfig& site) {
    SnapOptions options;
    options.gridEnabled = site.snapEnabled && site.gridSize > 0.0f;
    options.gridSize = site.gridSize;
    options.edgeEnabled = site.snapEnabled && site.edgeSnapThreshold > 0.0f;
    options.edgeThreshold = site.edgeSnapThreshold;
    return options;
}

float snapToGrid(float value, float gridSize) noexcept {
    if (!(gridSize > 0.0f) || !std::isfinite(gridSize) || !std::isfinite(value)) return value;
    return std::round(value / gridSize) * gridSize;
}

Point2 snapPointToGrid(Point2 p, float gridSize) noexcept {
    return Point2{ snapToGrid(p.x, gridSize), snapToGrid(p.y, gridSize) };
}

SnapResult computeEdgeSnap(
    const SnapOptions& options,
    std::uint32_t movingId,
    const AABB& moving,
    const std::vector<Panel>& panels,
    const AABB& guideSpan,
    std::vector<SnapGuide>& outGuides) {
    SnapResult result;
    outGuides.clear();

    if (!options.edgeEnabled || !(options.edgeThreshold > 0.0f) || !isFiniteAabb(moving)) {
        return result;
    }

    const float tol = options.edgeThreshold;
    const float movingXs[2] = { moving.minX, moving.maxX };
    const float movingYs[2] = { moving.minY, moving.maxY };

    SnapAxisBest bestX;
    SnapAxisBest bestY;

    for (const Panel& other : panels) {
        if (other.id == movingId) continue;
        if (isDegenerate(other)) continue;

        const AABB aabb = panelFootprint(other);
        if (!isFiniteAabb(aabb)) continue;

        considerAxis(aabb.minX, other.id, movingXs, 2, tol, bestX);
        considerAxis(aabb.maxX, other.id, movingXs, 2, tol, bestX);
        considerAxis(aabb.minY, other.id, movingYs, 2, tol, bestY);
        considerAxis(aabb.maxY, other.id, movingYs, 2, tol, bestY);
    }

    if (bestX.snapped) {
        result.snappedX = true;
        result.dx = bestX.delta;
        result.targetX = bestX.targetId;
        outGuides.push_back(SnapGuide{ bestX.guide, guideSpan.minY, bestX.guide, guideSpan.maxY });
    }
    if (bestY.snapped) {
        result.snappedY = true;
        result.dy = bestY.delta;
        result.targetY = bestY.targetId;
        outGuides.push_back(SnapGuide{ guideSpan.minX, bestY.guide, guideSpan.maxX, bestY.guide });
    }
    return result;
}

Point2 solveDragSnap(
    const SnapOptions& options,
    const Panel& moving,
    Point2 raw,
    const std::vector<Panel>& panels,
    const AABB& guideSpan,
    std::vector<SnapGuide>& outGuides) {
    Point2 out = raw;
    if (options.gridEnabled) {
        out = snapPointToGrid(raw, options.gridSize);
    }

    Panel probe = moving;
    const float dx = raw.x - moving.x;
    const float dy = raw.y - moving.y;
    probe.x = raw.x;
    probe.y = raw.y;
    for (Point2& c : probe.corners) {
        c.x += dx;
        c.y += dy;
    }

    const SnapResult edge = computeEdgeSnap(options, moving.id, panelFootprint(probe), panels, guideSpan, outGuides);
    if (edge.snappedX) out.x = raw.x + edge.dx;
    if (edge.snappedY) out.y = raw.y + edge.dy;
    return out;
}

} // namespace geoliner
