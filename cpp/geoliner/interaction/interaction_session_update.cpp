#include "geoliner/interaction/interaction_session.h"
#include "geoliner/interaction/interaction_session_helpers.h"
#include "geoliner/interaction/interaction_constants.h"
#include "geoliner/interaction/snap_solver.h"
#include "geoliner/entity/panel_store.h"
#include "geoliner/core/util.h"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace geoliner {

using interaction_session_detail::cornerOnBottom;
using interaction_session_detail::cornerOnRight;

bool InteractionSession::updateDrag(float worldX, float worldY, std::uint32_t modifiers) {
    const Panel* current = store_.getPanel(session_.panelId);
    if (!current) {
        resetSession();
        return false;
    }

    const Point2 raw{ worldX - session_.grabOffsetX, worldY - session_.grabOffsetY };
    const SnapOptions options = gestureSnapOptions(modifiers);

    Point2 target = raw;
    if (options.gridEnabled || options.edgeEnabled) {
        target = solveDragSnap(options, *current, raw, store_.panels(), guideSpan(), snapGuides_);
    } else {
        snapGuides_.clear();
    }

    if (target.x == current->x && target.y == current->y) return false;

    PanelPatch patch;
    patch.x = target.x;
    patch.y = target.y;
    return store_.updatePanel(session_.panelId, patch);
}

bool InteractionSession::updateResize(float worldX, float worldY, std::uint32_t modifiers) {
    namespace ic = interaction_constants;

    if (!store_.getPanel(session_.panelId)) {
        resetSession();
        return false;
    }

    const Panel& s = session_.start;
    const float rad = s.rotation * kDegToRad;
    const float cosR = std::cos(rad);
    const float sinR = std::sin(rad);

    // Pointer delta in the panel's local axes.
    const float dX = worldX - session_.startX;
    const float dY = worldY - session_.startY;
    const float du = dX * cosR + dY * sinR;
    const float dv = -dX * sinR + dY * cosR;

    const float signX = cornerOnRight(session_.handleIndex) ? 1.0f : -1.0f;
    const float signY = cornerOnBottom(session_.handleIndex) ? 1.0f : -1.0f;
    float newW = s.width + signX * du;
    float newL = s.length + signY * dv;

    const SnapOptions options = gestureSnapOptions(modifiers);
    if (options.gridEnabled) {
        newW = snapToGrid(newW, options.gridSize);
        newL = snapToGrid(newL, options.gridSize);
    }
    newW = std::max(newW, ic::MIN_SIZE);
    newL = std::max(newL, ic::MIN_SIZE);

    const bool anchorRight = cornerOnRight(session_.anchorIndex);
    const bool anchorBottom = cornerOnBottom(session_.anchorIndex);

    if (s.rotation == 0.0f) {
        // Cap at the container edge so clamping never drags the anchor along.
        const SiteConfig& site = store_.siteConfig();
        const float maxW = anchorRight ? session_.anchorX : site.width - session_.anchorX;
        const float maxL = anchorBottom ? session_.anchorY : site.height - session_.anchorY;
        newW = std::min(newW, std::max(maxW, ic::MIN_SIZE));
        newL = std::min(newL, std::max(maxL, ic::MIN_SIZE));
    }

    // Place the new frame so the anchor corner keeps its world position.
    const float ox = (anchorRight ? newW : 0.0f) - newW * 0.5f;
    const float oy = (anchorBottom ? newL : 0.0f) - newL * 0.5f;
    const float centerX = session_.anchorX - (ox * cosR - oy * sinR);
    const float centerY = session_.anchorY - (ox * sinR + oy * cosR);
    const float newX = centerX - newW * 0.5f;
    const float newY = centerY - newL * 0.5f;

    PanelPatch patch;
    if (s.shape == PanelShape::Polygon) {
        const float sx = s.width > 0.0f ? newW / s.width : 1.0f;
        const float sy = s.length > 0.0f ? newL / s.length : 1.0f;
        std::vector<Point2> corners;
        corners.reserve(s.corners.size());
        for (const Point2& c : s.corners) {
            corners.push_back(Point2{ newX + (c.x - s.x) * sx, newY + (c.y - s.y) * sy });
        }
        patch.corners = std::move(corners);
    } else {
        patch.x = newX;
        patch.y = newY;
        patch.width = newW;
        patch.length = newL;
    }
    return store_.updatePanel(session_.panelId, patch);
}

} // namespace geoliner
