#include "geoliner/interaction/pick_system.h"
#include "geoliner/entity/panel_store.h"
#include "geoliner/geometry/panel_geometry.h"
#include "geoliner/interaction/interaction_constants.h"

#include <cmath>
#include <limits>

namespace geoliner {

namespace ic = interaction_constants;

namespace {

float distSq(float x1, float y1, float x2, float y2) {
    const float dx = x1 - x2;
    const float dy = y1 - y2;
    return dx * dx + dy * dy;
}

float toWorldTolerance(float tolerancePx, float viewScale) {
    if (!(viewScale > 1e-6f) || !std::isfinite(viewScale)) return tolerancePx;
    return tolerancePx / viewScale;
}

} // namespace

PickResult PickSystem::pickHandles(float x, float y, float viewScale, const Panel& panel) const {
    PickResult out;
    if (isDegenerate(panel)) return out;

    const float resizeTol = toWorldTolerance(ic::RESIZE_HANDLE_SIZE_PX, viewScale);
    float bestDist = std::numeric_limits<float>::infinity();

    for (int i = 0; i < 4; ++i) {
        const Point2 c = cornerHandlePosition(panel, i);
        const float d = std::sqrt(distSq(x, y, c.x, c.y));
        if (d <= resizeTol && d < bestDist) {
            bestDist = d;
            out.id = panel.id;
            out.subTarget = PickSubTarget::ResizeHandle;
            out.subIndex = i;
            out.distance = d;
            out.hitX = c.x;
            out.hitY = c.y;
        }
    }
    if (out.hit()) return out;

    const float offset = toWorldTolerance(ic::ROTATE_HANDLE_OFFSET_PX, viewScale);
    const float rotateTol = toWorldTolerance(ic::ROTATE_HANDLE_RADIUS_PX, viewScale);
    const Point2 h = rotateHandlePosition(panel, offset);
    const float d = std::sqrt(distSq(x, y, h.x, h.y));
    if (d <= rotateTol) {
        out.id = panel.id;
        out.subTarget = PickSubTarget::RotateHandle;
        out.subIndex = -1;
        out.distance = d;
        out.hitX = h.x;
        out.hitY = h.y;
    }
    return out;
}

std::uint32_t PickSystem::pickBody(float x, float y, const std::vector<Panel>& panels) const {
    const Point2 world{ x, y };
    for (auto it = panels.rbegin(); it != panels.rend(); ++it) {
        if (hitTestPanel(*it, world)) return it->id;
    }
    return 0;
}

PickResult PickSystem::pick(float x, float y, float viewScale, const PanelStore& store) const {
    if (!std::isfinite(x) || !std::isfinite(y)) return PickResult{};

    if (const Panel* selected = store.selectedPanel()) {
        const PickResult handle = pickHandles(x, y, viewScale, *selected);
        if (handle.hit()) return handle;
    }

    PickResult out;
    const std::uint32_t id = pickBody(x, y, store.panels());
    if (id != 0) {
        out.id = id;
        out.subTarget = PickSubTarget::Body;
        out.hitX = x;
        out.hitY = y;
    }
    return out;
}

} // namespace geoliner
