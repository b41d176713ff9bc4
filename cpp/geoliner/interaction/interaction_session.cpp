#include "geoliner/interaction/interaction_session.h"
#include "geoliner/interaction/interaction_session_helpers.h"
#include "geoliner/interaction/pick_system.h"
#include "geoliner/interaction/snap_solver.h"
#include "geoliner/entity/panel_store.h"
#include "geoliner/geometry/panel_geometry.h"
#include "geoliner/view/viewport.h"
#include "geoliner/core/logging.h"
#include "geoliner/core/util.h"

#include <algorithm>
#include <cmath>

namespace geoliner {

using interaction_session_detail::isSnapSuppressed;

const char* interactionModeName(InteractionMode mode) noexcept {
    switch (mode) {
        case InteractionMode::Idle: return "idle";
        case InteractionMode::Dragging: return "dragging";
        case InteractionMode::Resizing: return "resizing";
        case InteractionMode::Rotating: return "rotating";
        case InteractionMode::CreatingPolygon: return "creating-polygon";
        case InteractionMode::Panning: return "panning";
    }
    return "unknown";
}

InteractionSession::InteractionSession(PanelStore& store, Viewport& viewport, PickSystem& pickSystem)
    : store_(store), viewport_(viewport), pickSystem_(pickSystem) {}

SnapOptions InteractionSession::gestureSnapOptions(std::uint32_t modifiers) const {
    SnapOptions options = snapOptionsFromSite(store_.siteConfig());
    if (isSnapSuppressed(modifiers)) {
        options.gridEnabled = false;
        options.edgeEnabled = false;
    }
    return options;
}

AABB InteractionSession::guideSpan() const {
    if (viewport_.viewWidth() > 0.0f && viewport_.viewHeight() > 0.0f) {
        return viewport_.visibleWorldBounds();
    }
    const SiteConfig& site = store_.siteConfig();
    return AABB{ 0.0f, 0.0f, site.width, site.height };
}

void InteractionSession::resetSession() {
    session_ = SessionState{};
    snapGuides_.clear();
}

void InteractionSession::setTool(Tool tool) {
    if (tool == tool_) return;
    endGesture();
    if (tool_ == Tool::Polygon) {
        cancelPolygon();
    }
    tool_ = tool;
    GEOLINER_LOG_DEBUG("tool -> %s", tool == Tool::Polygon ? "polygon" : "select");
}

void InteractionSession::pointerDown(float screenX, float screenY, std::uint32_t modifiers) {
    if (!std::isfinite(screenX) || !std::isfinite(screenY)) return;
    // A missed pointer-up must not leave a gesture half-open.
    endGesture();

    const Point2 world = viewport_.toWorld(Point2{ screenX, screenY });

    if (tool_ == Tool::Polygon) {
        appendDraftPoint(world.x, world.y, modifiers);
        return;
    }

    const PickResult hit = pickSystem_.pick(world.x, world.y, viewport_.scale(), store_);
    const Panel* panel = hit.hit() ? store_.getPanel(hit.id) : nullptr;
    if (!panel) {
        store_.selectPanel(PanelStore::kNoPanel);
        beginPan(screenX, screenY);
        return;
    }

    switch (hit.subTarget) {
        case PickSubTarget::ResizeHandle:
            beginResize(*panel, hit.subIndex, world.x, world.y);
            break;
        case PickSubTarget::RotateHandle:
            beginRotate(*panel, world.x, world.y);
            break;
        default:
            store_.selectPanel(panel->id);
            beginDrag(*panel, world.x, world.y);
            break;
    }
}

bool InteractionSession::pointerMove(float screenX, float screenY, std::uint32_t modifiers) {
    if (!std::isfinite(screenX) || !std::isfinite(screenY)) return false;

    const double t0 = emscripten_get_now();
    const Point2 world = viewport_.toWorld(Point2{ screenX, screenY });
    bool changed = false;

    switch (session_.mode) {
        case InteractionMode::Dragging:
            changed = updateDrag(world.x, world.y, modifiers);
            break;
        case InteractionMode::Resizing:
            changed = updateResize(world.x, world.y, modifiers);
            break;
        case InteractionMode::Rotating:
            changed = updateRotate(world.x, world.y, modifiers);
            break;
        case InteractionMode::Panning:
            changed = updatePan(screenX, screenY);
            break;
        case InteractionMode::CreatingPolygon:
            updateDraftCursor(world.x, world.y, modifiers);
            break;
        case InteractionMode::Idle:
            if (tool_ == Tool::Polygon) {
                updateDraftCursor(world.x, world.y, modifiers);
            } else {
                hoverId_ = pickSystem_.pickBody(world.x, world.y, store_.panels());
            }
            break;
    }

    if (changed) {
        const double elapsed = emscripten_get_now() - t0;
        stats_.moveCount++;
        stats_.lastUpdateMs = elapsed;
        stats_.maxUpdateMs = std::max(stats_.maxUpdateMs, elapsed);
    }
    return changed;
}

void InteractionSession::pointerUp(float screenX, float screenY, std::uint32_t modifiers) {
    (void)screenX;
    (void)screenY;
    (void)modifiers;
    endGesture();
}

void InteractionSession::pointerLeave() {
    endGesture();
    hoverId_ = 0;
    draft_.hasCursor = false;
}

void InteractionSession::endGesture() {
    if (!isInteractionActive()) return;
    GEOLINER_LOG_DEBUG("end %s (panel=%u)", interactionModeName(session_.mode), session_.panelId);
    resetSession();
}

void InteractionSession::beginDrag(const Panel& panel, float worldX, float worldY) {
    session_.mode = InteractionMode::Dragging;
    session_.panelId = panel.id;
    session_.start = panel;
    session_.startX = worldX;
    session_.startY = worldY;
    session_.grabOffsetX = worldX - panel.x;
    session_.grabOffsetY = worldY - panel.y;
    GEOLINER_LOG_DEBUG("begin drag panel=%u", panel.id);
}

void InteractionSession::beginResize(const Panel& panel, int handleIndex, float worldX, float worldY) {
    session_.mode = InteractionMode::Resizing;
    session_.panelId = panel.id;
    session_.start = panel;
    session_.startX = worldX;
    session_.startY = worldY;
    session_.handleIndex = handleIndex;
    session_.anchorIndex = (handleIndex + 2) % 4;
    const Point2 anchor = cornerHandlePosition(panel, session_.anchorIndex);
    session_.anchorX = anchor.x;
    session_.anchorY = anchor.y;
    GEOLINER_LOG_DEBUG("begin resize panel=%u handle=%d", panel.id, handleIndex);
}

void InteractionSession::beginRotate(const Panel& panel, float worldX, float worldY) {
    session_.mode = InteractionMode::Rotating;
    session_.panelId = panel.id;
    session_.start = panel;
    session_.startX = worldX;
    session_.startY = worldY;
    const Point2 pivot = panelCenter(panel);
    session_.rotationPivotX = pivot.x;
    session_.rotationPivotY = pivot.y;
    session_.startAngleDeg = std::atan2(worldY - pivot.y, worldX - pivot.x) * kRadToDeg;
    session_.lastAngleDeg = session_.startAngleDeg;
    session_.accumulatedDeltaDeg = 0.0f;
    GEOLINER_LOG_DEBUG("begin rotate panel=%u", panel.id);
}

void InteractionSession::beginPan(float screenX, float screenY) {
    session_.mode = InteractionMode::Panning;
    session_.startScreenX = screenX;
    session_.startScreenY = screenY;
    session_.startPanX = viewport_.panX();
    session_.startPanY = viewport_.panY();
}

bool InteractionSession::updatePan(float screenX, float screenY) {
    const float panX = session_.startPanX + (screenX - session_.startScreenX);
    const float panY = session_.startPanY + (screenY - session_.startScreenY);
    if (panX == viewport_.panX() && panY == viewport_.panY()) return false;
    viewport_.setPan(panX, panY);
    return true;
}

} // namespace geoliner
