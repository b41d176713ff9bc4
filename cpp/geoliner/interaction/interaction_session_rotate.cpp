#include "geoliner/interaction/interaction_session.h"
#include "geoliner/interaction/interaction_constants.h"
#include "geoliner/interaction/interaction_session_helpers.h"
#include "geoliner/entity/panel_store.h"
#include "geoliner/core/util.h"

#include <cmath>

namespace geoliner {

using interaction_session_detail::isRotationSnapRequested;

bool InteractionSession::updateRotate(float worldX, float worldY, std::uint32_t modifiers) {
    if (!store_.getPanel(session_.panelId)) {
        resetSession();
        return false;
    }

    const float currentAngleDeg =
        std::atan2(worldY - session_.rotationPivotY, worldX - session_.rotationPivotX) * kRadToDeg;

    float frameDelta = currentAngleDeg - session_.lastAngleDeg;
    if (frameDelta > 180.0f) frameDelta -= 360.0f;
    if (frameDelta < -180.0f) frameDelta += 360.0f;

    session_.accumulatedDeltaDeg += frameDelta;
    session_.lastAngleDeg = currentAngleDeg;

    float deltaAngleDeg = session_.accumulatedDeltaDeg;
    if (isRotationSnapRequested(modifiers)) {
        constexpr float snapDeg = interaction_constants::ROTATION_SNAP_DEGREES;
        deltaAngleDeg = std::round(deltaAngleDeg / snapDeg) * snapDeg;
    }

    // Rebuilt from the gesture's start state so clamping never accumulates.
    const Panel& start = session_.start;
    PanelPatch patch;
    if (start.shape == PanelShape::Polygon) {
        patch.corners = start.corners;
    } else {
        patch.x = start.x;
        patch.y = start.y;
        patch.width = start.width;
        patch.length = start.length;
    }
    patch.rotation = normalizeDegrees(session_.start.rotation + deltaAngleDeg);
    return store_.updatePanel(session_.panelId, patch);
}

} // namespace geoliner
