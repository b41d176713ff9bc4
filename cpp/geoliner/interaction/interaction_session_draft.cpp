#include "geoliner/interaction/interaction_session.h"
#include "geoliner/interaction/interaction_session_helpers.h"
#include "geoliner/interaction/snap_solver.h"
#include "geoliner/entity/panel_store.h"
#include "geoliner/core/logging.h"

#include <cmath>
#include <utility>

namespace geoliner {

void InteractionSession::appendDraftPoint(float worldX, float worldY, std::uint32_t modifiers) {
    if (!std::isfinite(worldX) || !std::isfinite(worldY)) return;

    const SnapOptions options = gestureSnapOptions(modifiers);
    Point2 p{ worldX, worldY };
    if (options.gridEnabled) {
        p = snapPointToGrid(p, options.gridSize);
    }

    if (!draft_.active) {
        draft_.active = true;
        draft_.points.clear();
        session_.mode = InteractionMode::CreatingPolygon;
    }
    draft_.points.push_back(p);
    draft_.cursor = p;
    draft_.hasCursor = true;
    GEOLINER_LOG_DEBUG("polygon point %zu at (%.2f, %.2f)", draft_.points.size(), p.x, p.y);
}

void InteractionSession::updateDraftCursor(float worldX, float worldY, std::uint32_t modifiers) {
    const SnapOptions options = gestureSnapOptions(modifiers);
    Point2 p{ worldX, worldY };
    if (options.gridEnabled) {
        p = snapPointToGrid(p, options.gridSize);
    }
    draft_.cursor = p;
    draft_.hasCursor = true;
}

AddPanelResult InteractionSession::finishPolygon(const PanelLabels& labels) {
    AddPanelResult result;
    if (!draft_.active || draft_.points.size() < 3) {
        result.error = EngineError::TooFewCorners;
        GEOLINER_LOG_WARN("finishPolygon rejected: %zu points", draft_.points.size());
        return result;
    }

    result = store_.addPanel(PolygonSpec{ labels, draft_.points });
    if (!result.ok()) {
        return result;
    }

    store_.selectPanel(result.id);
    cancelPolygon();
    return result;
}

void InteractionSession::cancelPolygon() {
    draft_ = DraftState{};
    if (session_.mode == InteractionMode::CreatingPolygon) {
        resetSession();
    }
}

} // namespace geoliner
