#pragma once

#include "geoliner/interaction/interaction_types.h"
#include "geoliner/interaction/snap_types.h"
#include "geoliner/core/types.h"

#include <cstdint>
#include <vector>

namespace geoliner {

class PanelStore;
class PickSystem;
class Viewport;
struct AddPanelResult;

// Pointer-driven state machine. Inputs are screen pixels; every geometry
// change is committed through PanelStore::updatePanel on each move.
class InteractionSession {
public:
    InteractionSession(PanelStore& store, Viewport& viewport, PickSystem& pickSystem);

    // ==============================================================================
    // State Query
    // ==============================================================================
    InteractionMode mode() const noexcept { return session_.mode; }
    bool isInteractionActive() const noexcept {
        return session_.mode != InteractionMode::Idle && session_.mode != InteractionMode::CreatingPolygon;
    }
    bool isDraftActive() const noexcept { return draft_.active; }
    std::uint32_t activePanelId() const noexcept { return session_.panelId; }
    std::uint32_t hoverPanelId() const noexcept { return hoverId_; }
    void clearHover() noexcept { hoverId_ = 0; }

    Tool tool() const noexcept { return tool_; }
    // Switching tools ends any gesture; leaving the polygon tool drops the draft.
    void setTool(Tool tool);

    const std::vector<SnapGuide>& getSnapGuides() const { return snapGuides_; }
    const std::vector<Point2>& getDraftPoints() const { return draft_.points; }
    bool hasDraftCursor() const noexcept { return draft_.hasCursor; }
    Point2 getDraftCursor() const noexcept { return draft_.cursor; }

    const InteractionStats& getStats() const noexcept { return stats_; }

    // ==============================================================================
    // Pointer API (screen pixels)
    // ==============================================================================
    void pointerDown(float screenX, float screenY, std::uint32_t modifiers);
    // Returns true when the store or the view changed.
    bool pointerMove(float screenX, float screenY, std::uint32_t modifiers);
    void pointerUp(float screenX, float screenY, std::uint32_t modifiers);
    void pointerLeave();

    // ==============================================================================
    // Polygon Draft API
    // ==============================================================================
    void appendDraftPoint(float worldX, float worldY, std::uint32_t modifiers);
    // Needs >= 3 points and valid labels; on rejection the points are kept.
    AddPanelResult finishPolygon(const PanelLabels& labels);
    void cancelPolygon();

    // Ends Dragging/Resizing/Rotating/Panning and returns to Idle.
    void endGesture();

private:
    PanelStore& store_;
    Viewport& viewport_;
    PickSystem& pickSystem_;

    // Internal State Structs
    struct SessionState {
        InteractionMode mode = InteractionMode::Idle;
        std::uint32_t panelId = 0;
        // Panel as it was when the gesture began.
        Panel start{};
        float startX = 0.0f;
        float startY = 0.0f;
        // Dragging
        float grabOffsetX = 0.0f;
        float grabOffsetY = 0.0f;
        // Resizing
        int handleIndex = -1;
        int anchorIndex = -1;
        float anchorX = 0.0f;
        float anchorY = 0.0f;
        // Rotating
        float rotationPivotX = 0.0f;
        float rotationPivotY = 0.0f;
        float startAngleDeg = 0.0f;
        float lastAngleDeg = 0.0f;
        float accumulatedDeltaDeg = 0.0f;
        // Panning (screen pixels)
        float startScreenX = 0.0f;
        float startScreenY = 0.0f;
        float startPanX = 0.0f;
        float startPanY = 0.0f;
    };

    struct DraftState {
        bool active = false;
        bool hasCursor = false;
        Point2 cursor{0.0f, 0.0f};
        std::vector<Point2> points;
    };

    SessionState session_;
    DraftState draft_;
    Tool tool_{Tool::Select};
    std::uint32_t hoverId_{0};
    std::vector<SnapGuide> snapGuides_;
    InteractionStats stats_;

    void beginDrag(const Panel& panel, float worldX, float worldY);
    void beginResize(const Panel& panel, int handleIndex, float worldX, float worldY);
    void beginRotate(const Panel& panel, float worldX, float worldY);
    void beginPan(float screenX, float screenY);

    bool updateDrag(float worldX, float worldY, std::uint32_t modifiers);
    bool updateResize(float worldX, float worldY, std::uint32_t modifiers);
    bool updateRotate(float worldX, float worldY, std::uint32_t modifiers);
    bool updatePan(float screenX, float screenY);
    void updateDraftCursor(float worldX, float worldY, std::uint32_t modifiers);

    SnapOptions gestureSnapOptions(std::uint32_t modifiers) const;
    AABB guideSpan() const;
    void resetSession();
};

} // namespace geoliner
