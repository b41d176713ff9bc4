#pragma once

/**
 * @file interaction_constants.h
 * @brief Centralized constants for the layout engine.
 *
 * Host-side constants (toolbar zoom labels, cursor hints) must mirror these values.
 *
 * Corner Handle Index Order (local panel frame, y grows downward):
 *   0 = North-West (NW, top-left)
 *   1 = North-East (NE, top-right)
 *   2 = South-East (SE, bottom-right)
 *   3 = South-West (SW, bottom-left)
 *
 * The anchor of handle i is handle (i + 2) % 4.
 */

namespace geoliner::interaction_constants {

// =============================================================================
// Panel geometry limits (world units, feet)
// =============================================================================

/// Minimum width/length of any panel after a mutation
constexpr float MIN_SIZE = 1.0f;

/// Shapes with an area below this are treated as degenerate
constexpr float DEGENERATE_AREA_EPSILON = 1e-6f;

/// Default placement of newly added panels (staggered per existing panel)
constexpr float DEFAULT_OFFSET_X = 50.0f;
constexpr float DEFAULT_OFFSET_Y = 50.0f;
constexpr float DEFAULT_STAGGER_X = 20.0f;
constexpr float DEFAULT_STAGGER_Y = 15.0f;

// =============================================================================
// Viewport
// =============================================================================

constexpr float MIN_ZOOM = 0.1f;
constexpr float MAX_ZOOM = 5.0f;

/// Multiplicative zoom step for zoomIn/zoomOut and one wheel notch
constexpr float ZOOM_STEP = 1.25f;

// =============================================================================
// Pick/Hit-test Tolerances (in screen pixels, converted to world via scale)
// =============================================================================

/// Half-size of the square resize handle hit area
constexpr float RESIZE_HANDLE_SIZE_PX = 6.0f;

/// Distance from the top edge midpoint to the rotation handle center
constexpr float ROTATE_HANDLE_OFFSET_PX = 30.0f;

/// Radius of rotation handle hit area
constexpr float ROTATE_HANDLE_RADIUS_PX = 8.0f;

// =============================================================================
// Rotation Snapping
// =============================================================================

/// Angle increment for shift-snap rotation (in degrees)
constexpr float ROTATION_SNAP_DEGREES = 15.0f;

// =============================================================================
// Visual Rendering
// =============================================================================

constexpr float PANEL_STROKE_WIDTH_PX = 1.0f;
constexpr float SELECTION_STROKE_WIDTH_PX = 3.0f;
constexpr float HANDLE_RENDER_SIZE_PX = 8.0f;
constexpr float GUIDE_STROKE_WIDTH_PX = 1.0f;

/// Label font size on screen; converted to world units by the view scale
constexpr float LABEL_FONT_PX = 12.0f;

/// Labels never exceed this fraction of the panel's smaller dimension
constexpr float LABEL_MAX_PANEL_FRACTION = 0.3f;

/// Grid is skipped when adjacent lines would be closer than this on screen
constexpr float MIN_GRID_SPACING_PX = 4.0f;

/// Every Nth grid line is drawn as a major line
constexpr int MAJOR_GRID_INTERVAL = 10;

// =============================================================================
// Handle Index Constants
// =============================================================================

namespace CornerIndex {
    constexpr int NORTH_WEST = 0;
    constexpr int NORTH_EAST = 1;
    constexpr int SOUTH_EAST = 2;
    constexpr int SOUTH_WEST = 3;
}

} // namespace geoliner::interaction_constants
