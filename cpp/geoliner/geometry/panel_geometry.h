#pragma once

#include "geoliner/core/types.h"
#include <vector>

namespace geoliner {

// Center of the panel's local frame; the rotation pivot.
Point2 panelCenter(const Panel& p) noexcept;

// Local frame coordinates run from (0,0) at the unrotated top-left to (width, length).
Point2 localToWorld(const Panel& p, Point2 local) noexcept;
Point2 worldToLocal(const Panel& p, Point2 world) noexcept;

// Rotates `pt` by `degrees` about `pivot` (positive = clockwise on a y-down screen).
Point2 rotateAbout(Point2 pt, Point2 pivot, float degrees) noexcept;

// Shape vertices in the local frame (unrotated), in drawing order.
std::vector<Point2> localOutline(const Panel& p);

// Shape vertices in world space, rotation applied.
std::vector<Point2> panelOutline(const Panel& p);

// Axis-aligned bounds of the rotated outline.
AABB panelFootprint(const Panel& p);

AABB boundsOfPoints(const std::vector<Point2>& points) noexcept;

// Signed shoelace area (positive for clockwise order on a y-down screen).
float signedArea(const std::vector<Point2>& points) noexcept;

// True for zero-area or non-finite shapes; such panels never hit and never snap.
bool isDegenerate(const Panel& p);

// Exact point-in-triangle; false for degenerate triangles.
bool pointInTriangle(Point2 pt, Point2 a, Point2 b, Point2 c) noexcept;

// Even-odd ray casting.
bool pointInPolygon(Point2 pt, const std::vector<Point2>& poly) noexcept;

// Shape-aware hit-test of a world point.
bool hitTestPanel(const Panel& p, Point2 world);

// Where labels are centered: area centroid of the shape, in world space.
Point2 labelAnchor(const Panel& p);

// Corner i of the local frame in world space (see CornerIndex).
Point2 cornerHandlePosition(const Panel& p, int cornerIndex) noexcept;

// Rotate handle sits `offsetWorld` above the top edge midpoint, rotating with the panel.
Point2 rotateHandlePosition(const Panel& p, float offsetWorld) noexcept;

} // namespace geoliner
