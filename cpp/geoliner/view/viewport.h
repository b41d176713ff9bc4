#pragma once

#include "geoliner/core/types.h"

namespace geoliner {

// Screen <-> world mapping: screen = world * scale + pan.
// Scale is always kept inside [MIN_ZOOM, MAX_ZOOM].
class Viewport {
public:
    Viewport() = default;

    float scale() const noexcept { return scale_; }
    float panX() const noexcept { return panX_; }
    float panY() const noexcept { return panY_; }
    float viewWidth() const noexcept { return viewWidth_; }
    float viewHeight() const noexcept { return viewHeight_; }

    Point2 toWorld(Point2 screen) const noexcept;
    Point2 toScreen(Point2 world) const noexcept;

    void setViewSize(float width, float height) noexcept;
    void setScale(float scale) noexcept;
    void setPan(float x, float y) noexcept;
    void panBy(float dx, float dy) noexcept;

    void zoomIn() noexcept;
    void zoomOut() noexcept;
    // Zooms by factor keeping the world point under `screen` fixed.
    void zoomAt(Point2 screen, float factor) noexcept;
    void reset() noexcept;

    // Returns false (and leaves the view untouched) when the view or bbox is empty.
    bool fitToContent(const AABB& bbox, float padding) noexcept;

    AABB visibleWorldBounds() const noexcept;

private:
    float scale_{1.0f};
    float panX_{0.0f};
    float panY_{0.0f};
    float viewWidth_{0.0f};
    float viewHeight_{0.0f};
};

float clampZoom(float scale) noexcept;

} // namespace geoliner
