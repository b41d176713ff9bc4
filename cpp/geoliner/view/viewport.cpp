#include "geoliner/view/viewport.h"
#include "geoliner/interaction/interaction_constants.h"
#include "geoliner/core/util.h"

#include <algorithm>
#include <cmath>

namespace geoliner {

namespace ic = interaction_constants;

float clampZoom(float scale) noexcept {
    if (!std::isfinite(scale) || scale <= 0.0f) return ic::MIN_ZOOM;
    return clampf(scale, ic::MIN_ZOOM, ic::MAX_ZOOM);
}

Point2 Viewport::toWorld(Point2 screen) const noexcept {
    return Point2{ (screen.x - panX_) / scale_, (screen.y - panY_) / scale_ };
}

Point2 Viewport::toScreen(Point2 world) const noexcept {
    return Point2{ world.x * scale_ + panX_, world.y * scale_ + panY_ };
}

void Viewport::setViewSize(float width, float height) noexcept {
    viewWidth_ = (std::isfinite(width) && width > 0.0f) ? width : 0.0f;
    viewHeight_ = (std::isfinite(height) && height > 0.0f) ? height : 0.0f;
}

void Viewport::setScale(float scale) noexcept {
    scale_ = clampZoom(scale);
}

void Viewport::setPan(float x, float y) noexcept {
    if (!std::isfinite(x) || !std::isfinite(y)) return;
    panX_ = x;
    panY_ = y;
}

void Viewport::panBy(float dx, float dy) noexcept {
    setPan(panX_ + dx, panY_ + dy);
}

void Viewport::zoomIn() noexcept {
    setScale(scale_ * ic::ZOOM_STEP);
}

void Viewport::zoomOut() noexcept {
    setScale(scale_ / ic::ZOOM_STEP);
}

void Viewport::zoomAt(Point2 screen, float factor) noexcept {
    if (!std::isfinite(factor) || factor <= 0.0f) return;
    const Point2 anchor = toWorld(screen);
    setScale(scale_ * factor);
    panX_ = screen.x - anchor.x * scale_;
    panY_ = screen.y - anchor.y * scale_;
}

void Viewport::reset() noexcept {
    scale_ = 1.0f;
    panX_ = 0.0f;
    panY_ = 0.0f;
}

bool Viewport::fitToContent(const AABB& bbox, float padding) noexcept {
    if (viewWidth_ <= 0.0f || viewHeight_ <= 0.0f) return false;
    const float pad = (std::isfinite(padding) && padding > 0.0f) ? padding : 0.0f;
    const float contentW = aabbWidth(bbox) + 2.0f * pad;
    const float contentH = aabbHeight(bbox) + 2.0f * pad;
    if (!std::isfinite(contentW) || !std::isfinite(contentH)) return false;
    if (contentW <= 0.0f || contentH <= 0.0f) return false;

    setScale(std::min(viewWidth_ / contentW, viewHeight_ / contentH));

    const float centerX = (bbox.minX + bbox.maxX) * 0.5f;
    const float centerY = (bbox.minY + bbox.maxY) * 0.5f;
    panX_ = viewWidth_ * 0.5f - centerX * scale_;
    panY_ = viewHeight_ * 0.5f - centerY * scale_;
    return true;
}

AABB Viewport::visibleWorldBounds() const noexcept {
    const Point2 tl = toWorld(Point2{0.0f, 0.0f});
    const Point2 br = toWorld(Point2{viewWidth_, viewHeight_});
    return AABB{ tl.x, tl.y, br.x, br.y };
}

} // namespace geoliner
