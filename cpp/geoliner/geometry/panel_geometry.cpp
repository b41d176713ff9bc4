#include "geoliner/geometry/panel_geometry.h"
#include "geoliner/interaction/interaction_constants.h"
#include "geoliner/core/util.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace geoliner {

namespace {

// Barycentric weights below -eps count as outside; keeps edge points inside.
constexpr float kBaryEpsilon = 1e-6f;

bool isFinitePoint(Point2 p) noexcept {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

std::vector<Point2> equilateralLocal(float w, float l) {
    const float cx = w * 0.5f;
    const float cy = l * 0.5f;
    const float r = std::min(w, l) * 0.5f;
    std::vector<Point2> out;
    out.reserve(3);
    for (int i = 0; i < 3; ++i) {
        // Apex up: -90, 30, 150 degrees.
        const float angle = (static_cast<float>(i) * 120.0f - 90.0f) * kDegToRad;
        out.push_back(Point2{ cx + r * std::cos(angle), cy + r * std::sin(angle) });
    }
    return out;
}

} // namespace

Point2 panelCenter(const Panel& p) noexcept {
    return Point2{ p.x + p.width * 0.5f, p.y + p.length * 0.5f };
}

Point2 rotateAbout(Point2 pt, Point2 pivot, float degrees) noexcept {
    if (degrees == 0.0f) return pt;
    const float rad = degrees * kDegToRad;
    const float c = std::cos(rad);
    const float s = std::sin(rad);
    const float dx = pt.x - pivot.x;
    const float dy = pt.y - pivot.y;
    return Point2{ pivot.x + dx * c - dy * s, pivot.y + dx * s + dy * c };
}

Point2 localToWorld(const Panel& p, Point2 local) noexcept {
    return rotateAbout(Point2{ p.x + local.x, p.y + local.y }, panelCenter(p), p.rotation);
}

Point2 worldToLocal(const Panel& p, Point2 world) noexcept {
    const Point2 unrotated = rotateAbout(world, panelCenter(p), -p.rotation);
    return Point2{ unrotated.x - p.x, unrotated.y - p.y };
}

std::vector<Point2> localOutline(const Panel& p) {
    switch (p.shape) {
        case PanelShape::Rectangle:
            return { {0.0f, 0.0f}, {p.width, 0.0f}, {p.width, p.length}, {0.0f, p.length} };
        case PanelShape::RightTriangle:
            return { {0.0f, 0.0f}, {p.width, 0.0f}, {0.0f, p.length} };
        case PanelShape::Triangle:
            return equilateralLocal(p.width, p.length);
        case PanelShape::Polygon: {
            std::vector<Point2> out;
            out.reserve(p.corners.size());
            for (const Point2& c : p.corners) {
                out.push_back(Point2{ c.x - p.x, c.y - p.y });
            }
            return out;
        }
    }
    return {};
}

std::vector<Point2> panelOutline(const Panel& p) {
    std::vector<Point2> out = localOutline(p);
    for (Point2& v : out) {
        v = localToWorld(p, v);
    }
    return out;
}

AABB boundsOfPoints(const std::vector<Point2>& points) noexcept {
    if (points.empty()) return AABB{ 0.0f, 0.0f, 0.0f, 0.0f };
    AABB b{
        std::numeric_limits<float>::max(),
        std::numeric_limits<float>::max(),
        std::numeric_limits<float>::lowest(),
        std::numeric_limits<float>::lowest(),
    };
    for (const Point2& pt : points) {
        b.minX = std::min(b.minX, pt.x);
        b.minY = std::min(b.minY, pt.y);
        b.maxX = std::max(b.maxX, pt.x);
        b.maxY = std::max(b.maxY, pt.y);
    }
    return b;
}

AABB panelFootprint(const Panel& p) {
    return boundsOfPoints(panelOutline(p));
}

float signedArea(const std::vector<Point2>& points) noexcept {
    const std::size_t n = points.size();
    if (n < 3) return 0.0f;
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& a = points[i];
        const Point2& b = points[(i + 1) % n];
        sum += static_cast<double>(a.x) * b.y - static_cast<double>(b.x) * a.y;
    }
    return static_cast<float>(sum * 0.5);
}

bool isDegenerate(const Panel& p) {
    if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.rotation)) return true;
    if (!std::isfinite(p.width) || !std::isfinite(p.length)) return true;
    const std::vector<Point2> outline = localOutline(p);
    if (outline.size() < 3) return true;
    for (const Point2& v : outline) {
        if (!isFinitePoint(v)) return true;
    }
    return std::abs(signedArea(outline)) <= interaction_constants::DEGENERATE_AREA_EPSILON;
}

bool pointInTriangle(Point2 pt, Point2 a, Point2 b, Point2 c) noexcept {
    const float v0x = c.x - a.x, v0y = c.y - a.y;
    const float v1x = b.x - a.x, v1y = b.y - a.y;
    const float v2x = pt.x - a.x, v2y = pt.y - a.y;

    const float dot00 = v0x * v0x + v0y * v0y;
    const float dot01 = v0x * v1x + v0y * v1y;
    const float dot02 = v0x * v2x + v0y * v2y;
    const float dot11 = v1x * v1x + v1y * v1y;
    const float dot12 = v1x * v2x + v1y * v2y;

    const float denom = dot00 * dot11 - dot01 * dot01;
    if (!(std::abs(denom) > 1e-12f) || !std::isfinite(denom)) return false;

    const float inv = 1.0f / denom;
    const float u = (dot11 * dot02 - dot01 * dot12) * inv;
    const float v = (dot00 * dot12 - dot01 * dot02) * inv;
    const float w = 1.0f - u - v;
    return u >= -kBaryEpsilon && v >= -kBaryEpsilon && w >= -kBaryEpsilon;
}

bool pointInPolygon(Point2 pt, const std::vector<Point2>& poly) noexcept {
    const std::size_t n = poly.size();
    if (n < 3) return false;
    bool inside = false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2& a = poly[i];
        const Point2& b = poly[j];
        if ((a.y > pt.y) != (b.y > pt.y)) {
            const float xCross = (b.x - a.x) * (pt.y - a.y) / (b.y - a.y) + a.x;
            if (pt.x < xCross) inside = !inside;
        }
    }
    return inside;
}

bool hitTestPanel(const Panel& p, Point2 world) {
    if (!isFinitePoint(world) || isDegenerate(p)) return false;

    const Point2 local = worldToLocal(p, world);
    switch (p.shape) {
        case PanelShape::Rectangle:
            return local.x >= 0.0f && local.x <= p.width && local.y >= 0.0f && local.y <= p.length;
        case PanelShape::RightTriangle:
            return pointInTriangle(local, Point2{0.0f, 0.0f}, Point2{p.width, 0.0f}, Point2{0.0f, p.length});
        case PanelShape::Triangle: {
            const std::vector<Point2> tri = equilateralLocal(p.width, p.length);
            return pointInTriangle(local, tri[0], tri[1], tri[2]);
        }
        case PanelShape::Polygon:
            return pointInPolygon(local, localOutline(p));
    }
    return false;
}

Point2 labelAnchor(const Panel& p) {
    const std::vector<Point2> outline = localOutline(p);
    Point2 local{ p.width * 0.5f, p.length * 0.5f };

    const float area = signedArea(outline);
    if (outline.size() >= 3 && std::abs(area) > interaction_constants::DEGENERATE_AREA_EPSILON) {
        double cx = 0.0;
        double cy = 0.0;
        const std::size_t n = outline.size();
        for (std::size_t i = 0; i < n; ++i) {
            const Point2& a = outline[i];
            const Point2& b = outline[(i + 1) % n];
            const double cross = static_cast<double>(a.x) * b.y - static_cast<double>(b.x) * a.y;
            cx += (a.x + b.x) * cross;
            cy += (a.y + b.y) * cross;
        }
        const double k = 1.0 / (6.0 * static_cast<double>(area));
        local = Point2{ static_cast<float>(cx * k), static_cast<float>(cy * k) };
    }
    return localToWorld(p, local);
}

Point2 cornerHandlePosition(const Panel& p, int cornerIndex) noexcept {
    namespace ci = interaction_constants::CornerIndex;
    switch (cornerIndex) {
        case ci::NORTH_WEST: return localToWorld(p, Point2{0.0f, 0.0f});
        case ci::NORTH_EAST: return localToWorld(p, Point2{p.width, 0.0f});
        case ci::SOUTH_EAST: return localToWorld(p, Point2{p.width, p.length});
        case ci::SOUTH_WEST: return localToWorld(p, Point2{0.0f, p.length});
        default: break;
    }
    return panelCenter(p);
}

Point2 rotateHandlePosition(const Panel& p, float offsetWorld) noexcept {
    return localToWorld(p, Point2{ p.width * 0.5f, -offsetWorld });
}

} // namespace geoliner
