#ifndef GEOLINER_RENDER_RENDER_LIST_H
#define GEOLINER_RENDER_RENDER_LIST_H

#include "geoliner/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace geoliner::render {

// Host-agnostic draw list. Geometry is in world units; the host applies
// `viewTransform` (world -> screen) and keeps stroke widths in screen pixels.

struct Transform2D {
    // SVG/canvas-style affine matrix:
    // [ a c e ]
    // [ b d f ]
    // [ 0 0 1 ]
    float a{1.0f};
    float b{0.0f};
    float c{0.0f};
    float d{1.0f};
    float e{0.0f};
    float f{0.0f};
};

inline Point2 applyTransform(const Transform2D& t, const Point2& p) noexcept {
    return Point2{
        t.a * p.x + t.c * p.y + t.e,
        t.b * p.x + t.d * p.y + t.f,
    };
}

struct Color {
    float r{0.0f};
    float g{0.0f};
    float b{0.0f};
    float a{1.0f};
};

// Draw passes, in the order they appear in a RenderList.
enum class Layer : std::uint8_t {
    Grid = 0,
    Panel = 1,
    Selection = 2,
    Overlay = 3, // snap guides, polygon draft
    Label = 4,
};

enum class CommandKind : std::uint8_t {
    Path = 0,   // points, optionally closed
    Circle = 1, // center + radius
    Text = 2,   // text centered at `center`
};

struct StrokeStyle {
    Color color{};
    float widthPx{1.0f};
    std::vector<float> dash; // alternating on/off lengths in px
};

struct DrawCommand {
    CommandKind kind{CommandKind::Path};
    Layer layer{Layer::Panel};
    std::uint32_t panelId{0};

    std::vector<Point2> points;
    bool closed{false};

    Point2 center{0.0f, 0.0f};
    float radius{0.0f};

    std::string text;
    float fontSize{0.0f}; // world units

    bool fillEnabled{false};
    Color fill{};
    bool strokeEnabled{false};
    StrokeStyle stroke{};
};

struct RenderList {
    Transform2D viewTransform{};
    std::vector<DrawCommand> commands;
};

} // namespace geoliner::render

#endif // GEOLINER_RENDER_RENDER_LIST_H
