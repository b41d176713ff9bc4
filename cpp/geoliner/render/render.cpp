#include "geoliner/render/render.h"
#include "geoliner/geometry/panel_geometry.h"
#include "geoliner/interaction/interaction_constants.h"
#include "geoliner/text/label_metrics.h"
#include "geoliner/view/viewport.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace geoliner::render {

namespace ic = interaction_constants;

namespace {

constexpr Color kGridMinor{ 0.898f, 0.906f, 0.922f, 1.0f };   // #e5e7eb
constexpr Color kGridMajor{ 0.820f, 0.835f, 0.859f, 1.0f };   // #d1d5db
constexpr Color kContainer{ 0.420f, 0.447f, 0.502f, 1.0f };   // #6b7280
constexpr Color kPanelFill{ 0.231f, 0.510f, 0.965f, 0.85f };  // #3b82f6
constexpr Color kPanelStroke{ 0.118f, 0.251f, 0.686f, 1.0f }; // #1e40af
constexpr Color kSelection{ 0.937f, 0.267f, 0.267f, 1.0f };   // #ef4444
constexpr Color kHandleFill{ 1.0f, 1.0f, 1.0f, 1.0f };
constexpr Color kGuide{ 0.925f, 0.282f, 0.600f, 1.0f };       // #ec4899
constexpr Color kDraft{ 0.063f, 0.725f, 0.506f, 1.0f };       // #10b981
constexpr Color kLabel{ 1.0f, 1.0f, 1.0f, 1.0f };

constexpr float kLabelLineHeight = 1.2f;
constexpr float kLabelWidthFill = 0.9f;

bool finiteOutline(const std::vector<Point2>& pts) {
    for (const Point2& p : pts) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) return false;
    }
    return !pts.empty();
}

DrawCommand strokePath(Layer layer, std::vector<Point2> points, bool closed, Color color, float widthPx) {
    DrawCommand cmd;
    cmd.kind = CommandKind::Path;
    cmd.layer = layer;
    cmd.points = std::move(points);
    cmd.closed = closed;
    cmd.strokeEnabled = true;
    cmd.stroke.color = color;
    cmd.stroke.widthPx = widthPx;
    return cmd;
}

void emitGrid(const RenderInputs& in, float scale, RenderList& out) {
    const SiteConfig& site = *in.site;

    out.commands.push_back(strokePath(
        Layer::Grid,
        { {0.0f, 0.0f}, {site.width, 0.0f}, {site.width, site.height}, {0.0f, site.height} },
        true, kContainer, ic::PANEL_STROKE_WIDTH_PX));

    const float g = site.gridSize;
    if (!site.gridVisible || !(g > 0.0f)) return;
    if (g * scale < ic::MIN_GRID_SPACING_PX) return;

    AABB area{ 0.0f, 0.0f, site.width, site.height };
    if (in.viewport->viewWidth() > 0.0f && in.viewport->viewHeight() > 0.0f) {
        const AABB visible = in.viewport->visibleWorldBounds();
        area.minX = std::max(area.minX, visible.minX);
        area.minY = std::max(area.minY, visible.minY);
        area.maxX = std::min(area.maxX, visible.maxX);
        area.maxY = std::min(area.maxY, visible.maxY);
        if (area.maxX < area.minX || area.maxY < area.minY) return;
    }

    const long firstX = static_cast<long>(std::ceil(area.minX / g));
    const long lastX = static_cast<long>(std::floor(area.maxX / g));
    for (long i = firstX; i <= lastX; ++i) {
        const float x = static_cast<float>(i) * g;
        const bool major = i % ic::MAJOR_GRID_INTERVAL == 0;
        out.commands.push_back(strokePath(Layer::Grid, { {x, area.minY}, {x, area.maxY} }, false,
            major ? kGridMajor : kGridMinor, ic::PANEL_STROKE_WIDTH_PX));
    }
    const long firstY = static_cast<long>(std::ceil(area.minY / g));
    const long lastY = static_cast<long>(std::floor(area.maxY / g));
    for (long j = firstY; j <= lastY; ++j) {
        const float y = static_cast<float>(j) * g;
        const bool major = j % ic::MAJOR_GRID_INTERVAL == 0;
        out.commands.push_back(strokePath(Layer::Grid, { {area.minX, y}, {area.maxX, y} }, false,
            major ? kGridMajor : kGridMinor, ic::PANEL_STROKE_WIDTH_PX));
    }
}

void emitPanels(const std::vector<Panel>& panels, RenderList& out) {
    for (const Panel& p : panels) {
        std::vector<Point2> outline = panelOutline(p);
        if (!finiteOutline(outline)) continue;
        DrawCommand cmd = strokePath(Layer::Panel, std::move(outline), true, kPanelStroke, ic::PANEL_STROKE_WIDTH_PX);
        cmd.panelId = p.id;
        cmd.fillEnabled = true;
        cmd.fill = kPanelFill;
        out.commands.push_back(std::move(cmd));
    }
}

void emitSelection(const Panel& p, float scale, RenderList& out) {
    std::vector<Point2> outline = panelOutline(p);
    if (!finiteOutline(outline)) return;

    DrawCommand highlight = strokePath(Layer::Selection, std::move(outline), true, kSelection, ic::SELECTION_STROKE_WIDTH_PX);
    highlight.panelId = p.id;
    out.commands.push_back(std::move(highlight));

    const float half = ic::HANDLE_RENDER_SIZE_PX * 0.5f / scale;
    for (int i = 0; i < 4; ++i) {
        const Point2 c = cornerHandlePosition(p, i);
        DrawCommand handle = strokePath(Layer::Selection,
            { {c.x - half, c.y - half}, {c.x + half, c.y - half}, {c.x + half, c.y + half}, {c.x - half, c.y + half} },
            true, kSelection, ic::PANEL_STROKE_WIDTH_PX);
        handle.panelId = p.id;
        handle.fillEnabled = true;
        handle.fill = kHandleFill;
        out.commands.push_back(std::move(handle));
    }

    const Point2 topMid = localToWorld(p, Point2{ p.width * 0.5f, 0.0f });
    const Point2 knob = rotateHandlePosition(p, ic::ROTATE_HANDLE_OFFSET_PX / scale);
    DrawCommand stem = strokePath(Layer::Selection, { topMid, knob }, false, kSelection, ic::PANEL_STROKE_WIDTH_PX);
    stem.panelId = p.id;
    out.commands.push_back(std::move(stem));

    DrawCommand rotate;
    rotate.kind = CommandKind::Circle;
    rotate.layer = Layer::Selection;
    rotate.panelId = p.id;
    rotate.center = knob;
    rotate.radius = half;
    rotate.fillEnabled = true;
    rotate.fill = kHandleFill;
    rotate.strokeEnabled = true;
    rotate.stroke.color = kSelection;
    rotate.stroke.widthPx = ic::PANEL_STROKE_WIDTH_PX;
    out.commands.push_back(std::move(rotate));
}

void emitOverlays(const RenderInputs& in, float scale, RenderList& out) {
    if (in.snapGuides) {
        for (const SnapGuide& g : *in.snapGuides) {
            DrawCommand guide = strokePath(Layer::Overlay, { {g.x0, g.y0}, {g.x1, g.y1} }, false, kGuide, ic::GUIDE_STROKE_WIDTH_PX);
            guide.stroke.dash = { 4.0f, 4.0f };
            out.commands.push_back(std::move(guide));
        }
    }

    if (in.draftPoints && !in.draftPoints->empty()) {
        std::vector<Point2> pts = *in.draftPoints;
        if (in.hasDraftCursor) pts.push_back(in.draftCursor);
        out.commands.push_back(strokePath(Layer::Overlay, std::move(pts), false, kDraft, ic::PANEL_STROKE_WIDTH_PX));

        const float r = ic::HANDLE_RENDER_SIZE_PX * 0.5f / scale;
        for (const Point2& p : *in.draftPoints) {
            DrawCommand vertex;
            vertex.kind = CommandKind::Circle;
            vertex.layer = Layer::Overlay;
            vertex.center = p;
            vertex.radius = r;
            vertex.fillEnabled = true;
            vertex.fill = kDraft;
            out.commands.push_back(std::move(vertex));
        }
    }
}

float fitLabelSize(const Panel& p, const std::string* lines, std::size_t count, float fontSize, const text::LabelMetrics& metrics) {
    float size = std::min(fontSize, std::min(p.width, p.length) * ic::LABEL_MAX_PANEL_FRACTION);
    float widest = 0.0f;
    for (std::size_t i = 0; i < count; ++i) {
        const std::optional<float> w = metrics.measureWidth(lines[i], size);
        if (!w) return fontSize;
        widest = std::max(widest, *w);
    }
    const float room = p.width * kLabelWidthFill;
    if (widest > room && widest > 0.0f) {
        size *= room / widest;
    }
    return size;
}

void emitLabels(const RenderInputs& in, float scale, RenderList& out) {
    const float baseSize = ic::LABEL_FONT_PX / scale;
    const bool measure = in.labelMetrics && in.labelMetrics->isAvailable();

    for (const Panel& p : *in.panels) {
        if (isDegenerate(p)) continue;
        const std::string lines[3] = { p.panelNumber, p.rollNumber, formatPanelSize(p.width, p.length) };
        const float fontSize = measure ? fitLabelSize(p, lines, 3, baseSize, *in.labelMetrics) : baseSize;
        const Point2 anchor = labelAnchor(p);

        for (int i = 0; i < 3; ++i) {
            DrawCommand label;
            label.kind = CommandKind::Text;
            label.layer = Layer::Label;
            label.panelId = p.id;
            label.text = lines[i];
            label.fontSize = fontSize;
            label.center = Point2{ anchor.x, anchor.y + static_cast<float>(i - 1) * fontSize * kLabelLineHeight };
            label.fillEnabled = true;
            label.fill = kLabel;
            out.commands.push_back(std::move(label));
        }
    }
}

} // namespace

Transform2D viewTransformOf(const Viewport& viewport) noexcept {
    Transform2D t;
    t.a = viewport.scale();
    t.d = viewport.scale();
    t.e = viewport.panX();
    t.f = viewport.panY();
    return t;
}

std::string formatPanelSize(float width, float length) {
    auto fmt = [](float v) {
        char buf[32];
        const float rounded = std::round(v);
        if (std::abs(v - rounded) < 0.05f) {
            std::snprintf(buf, sizeof(buf), "%.0f'", rounded);
        } else {
            std::snprintf(buf, sizeof(buf), "%.1f'", v);
        }
        return std::string(buf);
    };
    return fmt(width) + " x " + fmt(length);
}

RenderList buildRenderList(const RenderInputs& in) {
    RenderList out;
    if (!in.panels || !in.viewport || !in.site) return out;

    const float scale = in.viewport->scale();
    out.viewTransform = viewTransformOf(*in.viewport);

    emitGrid(in, scale, out);
    emitPanels(*in.panels, out);

    for (const Panel& p : *in.panels) {
        if (p.id == in.selectedId) {
            emitSelection(p, scale, out);
            break;
        }
    }

    emitOverlays(in, scale, out);
    emitLabels(in, scale, out);
    return out;
}

} // namespace geoliner::render
