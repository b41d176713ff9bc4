#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the engine public API header for bindings.
#include "geoliner/engine.h"

#ifdef EMSCRIPTEN
using namespace geoliner;

struct PanelView {
    std::uint32_t id;
    std::string rollNumber;
    std::string panelNumber;
    PanelShape shape;
    float x, y, width, length, rotation;
    bool valid;
};

struct OptimizerOutcomeView {
    EngineError error;
    std::string strategy;
    std::uint32_t totalPanels;
    float siteUtilization;
    std::string message;
};

// Shape, position, dimensions and (for polygons) world corners of one panel.
emscripten::val panelToJs(const Panel& p) {
    emscripten::val item = emscripten::val::object();
    item.set("id", p.id);
    item.set("rollNumber", p.rollNumber);
    item.set("panelNumber", p.panelNumber);
    item.set("shape", std::string(panelShapeName(p.shape)));
    item.set("x", p.x);
    item.set("y", p.y);
    item.set("width", p.width);
    item.set("length", p.length);
    item.set("rotation", p.rotation);
    emscripten::val corners = emscripten::val::array();
    for (const Point2& c : p.corners) {
        emscripten::val pt = emscripten::val::object();
        pt.set("x", c.x);
        pt.set("y", c.y);
        corners.call<void>("push", pt);
    }
    item.set("corners", corners);
    return item;
}

// Forwards to a JS object exposing `optimize(request) -> reply`.
class JsOptimizerClient final : public OptimizerClient {
public:
    explicit JsOptimizerClient(emscripten::val target) : target_(std::move(target)) {}

    OptimizerReply optimize(const OptimizerRequest& request) override {
        emscripten::val panels = emscripten::val::array();
        for (const Panel& p : request.panels) {
            panels.call<void>("push", panelToJs(p));
        }
        emscripten::val site = emscripten::val::object();
        site.set("width", request.site.width);
        site.set("height", request.site.height);
        site.set("gridSize", request.site.gridSize);
        site.set("units", request.site.units);

        emscripten::val payload = emscripten::val::object();
        payload.set("siteConfig", site);
        payload.set("panels", panels);
        payload.set("strategy", std::string(optimizerStrategyName(request.strategy)));

        const emscripten::val result = target_.call<emscripten::val>("optimize", payload);

        OptimizerReply reply;
        reply.status = result["status"].as<std::string>() == "PASS" ? OptimizerStatus::Pass : OptimizerStatus::Fail;
        const emscripten::val placements = result["placements"];
        if (!placements.isUndefined()) {
            const unsigned n = placements["length"].as<unsigned>();
            for (unsigned i = 0; i < n; ++i) {
                const emscripten::val pl = placements[i];
                reply.placements.push_back(PanelPlacement{
                    pl["id"].as<std::uint32_t>(),
                    pl["x"].as<float>(),
                    pl["y"].as<float>(),
                    pl["rotation"].isUndefined() ? 0.0f : pl["rotation"].as<float>(),
                });
            }
        }
        const emscripten::val summary = result["summary"];
        if (!summary.isUndefined() && !summary["message"].isUndefined()) {
            reply.summary.message = summary["message"].as<std::string>();
        }
        const emscripten::val error = result["error"];
        if (!error.isUndefined() && !error["message"].isUndefined()) {
            reply.errorMessage = error["message"].as<std::string>();
        }
        return reply;
    }

private:
    emscripten::val target_;
};

// Forwards the finalized panel list to a JS callback returning a boolean.
class JsExportSink final : public ExportSink {
public:
    explicit JsExportSink(emscripten::val callback) : callback_(std::move(callback)) {}

    bool exportPanels(const std::vector<Panel>& panels, const SiteConfig& site) override {
        emscripten::val list = emscripten::val::array();
        for (const Panel& p : panels) {
            list.call<void>("push", panelToJs(p));
        }
        return callback_(list, site.units).as<bool>();
    }

private:
    emscripten::val callback_;
};

EMSCRIPTEN_BINDINGS(geoliner_engine_module) {
    emscripten::enum_<PanelShape>("PanelShape")
        .value("Rectangle", PanelShape::Rectangle)
        .value("Triangle", PanelShape::Triangle)
        .value("RightTriangle", PanelShape::RightTriangle)
        .value("Polygon", PanelShape::Polygon);

    emscripten::enum_<EngineError>("EngineError")
        .value("Ok", EngineError::Ok)
        .value("MissingLabel", EngineError::MissingLabel)
        .value("TooFewCorners", EngineError::TooFewCorners)
        .value("InvalidDimensions", EngineError::InvalidDimensions)
        .value("UnknownPanel", EngineError::UnknownPanel)
        .value("InvalidValue", EngineError::InvalidValue)
        .value("InvalidOperation", EngineError::InvalidOperation)
        .value("OptimizerFailed", EngineError::OptimizerFailed)
        .value("ExportFailed", EngineError::ExportFailed)
        .value("FontLoadFailed", EngineError::FontLoadFailed);

    emscripten::enum_<Tool>("Tool")
        .value("Select", Tool::Select)
        .value("Polygon", Tool::Polygon);

    emscripten::enum_<InteractionMode>("InteractionMode")
        .value("Idle", InteractionMode::Idle)
        .value("Dragging", InteractionMode::Dragging)
        .value("Resizing", InteractionMode::Resizing)
        .value("Rotating", InteractionMode::Rotating)
        .value("CreatingPolygon", InteractionMode::CreatingPolygon)
        .value("Panning", InteractionMode::Panning);

    emscripten::enum_<render::Layer>("RenderLayer")
        .value("Grid", render::Layer::Grid)
        .value("Panel", render::Layer::Panel)
        .value("Selection", render::Layer::Selection)
        .value("Overlay", render::Layer::Overlay)
        .value("Label", render::Layer::Label);

    emscripten::enum_<render::CommandKind>("CommandKind")
        .value("Path", render::CommandKind::Path)
        .value("Circle", render::CommandKind::Circle)
        .value("Text", render::CommandKind::Text);

    emscripten::register_vector<float>("FloatVector");
    emscripten::register_vector<Point2>("Point2Vector");
    emscripten::register_vector<render::DrawCommand>("DrawCommandVector");

    emscripten::value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    emscripten::value_object<render::Color>("Color")
        .field("r", &render::Color::r)
        .field("g", &render::Color::g)
        .field("b", &render::Color::b)
        .field("a", &render::Color::a);

    emscripten::value_object<render::Transform2D>("Transform2D")
        .field("a", &render::Transform2D::a)
        .field("b", &render::Transform2D::b)
        .field("c", &render::Transform2D::c)
        .field("d", &render::Transform2D::d)
        .field("e", &render::Transform2D::e)
        .field("f", &render::Transform2D::f);

    emscripten::value_object<render::StrokeStyle>("StrokeStyle")
        .field("color", &render::StrokeStyle::color)
        .field("widthPx", &render::StrokeStyle::widthPx)
        .field("dash", &render::StrokeStyle::dash);

    emscripten::value_object<render::DrawCommand>("DrawCommand")
        .field("kind", &render::DrawCommand::kind)
        .field("layer", &render::DrawCommand::layer)
        .field("panelId", &render::DrawCommand::panelId)
        .field("points", &render::DrawCommand::points)
        .field("closed", &render::DrawCommand::closed)
        .field("center", &render::DrawCommand::center)
        .field("radius", &render::DrawCommand::radius)
        .field("text", &render::DrawCommand::text)
        .field("fontSize", &render::DrawCommand::fontSize)
        .field("fillEnabled", &render::DrawCommand::fillEnabled)
        .field("fill", &render::DrawCommand::fill)
        .field("strokeEnabled", &render::DrawCommand::strokeEnabled)
        .field("stroke", &render::DrawCommand::stroke);

    emscripten::value_object<render::RenderList>("RenderList")
        .field("viewTransform", &render::RenderList::viewTransform)
        .field("commands", &render::RenderList::commands);

    emscripten::value_object<PanelView>("PanelView")
        .field("id", &PanelView::id)
        .field("rollNumber", &PanelView::rollNumber)
        .field("panelNumber", &PanelView::panelNumber)
        .field("shape", &PanelView::shape)
        .field("x", &PanelView::x)
        .field("y", &PanelView::y)
        .field("width", &PanelView::width)
        .field("length", &PanelView::length)
        .field("rotation", &PanelView::rotation)
        .field("valid", &PanelView::valid);

    emscripten::value_object<OptimizerOutcomeView>("OptimizerOutcome")
        .field("error", &OptimizerOutcomeView::error)
        .field("strategy", &OptimizerOutcomeView::strategy)
        .field("totalPanels", &OptimizerOutcomeView::totalPanels)
        .field("siteUtilization", &OptimizerOutcomeView::siteUtilization)
        .field("message", &OptimizerOutcomeView::message);

    emscripten::value_object<LayoutEngine::EngineStats>("EngineStats")
        .field("panelCount", &LayoutEngine::EngineStats::panelCount)
        .field("generation", &LayoutEngine::EngineStats::generation)
        .field("moveCount", &LayoutEngine::EngineStats::moveCount)
        .field("lastUpdateMs", &LayoutEngine::EngineStats::lastUpdateMs)
        .field("maxUpdateMs", &LayoutEngine::EngineStats::maxUpdateMs);

    emscripten::class_<LayoutEngine>("LayoutEngine")
        .constructor<>()
        .function("clear", &LayoutEngine::clear)
        // Site
        .function("setSiteSize", &LayoutEngine::setSiteSize)
        .function("setGridSize", &LayoutEngine::setGridSize)
        .function("setSnapEnabled", &LayoutEngine::setSnapEnabled)
        .function("setGridVisible", &LayoutEngine::setGridVisible)
        .function("setEdgeSnapThreshold", &LayoutEngine::setEdgeSnapThreshold)
        // Panels
        .function("addRectangle", &LayoutEngine::addRectangle)
        .function("addTriangle", &LayoutEngine::addTriangle)
        .function("addRightTriangle", &LayoutEngine::addRightTriangle)
        .function("addPolygon", emscripten::optional_override([](LayoutEngine& self, const std::string& roll, const std::string& panel, const std::vector<Point2>& corners) {
            return self.addPanel(PolygonSpec{ PanelLabels{ roll, panel }, corners });
        }))
        .function("selectPanel", &LayoutEngine::selectPanel)
        .function("clearSelection", &LayoutEngine::clearSelection)
        .function("deletePanel", &LayoutEngine::deletePanel)
        .function("deleteSelected", &LayoutEngine::deleteSelected)
        .function("movePanel", emscripten::optional_override([](LayoutEngine& self, std::uint32_t id, float x, float y) {
            PanelPatch patch;
            patch.x = x;
            patch.y = y;
            return self.updatePanel(id, patch);
        }))
        .function("setPanelRotation", emscripten::optional_override([](LayoutEngine& self, std::uint32_t id, float rotation) {
            PanelPatch patch;
            patch.rotation = rotation;
            return self.updatePanel(id, patch);
        }))
        .function("setPanelSize", emscripten::optional_override([](LayoutEngine& self, std::uint32_t id, float width, float length) {
            PanelPatch patch;
            patch.width = width;
            patch.length = length;
            return self.updatePanel(id, patch);
        }))
        .function("getPanel", emscripten::optional_override([](const LayoutEngine& self, std::uint32_t id) {
            const Panel* p = self.getPanel(id);
            if (!p) {
                return PanelView{ 0, "", "", PanelShape::Rectangle, 0, 0, 0, 0, 0, false };
            }
            return PanelView{ p->id, p->rollNumber, p->panelNumber, p->shape, p->x, p->y, p->width, p->length, p->rotation, true };
        }))
        .function("getPanelCount", &LayoutEngine::getPanelCount)
        .function("getSelectedId", &LayoutEngine::getSelectedId)
        .function("getPanelAt", &LayoutEngine::getPanelAt)
        .function("getHoverPanelId", &LayoutEngine::getHoverPanelId)
        // View
        .function("setViewSize", &LayoutEngine::setViewSize)
        .function("zoomIn", &LayoutEngine::zoomIn)
        .function("zoomOut", &LayoutEngine::zoomOut)
        .function("resetView", &LayoutEngine::resetView)
        .function("fitToContent", &LayoutEngine::fitToContent)
        .function("wheel", &LayoutEngine::wheel)
        .function("panBy", &LayoutEngine::panBy)
        .function("getViewScale", &LayoutEngine::getViewScale)
        // Pointer input
        .function("pointerDown", &LayoutEngine::pointerDown)
        .function("pointerMove", &LayoutEngine::pointerMove)
        .function("pointerUp", &LayoutEngine::pointerUp)
        .function("pointerLeave", &LayoutEngine::pointerLeave)
        .function("setTool", &LayoutEngine::setTool)
        .function("getTool", &LayoutEngine::getTool)
        .function("getInteractionMode", &LayoutEngine::getInteractionMode)
        .function("finishPolygon", &LayoutEngine::finishPolygon)
        .function("cancelPolygon", &LayoutEngine::cancelPolygon)
        .function("getDraftPointCount", &LayoutEngine::getDraftPointCount)
        // Rendering
        .function("render", &LayoutEngine::render)
        .function("getGeneration", &LayoutEngine::getGeneration)
        // Label fonts
        .function("loadLabelFont", emscripten::optional_override([](LayoutEngine& self, std::uintptr_t dataPtr, std::size_t dataSize) {
            return self.loadLabelFont(reinterpret_cast<const std::uint8_t*>(dataPtr), dataSize);
        }))
        .function("hasLabelMetrics", &LayoutEngine::hasLabelMetrics)
        // External services
        .function("runOptimizer", emscripten::optional_override([](LayoutEngine& self, emscripten::val client, const std::string& strategy) {
            const OptimizerStrategy s = parseOptimizerStrategy(strategy).value_or(OptimizerStrategy::Balanced);
            JsOptimizerClient bridge(std::move(client));
            const OptimizerOutcome outcome = self.runOptimizer(bridge, s);
            return OptimizerOutcomeView{
                outcome.error,
                optimizerStrategyName(s),
                outcome.summary.totalPanels,
                outcome.summary.siteUtilization,
                outcome.message,
            };
        }))
        .function("exportPanels", emscripten::optional_override([](LayoutEngine& self, emscripten::val callback) {
            JsExportSink sink(std::move(callback));
            return self.exportPanels(sink);
        }))
        .function("getLastError", &LayoutEngine::getLastError)
        .function("clearError", &LayoutEngine::clearError)
        .function("getStats", &LayoutEngine::getStats);
}
#endif
