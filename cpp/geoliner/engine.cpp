#include "geoliner/engine.h"
#include "geoliner/geometry/panel_geometry.h"
#include "geoliner/interaction/interaction_constants.h"
#include "geoliner/core/logging.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace geoliner {

namespace ic = interaction_constants;

LayoutEngine::LayoutEngine()
    : LayoutEngine(SiteConfig{}) {}

LayoutEngine::LayoutEngine(const SiteConfig& site)
    : store_(site),
      session_(store_, viewport_, pickSystem_) {}

bool LayoutEngine::record(bool ok) {
    lastError_ = ok ? EngineError::Ok : store_.lastError();
    return ok;
}

void LayoutEngine::clear() {
    session_.endGesture();
    session_.cancelPolygon();
    session_.clearHover();
    store_.clear();
    clearError();
}

// ==============================================================================
// Site configuration
// ==============================================================================

bool LayoutEngine::setSiteConfig(const SiteConfig& site) {
    return record(store_.setSiteConfig(site));
}

bool LayoutEngine::setSiteSize(float width, float height) {
    SiteConfig site = store_.siteConfig();
    site.width = width;
    site.height = height;
    return setSiteConfig(site);
}

bool LayoutEngine::setGridSize(float gridSize) {
    SiteConfig site = store_.siteConfig();
    site.gridSize = gridSize;
    return setSiteConfig(site);
}

void LayoutEngine::setSnapEnabled(bool enabled) {
    SiteConfig site = store_.siteConfig();
    site.snapEnabled = enabled;
    setSiteConfig(site);
}

void LayoutEngine::setGridVisible(bool visible) {
    SiteConfig site = store_.siteConfig();
    site.gridVisible = visible;
    setSiteConfig(site);
}

bool LayoutEngine::setEdgeSnapThreshold(float threshold) {
    SiteConfig site = store_.siteConfig();
    site.edgeSnapThreshold = threshold;
    return setSiteConfig(site);
}

// ==============================================================================
// Panels
// ==============================================================================

std::uint32_t LayoutEngine::addPanel(const PanelSpec& spec) {
    const AddPanelResult result = store_.addPanel(spec);
    setError(result.error);
    return result.ok() ? result.id : 0;
}

std::uint32_t LayoutEngine::addRectangle(const std::string& rollNumber, const std::string& panelNumber, float width, float length) {
    return addPanel(RectangleSpec{ PanelLabels{ rollNumber, panelNumber }, width, length });
}

std::uint32_t LayoutEngine::addTriangle(const std::string& rollNumber, const std::string& panelNumber, float width, float length) {
    return addPanel(TriangleSpec{ PanelLabels{ rollNumber, panelNumber }, width, length });
}

std::uint32_t LayoutEngine::addRightTriangle(const std::string& rollNumber, const std::string& panelNumber, float width, float length) {
    return addPanel(RightTriangleSpec{ PanelLabels{ rollNumber, panelNumber }, width, length });
}

bool LayoutEngine::selectPanel(std::uint32_t id) {
    return record(store_.selectPanel(id));
}

void LayoutEngine::clearSelection() {
    store_.selectPanel(PanelStore::kNoPanel);
}

bool LayoutEngine::updatePanel(std::uint32_t id, const PanelPatch& patch) {
    return record(store_.updatePanel(id, patch));
}

bool LayoutEngine::deletePanel(std::uint32_t id) {
    if (session_.activePanelId() == id) {
        session_.endGesture();
    }
    if (session_.hoverPanelId() == id) {
        session_.clearHover();
    }
    return record(store_.deletePanel(id));
}

bool LayoutEngine::deleteSelected() {
    const std::uint32_t id = store_.selectedId();
    if (id == PanelStore::kNoPanel) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    return deletePanel(id);
}

std::uint32_t LayoutEngine::getPanelAt(float screenX, float screenY) const {
    const Point2 world = viewport_.toWorld(Point2{ screenX, screenY });
    return pickSystem_.pickBody(world.x, world.y, store_.panels());
}

// ==============================================================================
// View
// ==============================================================================

void LayoutEngine::setViewSize(float width, float height) {
    viewport_.setViewSize(width, height);
    touchView();
}

void LayoutEngine::zoomIn() {
    viewport_.zoomIn();
    touchView();
}

void LayoutEngine::zoomOut() {
    viewport_.zoomOut();
    touchView();
}

void LayoutEngine::resetView() {
    viewport_.reset();
    touchView();
}

bool LayoutEngine::fitToContent(float padding) {
    AABB bounds{ 0.0f, 0.0f, store_.siteConfig().width, store_.siteConfig().height };
    if (!store_.empty()) {
        bounds = AABB{
            std::numeric_limits<float>::max(),
            std::numeric_limits<float>::max(),
            std::numeric_limits<float>::lowest(),
            std::numeric_limits<float>::lowest(),
        };
        for (const Panel& p : store_.panels()) {
            const AABB f = panelFootprint(p);
            bounds.minX = std::min(bounds.minX, f.minX);
            bounds.minY = std::min(bounds.minY, f.minY);
            bounds.maxX = std::max(bounds.maxX, f.maxX);
            bounds.maxY = std::max(bounds.maxY, f.maxY);
        }
    }
    if (!viewport_.fitToContent(bounds, padding)) {
        setError(EngineError::InvalidOperation);
        return false;
    }
    touchView();
    return true;
}

void LayoutEngine::wheel(float screenX, float screenY, float deltaY) {
    if (!std::isfinite(deltaY) || deltaY == 0.0f) return;
    const float factor = deltaY < 0.0f ? ic::ZOOM_STEP : 1.0f / ic::ZOOM_STEP;
    viewport_.zoomAt(Point2{ screenX, screenY }, factor);
    touchView();
}

void LayoutEngine::panBy(float dx, float dy) {
    viewport_.panBy(dx, dy);
    touchView();
}

// ==============================================================================
// Pointer input
// ==============================================================================

void LayoutEngine::pointerDown(float screenX, float screenY, std::uint32_t modifiers) {
    session_.pointerDown(screenX, screenY, modifiers);
}

bool LayoutEngine::pointerMove(float screenX, float screenY, std::uint32_t modifiers) {
    const bool panning = session_.mode() == InteractionMode::Panning;
    const bool changed = session_.pointerMove(screenX, screenY, modifiers);
    if (changed && panning) touchView();
    return changed;
}

void LayoutEngine::pointerUp(float screenX, float screenY, std::uint32_t modifiers) {
    session_.pointerUp(screenX, screenY, modifiers);
}

void LayoutEngine::pointerLeave() {
    session_.pointerLeave();
}

void LayoutEngine::setTool(Tool tool) {
    session_.setTool(tool);
}

std::uint32_t LayoutEngine::finishPolygon(const std::string& rollNumber, const std::string& panelNumber) {
    const AddPanelResult result = session_.finishPolygon(PanelLabels{ rollNumber, panelNumber });
    setError(result.error);
    return result.ok() ? result.id : 0;
}

void LayoutEngine::cancelPolygon() {
    session_.cancelPolygon();
}

// ==============================================================================
// Rendering
// ==============================================================================

render::RenderList LayoutEngine::render() const {
    render::RenderInputs in;
    in.panels = &store_.panels();
    in.selectedId = store_.selectedId();
    in.viewport = &viewport_;
    in.site = &store_.siteConfig();
    in.snapGuides = &session_.getSnapGuides();
    in.draftPoints = &session_.getDraftPoints();
    in.hasDraftCursor = session_.isDraftActive() && session_.hasDraftCursor();
    in.draftCursor = session_.getDraftCursor();
    in.labelMetrics = &labelMetrics_;
    return render::buildRenderList(in);
}

// ==============================================================================
// Label fonts
// ==============================================================================

bool LayoutEngine::initializeLabelMetrics() {
    if (!labelMetrics_.initialize()) {
        setError(EngineError::FontLoadFailed);
        return false;
    }
    return true;
}

bool LayoutEngine::loadLabelFont(const std::uint8_t* fontData, std::size_t dataSize) {
    if (!labelMetrics_.isInitialized() && !initializeLabelMetrics()) return false;
    if (!labelMetrics_.loadFontFromMemory(fontData, dataSize)) {
        setError(EngineError::FontLoadFailed);
        return false;
    }
    return true;
}

bool LayoutEngine::loadLabelFontFile(const std::string& path) {
    if (!labelMetrics_.isInitialized() && !initializeLabelMetrics()) return false;
    if (!labelMetrics_.loadFontFromFile(path)) {
        GEOLINER_LOG_WARN("could not load label font %s", path.c_str());
        setError(EngineError::FontLoadFailed);
        return false;
    }
    return true;
}

// ==============================================================================
// External services
// ==============================================================================

OptimizerOutcome LayoutEngine::runOptimizer(OptimizerClient& client, OptimizerStrategy strategy) {
    session_.endGesture();
    OptimizerOutcome outcome = geoliner::runOptimizer(client, store_, strategy);
    setError(outcome.error);
    return outcome;
}

bool LayoutEngine::exportPanels(ExportSink& sink) {
    const EngineError err = geoliner::exportPanels(sink, store_);
    setError(err);
    return err == EngineError::Ok;
}

LayoutEngine::EngineStats LayoutEngine::getStats() const noexcept {
    const InteractionStats& s = session_.getStats();
    return EngineStats{
        getPanelCount(),
        getGeneration(),
        s.moveCount,
        s.lastUpdateMs,
        s.maxUpdateMs,
    };
}

} // namespace geoliner
