#pragma once

#include "geoliner/core/types.h"
#include "geoliner/entity/panel_store.h"
#include "geoliner/interaction/interaction_session.h"
#include "geoliner/interaction/interaction_types.h"
#include "geoliner/interaction/pick_system.h"
#include "geoliner/render/render.h"
#include "geoliner/service/export_sink.h"
#include "geoliner/service/optimizer_bridge.h"
#include "geoliner/text/label_metrics.h"
#include "geoliner/view/viewport.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace geoliner {

// Owns the panel store, the view, the interaction session and the label
// metrics. The host feeds pointer events in screen pixels and draws the
// render list. No exception crosses this API; failures set lastError.
class LayoutEngine {
    friend class LayoutEngineTestAccessor;
public:
    LayoutEngine();
    explicit LayoutEngine(const SiteConfig& site);

    LayoutEngine(const LayoutEngine&) = delete;
    LayoutEngine& operator=(const LayoutEngine&) = delete;

    // Removes every panel and any in-progress gesture or polygon draft.
    void clear();

    // ==============================================================================
    // Site configuration
    // ==============================================================================
    bool setSiteConfig(const SiteConfig& site);
    const SiteConfig& getSiteConfig() const noexcept { return store_.siteConfig(); }
    bool setSiteSize(float width, float height);
    bool setGridSize(float gridSize);
    void setSnapEnabled(bool enabled);
    void setGridVisible(bool visible);
    bool setEdgeSnapThreshold(float threshold);

    // ==============================================================================
    // Panels
    // ==============================================================================
    // Returns the new id, or 0 on rejection (see getLastError()).
    std::uint32_t addPanel(const PanelSpec& spec);
    std::uint32_t addRectangle(const std::string& rollNumber, const std::string& panelNumber, float width, float length);
    std::uint32_t addTriangle(const std::string& rollNumber, const std::string& panelNumber, float width, float length);
    std::uint32_t addRightTriangle(const std::string& rollNumber, const std::string& panelNumber, float width, float length);

    bool selectPanel(std::uint32_t id);
    void clearSelection();
    bool updatePanel(std::uint32_t id, const PanelPatch& patch);
    bool deletePanel(std::uint32_t id);
    bool deleteSelected();

    const Panel* getPanel(std::uint32_t id) const noexcept { return store_.getPanel(id); }
    const std::vector<Panel>& getPanels() const noexcept { return store_.panels(); }
    std::uint32_t getPanelCount() const noexcept { return static_cast<std::uint32_t>(store_.size()); }
    std::uint32_t getSelectedId() const noexcept { return store_.selectedId(); }

    // Topmost panel under a screen point, 0 if none.
    std::uint32_t getPanelAt(float screenX, float screenY) const;
    std::uint32_t getHoverPanelId() const noexcept { return session_.hoverPanelId(); }

    // ==============================================================================
    // View
    // ==============================================================================
    void setViewSize(float width, float height);
    void zoomIn();
    void zoomOut();
    void resetView();
    // Fits every panel (or the site when empty) with `padding` world units around it.
    bool fitToContent(float padding);
    // Wheel notch at a screen point; negative deltaY zooms in.
    void wheel(float screenX, float screenY, float deltaY);
    void panBy(float dx, float dy);
    float getViewScale() const noexcept { return viewport_.scale(); }
    const Viewport& getViewport() const noexcept { return viewport_; }

    // ==============================================================================
    // Pointer input (screen pixels) and tools
    // ==============================================================================
    void pointerDown(float screenX, float screenY, std::uint32_t modifiers);
    bool pointerMove(float screenX, float screenY, std::uint32_t modifiers);
    void pointerUp(float screenX, float screenY, std::uint32_t modifiers);
    void pointerLeave();

    void setTool(Tool tool);
    Tool getTool() const noexcept { return session_.tool(); }
    InteractionMode getInteractionMode() const noexcept { return session_.mode(); }

    // Commits the polygon draft; returns the new id or 0 (draft kept).
    std::uint32_t finishPolygon(const std::string& rollNumber, const std::string& panelNumber);
    void cancelPolygon();
    std::uint32_t getDraftPointCount() const noexcept { return static_cast<std::uint32_t>(session_.getDraftPoints().size()); }

    // ==============================================================================
    // Rendering
    // ==============================================================================
    render::RenderList render() const;
    // Changes whenever the store or the view changes.
    std::uint32_t getGeneration() const noexcept { return store_.generation() + viewGeneration_; }

    // ==============================================================================
    // Label fonts
    // ==============================================================================
    bool initializeLabelMetrics();
    bool loadLabelFont(const std::uint8_t* fontData, std::size_t dataSize);
    bool loadLabelFontFile(const std::string& path);
    bool hasLabelMetrics() const noexcept { return labelMetrics_.isAvailable(); }

    // ==============================================================================
    // External services
    // ==============================================================================
    OptimizerOutcome runOptimizer(OptimizerClient& client, OptimizerStrategy strategy);
    bool exportPanels(ExportSink& sink);

    EngineError getLastError() const noexcept { return lastError_; }
    void clearError() noexcept { lastError_ = EngineError::Ok; }

    struct EngineStats {
        std::uint32_t panelCount;
        std::uint32_t generation;
        std::uint32_t moveCount;
        double lastUpdateMs;
        double maxUpdateMs;
    };
    EngineStats getStats() const noexcept;

private:
    PanelStore store_;
    Viewport viewport_;
    PickSystem pickSystem_;
    InteractionSession session_;
    text::LabelMetrics labelMetrics_;
    std::uint32_t viewGeneration_{0};
    EngineError lastError_{EngineError::Ok};

    void setError(EngineError err) noexcept { lastError_ = err; }
    bool record(bool ok);
    void touchView() noexcept { viewGeneration_++; }
};

} // namespace geoliner
