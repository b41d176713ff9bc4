#pragma once

#include "geoliner/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace geoliner {

// Partial update. Unset fields keep their current value.
struct PanelPatch {
    std::optional<float> x;
    std::optional<float> y;
    std::optional<float> width;
    std::optional<float> length;
    std::optional<float> rotation;
    std::optional<std::vector<Point2>> corners;
    std::optional<std::string> rollNumber;
    std::optional<std::string> panelNumber;
};

struct PanelUpdate {
    std::uint32_t id;
    PanelPatch patch;
};

struct AddPanelResult {
    EngineError error{EngineError::Ok};
    std::uint32_t id{0};

    bool ok() const noexcept { return error == EngineError::Ok; }
};

// Canonical panel list (draw order = insertion order) plus the single selection.
// Every geometric mutation goes through updatePanel()/applyUpdates(), which
// re-apply min-size, rotation normalization and container clamping before commit.
class PanelStore {
public:
    static constexpr std::uint32_t kNoPanel = 0;

    PanelStore() = default;
    explicit PanelStore(const SiteConfig& config);

    AddPanelResult addPanel(const PanelSpec& spec);
    bool updatePanel(std::uint32_t id, const PanelPatch& patch);
    // All-or-nothing: validates every update first, then commits them together.
    bool applyUpdates(const std::vector<PanelUpdate>& updates);
    bool deletePanel(std::uint32_t id) noexcept;
    void clear() noexcept;

    // kNoPanel clears the selection; unknown ids are rejected and leave it unchanged.
    bool selectPanel(std::uint32_t id) noexcept;
    std::uint32_t selectedId() const noexcept { return selectedId_; }
    const Panel* selectedPanel() const noexcept;

    const Panel* getPanel(std::uint32_t id) const noexcept;
    const std::vector<Panel>& panels() const noexcept { return panels_; }
    std::size_t size() const noexcept { return panels_.size(); }
    bool empty() const noexcept { return panels_.empty(); }

    const SiteConfig& siteConfig() const noexcept { return config_; }
    // Re-clamps every panel into the (possibly smaller) container.
    bool setSiteConfig(const SiteConfig& config);

    EngineError lastError() const noexcept { return lastError_; }
    // Bumped on every committed change; hosts use it to skip redundant redraws.
    std::uint32_t generation() const noexcept { return generation_; }

private:
    std::vector<Panel> panels_;
    std::unordered_map<std::uint32_t, std::size_t> index_;
    SiteConfig config_{};
    std::uint32_t selectedId_{kNoPanel};
    std::uint32_t nextId_{1};
    std::uint32_t generation_{0};
    EngineError lastError_{EngineError::Ok};

    EngineError mergePatch(Panel& target, const PanelPatch& patch) const;
    void normalize(Panel& p) const;
    void rebuildIndex();
    bool fail(EngineError error) noexcept;
};

// Keeps a polygon's frame (x, y, width, length) equal to its corner bounds.
void syncPolygonFrame(Panel& p);

// Translates a panel (and its corners) without any validation.
void translatePanel(Panel& p, float dx, float dy) noexcept;

} // namespace geoliner
