#ifndef GEOLINER_RENDER_RENDER_H
#define GEOLINER_RENDER_RENDER_H

#include "geoliner/render/render_list.h"
#include "geoliner/interaction/snap_types.h"
#include "geoliner/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace geoliner {
class Viewport;
namespace text { class LabelMetrics; }
}

namespace geoliner::render {

struct RenderInputs {
    const std::vector<Panel>* panels{nullptr};
    std::uint32_t selectedId{0};
    const Viewport* viewport{nullptr};
    const SiteConfig* site{nullptr};
    const std::vector<SnapGuide>* snapGuides{nullptr};
    const std::vector<Point2>* draftPoints{nullptr};
    bool hasDraftCursor{false};
    Point2 draftCursor{0.0f, 0.0f};
    // Optional; labels keep the zoom-derived size without it.
    const text::LabelMetrics* labelMetrics{nullptr};
};

// Pure: same inputs, same list. Order is grid, panels, selection decorations,
// overlays, labels.
RenderList buildRenderList(const RenderInputs& in);

Transform2D viewTransformOf(const Viewport& viewport) noexcept;

// "W' x L'" with at most one decimal.
std::string formatPanelSize(float width, float length);

} // namespace geoliner::render

#endif // GEOLINER_RENDER_RENDER_H
