#include "geoliner/entity/panel_store.h"
#include "geoliner/geometry/panel_geometry.h"
#include "geoliner/interaction/interaction_constants.h"
#include "geoliner/core/logging.h"
#include "geoliner/core/util.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace geoliner {

namespace ic = interaction_constants;

namespace {

bool allFinite(const std::vector<Point2>& pts) noexcept {
    for (const Point2& p : pts) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) return false;
    }
    return true;
}

bool isFiniteOpt(const std::optional<float>& v) noexcept {
    return !v || std::isfinite(*v);
}

// Scales corners about (originX, originY) on each axis.
void scaleCorners(Panel& p, float originX, float originY, float sx, float sy) noexcept {
    for (Point2& c : p.corners) {
        c.x = originX + (c.x - originX) * sx;
        c.y = originY + (c.y - originY) * sy;
    }
}

// Shrinks width/length so the rotated footprint `f` fits maxW x maxH. Quarter
// turns cap each axis on its own; other angles scale both axes together.
void capToContainer(Panel& p, const AABB& f, float maxW, float maxH) noexcept {
    float newW = p.width;
    float newL = p.length;
    const float quarter = std::round(p.rotation / 90.0f);
    if (std::fabs(p.rotation - quarter * 90.0f) < 1e-3f) {
        const bool swapped = static_cast<int>(quarter) % 2 != 0;
        newW = std::min(p.width, swapped ? maxH : maxW);
        newL = std::min(p.length, swapped ? maxW : maxH);
    } else {
        const float k = std::min(maxW / aabbWidth(f), maxH / aabbHeight(f));
        newW = p.width * k;
        newL = p.length * k;
    }
    if (p.shape == PanelShape::Polygon) {
        scaleCorners(p, p.x, p.y, newW / p.width, newL / p.length);
    }
    p.width = newW;
    p.length = newL;
}

struct DimensionedSpec {
    const PanelLabels* labels;
    PanelShape shape;
    float width;
    float length;
};

} // namespace

void syncPolygonFrame(Panel& p) {
    if (p.shape != PanelShape::Polygon || p.corners.empty()) return;
    const AABB b = boundsOfPoints(p.corners);
    p.x = b.minX;
    p.y = b.minY;
    p.width = aabbWidth(b);
    p.length = aabbHeight(b);
}

void translatePanel(Panel& p, float dx, float dy) noexcept {
    p.x += dx;
    p.y += dy;
    for (Point2& c : p.corners) {
        c.x += dx;
        c.y += dy;
    }
}

PanelStore::PanelStore(const SiteConfig& config) : config_(config) {}

bool PanelStore::fail(EngineError error) noexcept {
    lastError_ = error;
    GEOLINER_LOG_WARN("panel store rejected mutation: %s", engineErrorName(error));
    return false;
}

AddPanelResult PanelStore::addPanel(const PanelSpec& spec) {
    AddPanelResult result;
    Panel panel;

    const PanelLabels* labels = nullptr;
    if (const auto* poly = std::get_if<PolygonSpec>(&spec)) {
        labels = &poly->labels;
        if (labels->rollNumber.empty() || labels->panelNumber.empty()) {
            result.error = EngineError::MissingLabel;
        } else if (poly->corners.size() < 3) {
            result.error = EngineError::TooFewCorners;
        } else if (!allFinite(poly->corners)) {
            result.error = EngineError::InvalidValue;
        }
        panel.shape = PanelShape::Polygon;
        panel.corners = poly->corners;
    } else {
        DimensionedSpec dim{};
        if (const auto* rect = std::get_if<RectangleSpec>(&spec)) {
            dim = DimensionedSpec{ &rect->labels, PanelShape::Rectangle, rect->width, rect->length };
        } else if (const auto* tri = std::get_if<TriangleSpec>(&spec)) {
            dim = DimensionedSpec{ &tri->labels, PanelShape::Triangle, tri->width, tri->length };
        } else if (const auto* rt = std::get_if<RightTriangleSpec>(&spec)) {
            dim = DimensionedSpec{ &rt->labels, PanelShape::RightTriangle, rt->width, rt->length };
        }
        labels = dim.labels;
        if (!labels || labels->rollNumber.empty() || labels->panelNumber.empty()) {
            result.error = EngineError::MissingLabel;
        } else if (!std::isfinite(dim.width) || !std::isfinite(dim.length) || dim.width <= 0.0f || dim.length <= 0.0f) {
            result.error = EngineError::InvalidDimensions;
        }
        panel.shape = dim.shape;
        panel.width = dim.width;
        panel.length = dim.length;
        const float n = static_cast<float>(panels_.size());
        panel.x = ic::DEFAULT_OFFSET_X + n * ic::DEFAULT_STAGGER_X;
        panel.y = ic::DEFAULT_OFFSET_Y + n * ic::DEFAULT_STAGGER_Y;
    }

    if (!result.ok()) {
        fail(result.error);
        return result;
    }

    panel.rollNumber = labels->rollNumber;
    panel.panelNumber = labels->panelNumber;
    panel.id = nextId_++;
    syncPolygonFrame(panel);
    normalize(panel);

    index_[panel.id] = panels_.size();
    panels_.push_back(std::move(panel));
    generation_++;
    lastError_ = EngineError::Ok;
    result.id = panels_.back().id;
    GEOLINER_LOG_DEBUG("added panel id=%u shape=%s", result.id, panelShapeName(panels_.back().shape));
    return result;
}

EngineError PanelStore::mergePatch(Panel& target, const PanelPatch& patch) const {
    if (!isFiniteOpt(patch.x) || !isFiniteOpt(patch.y) || !isFiniteOpt(patch.width) ||
        !isFiniteOpt(patch.length) || !isFiniteOpt(patch.rotation)) {
        return EngineError::InvalidValue;
    }
    if ((patch.rollNumber && patch.rollNumber->empty()) || (patch.panelNumber && patch.panelNumber->empty())) {
        return EngineError::MissingLabel;
    }

    if (patch.rollNumber) target.rollNumber = *patch.rollNumber;
    if (patch.panelNumber) target.panelNumber = *patch.panelNumber;
    if (patch.rotation) target.rotation = *patch.rotation;

    if (target.shape == PanelShape::Polygon) {
        if (patch.corners) {
            if (patch.corners->size() < 3) return EngineError::TooFewCorners;
            if (!allFinite(*patch.corners)) return EngineError::InvalidValue;
            target.corners = *patch.corners;
            syncPolygonFrame(target);
        }
        if (patch.width || patch.length) {
            const float newW = patch.width ? *patch.width : target.width;
            const float newL = patch.length ? *patch.length : target.length;
            const float sx = target.width > 0.0f ? newW / target.width : 1.0f;
            const float sy = target.length > 0.0f ? newL / target.length : 1.0f;
            scaleCorners(target, target.x, target.y, sx, sy);
            target.width = newW;
            target.length = newL;
        }
        const float dx = patch.x ? *patch.x - target.x : 0.0f;
        const float dy = patch.y ? *patch.y - target.y : 0.0f;
        translatePanel(target, dx, dy);
        return EngineError::Ok;
    }

    if (patch.corners) return EngineError::InvalidOperation;
    if (patch.x) target.x = *patch.x;
    if (patch.y) target.y = *patch.y;
    if (patch.width) target.width = *patch.width;
    if (patch.length) target.length = *patch.length;
    return EngineError::Ok;
}

void PanelStore::normalize(Panel& p) const {
    if (p.shape == PanelShape::Polygon) {
        // Grow collapsed axes about the frame origin; a zero-extent axis keeps
        // its corners and only widens the frame.
        const float sx = (p.width > 0.0f && p.width < ic::MIN_SIZE) ? ic::MIN_SIZE / p.width : 1.0f;
        const float sy = (p.length > 0.0f && p.length < ic::MIN_SIZE) ? ic::MIN_SIZE / p.length : 1.0f;
        if (sx != 1.0f || sy != 1.0f) {
            scaleCorners(p, p.x, p.y, sx, sy);
        }
    }
    p.width = std::max(p.width, ic::MIN_SIZE);
    p.length = std::max(p.length, ic::MIN_SIZE);
    p.rotation = normalizeDegrees(p.rotation);

    AABB f = panelFootprint(p);
    if (aabbWidth(f) > config_.width || aabbHeight(f) > config_.height) {
        capToContainer(p, f, config_.width, config_.height);
        f = panelFootprint(p);
    }
    float dx = 0.0f;
    float dy = 0.0f;
    if (f.minX < 0.0f) {
        dx = -f.minX;
    } else if (f.maxX > config_.width) {
        dx = config_.width - f.maxX;
    }
    if (f.minY < 0.0f) {
        dy = -f.minY;
    } else if (f.maxY > config_.height) {
        dy = config_.height - f.maxY;
    }
    if (dx != 0.0f || dy != 0.0f) {
        translatePanel(p, dx, dy);
    }
}

bool PanelStore::updatePanel(std::uint32_t id, const PanelPatch& patch) {
    const auto it = index_.find(id);
    if (it == index_.end()) return fail(EngineError::UnknownPanel);

    Panel staged = panels_[it->second];
    const EngineError err = mergePatch(staged, patch);
    if (err != EngineError::Ok) return fail(err);
    normalize(staged);

    panels_[it->second] = std::move(staged);
    generation_++;
    lastError_ = EngineError::Ok;
    return true;
}

bool PanelStore::applyUpdates(const std::vector<PanelUpdate>& updates) {
    std::vector<std::pair<std::size_t, Panel>> staged;
    staged.reserve(updates.size());
    for (const PanelUpdate& u : updates) {
        const auto it = index_.find(u.id);
        if (it == index_.end()) return fail(EngineError::UnknownPanel);
        Panel next = panels_[it->second];
        // Several updates for one id compose in order.
        for (const auto& prev : staged) {
            if (prev.first == it->second) next = prev.second;
        }
        const EngineError err = mergePatch(next, u.patch);
        if (err != EngineError::Ok) return fail(err);
        normalize(next);
        staged.emplace_back(it->second, std::move(next));
    }

    for (auto& entry : staged) {
        panels_[entry.first] = std::move(entry.second);
    }
    generation_++;
    lastError_ = EngineError::Ok;
    return true;
}

bool PanelStore::deletePanel(std::uint32_t id) noexcept {
    const auto it = index_.find(id);
    if (it == index_.end()) return fail(EngineError::UnknownPanel);
    panels_.erase(panels_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuildIndex();
    if (selectedId_ == id) selectedId_ = kNoPanel;
    generation_++;
    lastError_ = EngineError::Ok;
    return true;
}

void PanelStore::clear() noexcept {
    panels_.clear();
    index_.clear();
    selectedId_ = kNoPanel;
    generation_++;
    lastError_ = EngineError::Ok;
}

bool PanelStore::selectPanel(std::uint32_t id) noexcept {
    if (id != kNoPanel && index_.find(id) == index_.end()) {
        return fail(EngineError::UnknownPanel);
    }
    if (selectedId_ != id) {
        selectedId_ = id;
        generation_++;
    }
    lastError_ = EngineError::Ok;
    return true;
}

const Panel* PanelStore::selectedPanel() const noexcept {
    return getPanel(selectedId_);
}

const Panel* PanelStore::getPanel(std::uint32_t id) const noexcept {
    const auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &panels_[it->second];
}

bool PanelStore::setSiteConfig(const SiteConfig& config) {
    if (!std::isfinite(config.width) || !std::isfinite(config.height) ||
        config.width <= 0.0f || config.height <= 0.0f ||
        !std::isfinite(config.gridSize) || config.gridSize < 0.0f ||
        !std::isfinite(config.edgeSnapThreshold) || config.edgeSnapThreshold < 0.0f) {
        return fail(EngineError::InvalidValue);
    }
    config_ = config;
    for (Panel& p : panels_) {
        normalize(p);
    }
    generation_++;
    lastError_ = EngineError::Ok;
    return true;
}

void PanelStore::rebuildIndex() {
    index_.clear();
    for (std::size_t i = 0; i < panels_.size(); ++i) {
        index_[panels_[i].id] = i;
    }
}

} // namespace geoliner
