#include "geoliner/service/optimizer_bridge.h"
#include "geoliner/entity/panel_store.h"
#include "geoliner/geometry/panel_geometry.h"
#include "geoliner/core/logging.h"

#include <cmath>
#include <exception>
#include <unordered_set>
#include <utility>

namespace geoliner {

const char* optimizerStrategyName(OptimizerStrategy strategy) noexcept {
    switch (strategy) {
        case OptimizerStrategy::Balanced: return "balanced";
        case OptimizerStrategy::Material: return "material";
        case OptimizerStrategy::Labor: return "labor";
    }
    return "balanced";
}

std::optional<OptimizerStrategy> parseOptimizerStrategy(std::string_view name) noexcept {
    if (name == "balanced") return OptimizerStrategy::Balanced;
    if (name == "material") return OptimizerStrategy::Material;
    if (name == "labor") return OptimizerStrategy::Labor;
    return std::nullopt;
}

OptimizerRequest buildOptimizerRequest(const PanelStore& store, OptimizerStrategy strategy) {
    OptimizerRequest request;
    request.site = store.siteConfig();
    request.strategy = strategy;
    request.panels = store.panels();
    return request;
}

EngineError validateOptimizerReply(const OptimizerReply& reply, const PanelStore& store) {
    if (reply.status != OptimizerStatus::Pass) {
        return EngineError::OptimizerFailed;
    }

    std::unordered_set<std::uint32_t> seen;
    seen.reserve(reply.placements.size());
    for (const PanelPlacement& p : reply.placements) {
        if (!store.getPanel(p.id)) return EngineError::OptimizerFailed;
        if (!seen.insert(p.id).second) return EngineError::OptimizerFailed;
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.rotation)) {
            return EngineError::OptimizerFailed;
        }
    }
    return EngineError::Ok;
}

float siteUtilizationPercent(const PanelStore& store) {
    const SiteConfig& site = store.siteConfig();
    const double siteArea = static_cast<double>(site.width) * site.height;
    if (!(siteArea > 0.0)) return 0.0f;

    double covered = 0.0;
    for (const Panel& p : store.panels()) {
        covered += std::abs(signedArea(localOutline(p)));
    }
    return static_cast<float>(covered / siteArea * 100.0);
}

OptimizerOutcome runOptimizer(OptimizerClient& client, PanelStore& store, OptimizerStrategy strategy) {
    OptimizerOutcome outcome;
    const OptimizerRequest request = buildOptimizerRequest(store, strategy);

    OptimizerReply reply;
    try {
        reply = client.optimize(request);
    } catch (const std::exception& e) {
        GEOLINER_LOG_WARN("optimizer threw: %s", e.what());
        outcome.error = EngineError::OptimizerFailed;
        outcome.message = e.what();
        return outcome;
    }

    outcome.summary = reply.summary;
    const EngineError err = validateOptimizerReply(reply, store);
    if (err != EngineError::Ok) {
        GEOLINER_LOG_WARN("optimizer reply rejected (%zu placements)", reply.placements.size());
        outcome.error = err;
        outcome.message = reply.errorMessage.empty() ? "invalid optimizer reply" : reply.errorMessage;
        return outcome;
    }

    std::vector<PanelUpdate> updates;
    updates.reserve(reply.placements.size());
    for (const PanelPlacement& p : reply.placements) {
        PanelUpdate u{ p.id, PanelPatch{} };
        u.patch.x = p.x;
        u.patch.y = p.y;
        u.patch.rotation = p.rotation;
        updates.push_back(std::move(u));
    }

    if (!store.applyUpdates(updates)) {
        outcome.error = EngineError::OptimizerFailed;
        outcome.message = engineErrorName(store.lastError());
        return outcome;
    }

    outcome.summary.strategy = strategy;
    outcome.summary.totalPanels = static_cast<std::uint32_t>(store.size());
    outcome.summary.siteUtilization = siteUtilizationPercent(store);
    outcome.message = reply.summary.message;
    GEOLINER_LOG_DEBUG("optimizer (%s) placed %zu panels", optimizerStrategyName(strategy), reply.placements.size());
    return outcome;
}

} // namespace geoliner
