#pragma once

#include "geoliner/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geoliner {

class PanelStore;

enum class OptimizerStrategy : std::uint8_t {
    Balanced = 0,
    Material = 1,
    Labor = 2,
};

const char* optimizerStrategyName(OptimizerStrategy strategy) noexcept;
std::optional<OptimizerStrategy> parseOptimizerStrategy(std::string_view name) noexcept;

struct OptimizerRequest {
    SiteConfig site;
    OptimizerStrategy strategy{OptimizerStrategy::Balanced};
    std::vector<Panel> panels;
};

enum class OptimizerStatus : std::uint8_t {
    Pass = 0,
    Fail = 1,
};

struct PanelPlacement {
    std::uint32_t id{0};
    float x{0.0f};
    float y{0.0f};
    float rotation{0.0f};
};

struct OptimizerSummary {
    OptimizerStrategy strategy{OptimizerStrategy::Balanced};
    std::uint32_t totalPanels{0};
    float siteUtilization{0.0f}; // percent of the site area covered
    std::string message;
};

struct OptimizerReply {
    OptimizerStatus status{OptimizerStatus::Fail};
    std::vector<PanelPlacement> placements;
    OptimizerSummary summary;
    std::string errorMessage;
};

// External layout optimizer. Implementations may throw std::exception;
// the bridge reports that as OptimizerFailed.
class OptimizerClient {
public:
    virtual ~OptimizerClient() = default;
    virtual OptimizerReply optimize(const OptimizerRequest& request) = 0;
};

struct OptimizerOutcome {
    EngineError error{EngineError::Ok};
    OptimizerSummary summary;
    std::string message;

    bool ok() const noexcept { return error == EngineError::Ok; }
};

OptimizerRequest buildOptimizerRequest(const PanelStore& store, OptimizerStrategy strategy);

// Ok only if every placement names an existing panel exactly once with finite values.
EngineError validateOptimizerReply(const OptimizerReply& reply, const PanelStore& store);

// Request, validate, then apply every placement in one atomic store commit.
// On any failure the store is left untouched.
OptimizerOutcome runOptimizer(OptimizerClient& client, PanelStore& store, OptimizerStrategy strategy);

// Sum of panel footprint areas over the site area, in percent.
float siteUtilizationPercent(const PanelStore& store);

} // namespace geoliner
