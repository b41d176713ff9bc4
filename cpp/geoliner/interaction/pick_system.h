#pragma once

#include "geoliner/core/types.h"

#include <cstdint>
#include <vector>

namespace geoliner {

class PanelStore;

enum class PickSubTarget : std::uint8_t {
    None = 0,
    Body = 1,
    ResizeHandle = 4,
    RotateHandle = 5,
};

// Return struct for picking
struct PickResult {
    std::uint32_t id{0};
    PickSubTarget subTarget{PickSubTarget::None};
    std::int32_t subIndex{-1}; // CornerIndex for resize handles
    float distance{0.0f};
    float hitX{0.0f};
    float hitY{0.0f};

    bool hit() const noexcept { return id != 0 && subTarget != PickSubTarget::None; }
};

// Resolves a world point to what lies under it. Order:
// 1. resize handles of the selected panel
// 2. rotate handle of the selected panel
// 3. panel bodies, topmost (last drawn) first
// Handle tolerances are given in screen pixels and divided by viewScale.
class PickSystem {
public:
    PickResult pick(float x, float y, float viewScale, const PanelStore& store) const;

    // Body-only query; 0 when nothing is under the point.
    std::uint32_t pickBody(float x, float y, const std::vector<Panel>& panels) const;

    // Handles of one panel only; None when no handle is within tolerance.
    PickResult pickHandles(float x, float y, float viewScale, const Panel& panel) const;
};

} // namespace geoliner
