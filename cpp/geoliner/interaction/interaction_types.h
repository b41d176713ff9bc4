#pragma once

#include <cstdint>

namespace geoliner {

// One non-Idle mode at a time.
enum class InteractionMode : std::uint8_t {
    Idle = 0,
    Dragging = 1,
    Resizing = 2,
    Rotating = 3,
    CreatingPolygon = 4,
    Panning = 5,
};

enum class Tool : std::uint8_t {
    Select = 0,
    Polygon = 1,
};

// Pointer modifier bits, as forwarded by the host.
enum class Modifier : std::uint32_t {
    None = 0,
    Shift = 1u << 0,
    Ctrl = 1u << 1,
    Alt = 1u << 2,
    Meta = 1u << 3,
};

const char* interactionModeName(InteractionMode mode) noexcept;

struct InteractionStats {
    std::uint32_t moveCount{0};
    double lastUpdateMs{0.0};
    double maxUpdateMs{0.0};
};

} // namespace geoliner
