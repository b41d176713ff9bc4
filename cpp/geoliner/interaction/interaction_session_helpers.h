#pragma once

#include "geoliner/interaction/interaction_types.h"
#include <cstdint>

namespace geoliner::interaction_session_detail {
constexpr std::uint32_t kShiftMask = static_cast<std::uint32_t>(Modifier::Shift);
constexpr std::uint32_t kCtrlMask = static_cast<std::uint32_t>(Modifier::Ctrl);
constexpr std::uint32_t kMetaMask = static_cast<std::uint32_t>(Modifier::Meta);

inline bool isSnapSuppressed(std::uint32_t modifiers) {
    return (modifiers & (kCtrlMask | kMetaMask)) != 0;
}

inline bool isRotationSnapRequested(std::uint32_t modifiers) {
    return (modifiers & kShiftMask) != 0;
}

// Local-frame corner of handle i: x = width for NE/SE, y = length for SE/SW.
inline bool cornerOnRight(int corner) { return corner == 1 || corner == 2; }
inline bool cornerOnBottom(int corner) { return corner == 2 || corner == 3; }
} // namespace geoliner::interaction_session_detail
