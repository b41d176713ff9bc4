#pragma once

namespace geoliner {

// Runtime snapping switches, derived from SiteConfig per gesture.
struct SnapOptions {
    bool gridEnabled{true};
    float gridSize{10.0f};
    bool edgeEnabled{true};
    // World units.
    float edgeThreshold{0.5f};
};

// World-space segment drawn where a neighbor edge fired.
struct SnapGuide {
    float x0;
    float y0;
    float x1;
    float y1;
};

} // namespace geoliner
