#ifndef GEOLINER_CORE_TYPES_H
#define GEOLINER_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

// Lightweight value types shared by every engine module.
// World units are feet; screen units are CSS pixels.

namespace geoliner {

struct Point2 { float x; float y; };

struct AABB {
    float minX, minY, maxX, maxY;
};

inline float aabbWidth(const AABB& b) noexcept { return b.maxX - b.minX; }
inline float aabbHeight(const AABB& b) noexcept { return b.maxY - b.minY; }

enum class PanelShape : std::uint8_t {
    Rectangle = 1,
    Triangle = 2,       // equilateral, inscribed in the local frame
    RightTriangle = 3,  // right angle at the local top-left corner
    Polygon = 4,
};

const char* panelShapeName(PanelShape shape) noexcept;

// Panel entity record.
// (x, y) is the top-left of the unrotated local frame; rotation pivots on the
// frame center. For polygons, corners are authoritative and x/y/width/length
// mirror their bounding box.
struct Panel {
    std::uint32_t id{0};
    std::string rollNumber;
    std::string panelNumber;
    PanelShape shape{PanelShape::Rectangle};
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float length{0.0f};
    float rotation{0.0f}; // degrees, [0, 360)
    std::vector<Point2> corners;
};

// ============================================================================
// Creation input (closed over shape kind)
// ============================================================================

struct PanelLabels {
    std::string rollNumber;
    std::string panelNumber;
};

struct RectangleSpec { PanelLabels labels; float width; float length; };
struct TriangleSpec { PanelLabels labels; float width; float length; };
struct RightTriangleSpec { PanelLabels labels; float width; float length; };
struct PolygonSpec { PanelLabels labels; std::vector<Point2> corners; };

using PanelSpec = std::variant<RectangleSpec, TriangleSpec, RightTriangleSpec, PolygonSpec>;

// ============================================================================
// Site / container configuration
// ============================================================================

struct SiteConfig {
    float width{1000.0f};
    float height{1000.0f};
    float gridSize{10.0f};
    bool snapEnabled{true};
    bool gridVisible{true};
    float edgeSnapThreshold{0.5f}; // world units
    std::string units{"ft"};
};

enum class EngineError : std::uint32_t {
    Ok = 0,
    MissingLabel = 1,
    TooFewCorners = 2,
    InvalidDimensions = 3,
    UnknownPanel = 4,
    InvalidValue = 5,
    InvalidOperation = 6,
    OptimizerFailed = 7,
    ExportFailed = 8,
    FontLoadFailed = 9,
};

const char* engineErrorName(EngineError error) noexcept;

} // namespace geoliner

#endif // GEOLINER_CORE_TYPES_H
