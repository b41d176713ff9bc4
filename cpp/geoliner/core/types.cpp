#include "geoliner/core/types.h"

namespace geoliner {

const char* panelShapeName(PanelShape shape) noexcept {
    switch (shape) {
        case PanelShape::Rectangle: return "rectangle";
        case PanelShape::Triangle: return "triangle";
        case PanelShape::RightTriangle: return "right-triangle";
        case PanelShape::Polygon: return "polygon";
    }
    return "unknown";
}

const char* engineErrorName(EngineError error) noexcept {
    switch (error) {
        case EngineError::Ok: return "Ok";
        case EngineError::MissingLabel: return "MissingLabel";
        case EngineError::TooFewCorners: return "TooFewCorners";
        case EngineError::InvalidDimensions: return "InvalidDimensions";
        case EngineError::UnknownPanel: return "UnknownPanel";
        case EngineError::InvalidValue: return "InvalidValue";
        case EngineError::InvalidOperation: return "InvalidOperation";
        case EngineError::OptimizerFailed: return "OptimizerFailed";
        case EngineError::ExportFailed: return "ExportFailed";
        case EngineError::FontLoadFailed: return "FontLoadFailed";
    }
    return "Unknown";
}

} // namespace geoliner
