#include "geoliner/text/label_metrics.h"

#if GEOLINER_TEXT_ENABLED
#error "label_metrics_stub.cpp should only be compiled when GEOLINER_TEXT_ENABLED=0"
#endif

namespace geoliner::text {

LabelMetrics::LabelMetrics() = default;

LabelMetrics::~LabelMetrics() = default;

bool LabelMetrics::initialize() {
    return false;
}

void LabelMetrics::shutdown() {}

void LabelMetrics::releaseFace() {}

bool LabelMetrics::loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize) {
    (void)fontData;
    (void)dataSize;
    return false;
}

bool LabelMetrics::loadFontFromFile(const std::string& filePath) {
    (void)filePath;
    return false;
}

bool LabelMetrics::isAvailable() const noexcept {
    return false;
}

std::optional<float> LabelMetrics::measureWidth(std::string_view utf8, float fontSize) const {
    (void)utf8;
    (void)fontSize;
    return std::nullopt;
}

} // namespace geoliner::text
