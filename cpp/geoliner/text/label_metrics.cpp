#include "geoliner/text/label_metrics.h"
#include "geoliner/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>
#include <hb-ft.h>

#include <cmath>
#include <fstream>

#if !GEOLINER_TEXT_ENABLED
#error "label_metrics.cpp should only be compiled when GEOLINER_TEXT_ENABLED=1"
#endif

namespace geoliner::text {

LabelMetrics::LabelMetrics() = default;

LabelMetrics::~LabelMetrics() {
    shutdown();
}

bool LabelMetrics::initialize() {
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        GEOLINER_LOG_WARN("FT_Init_FreeType failed (%d)", static_cast<int>(error));
        return false;
    }

    hbBuffer_ = hb_buffer_create();
    if (!hb_buffer_allocation_successful(hbBuffer_)) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
        return false;
    }

    initialized_ = true;
    return true;
}

void LabelMetrics::shutdown() {
    if (!initialized_) {
        return;
    }

    releaseFace();
    if (hbBuffer_) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }
    initialized_ = false;
}

void LabelMetrics::releaseFace() {
    if (hbFont_) {
        hb_font_destroy(hbFont_);
        hbFont_ = nullptr;
    }
    if (ftFace_) {
        FT_Done_Face(ftFace_);
        ftFace_ = nullptr;
    }
    fontData_.clear();
}

bool LabelMetrics::loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return false;
    }

    // FreeType reads from the buffer for the lifetime of the face.
    std::vector<std::uint8_t> dataCopy(fontData, fontData + dataSize);

    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        dataCopy.data(),
        static_cast<FT_Long>(dataCopy.size()),
        0,
        &face
    );
    if (error || !face) {
        GEOLINER_LOG_WARN("FT_New_Memory_Face failed (%d)", static_cast<int>(error));
        return false;
    }

    error = FT_Set_Char_Size(face, 0, static_cast<FT_F26Dot6>(kReferenceSize * 64), 72, 72);
    if (error) {
        FT_Done_Face(face);
        return false;
    }

    hb_font_t* font = hb_ft_font_create(face, nullptr);
    if (!font) {
        FT_Done_Face(face);
        return false;
    }

    releaseFace();
    fontData_ = std::move(dataCopy);
    ftFace_ = face;
    hbFont_ = font;
    return true;
}

bool LabelMetrics::loadFontFromFile(const std::string& filePath) {
    if (!initialized_) {
        return false;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return false;
    }

    std::streamsize size = file.tellg();
    if (size <= 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return false;
    }
    return loadFontFromMemory(buffer.data(), buffer.size());
}

bool LabelMetrics::isAvailable() const noexcept {
    return initialized_ && hbFont_ != nullptr;
}

std::optional<float> LabelMetrics::measureWidth(std::string_view utf8, float fontSize) const {
    if (!isAvailable() || !std::isfinite(fontSize) || fontSize <= 0.0f) {
        return std::nullopt;
    }
    if (utf8.empty()) {
        return 0.0f;
    }

    hb_buffer_clear_contents(hbBuffer_);
    hb_buffer_add_utf8(hbBuffer_, utf8.data(), static_cast<int>(utf8.size()), 0, static_cast<int>(utf8.size()));
    hb_buffer_guess_segment_properties(hbBuffer_);
    hb_shape(hbFont_, hbBuffer_, nullptr, 0);

    unsigned int glyphCount = 0;
    const hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(hbBuffer_, &glyphCount);
    hb_position_t advance = 0;
    for (unsigned int i = 0; i < glyphCount; ++i) {
        advance += positions[i].x_advance;
    }

    // Advances are 26.6 fixed point at the reference size.
    const float referenceWidth = static_cast<float>(advance) / 64.0f;
    return referenceWidth * (fontSize / kReferenceSize);
}

} // namespace geoliner::text
