#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations keep FreeType/HarfBuzz headers out of engine headers.
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;
typedef struct hb_buffer_t hb_buffer_t;

namespace geoliner::text {

// Measures the advance width of single-line labels with one font face.
// The face is shaped at a fixed reference size and scaled linearly, so any
// world-unit font size can be asked for.
class LabelMetrics {
public:
    LabelMetrics();
    ~LabelMetrics();

    LabelMetrics(const LabelMetrics&) = delete;
    LabelMetrics& operator=(const LabelMetrics&) = delete;

    bool initialize();
    void shutdown();
    bool isInitialized() const noexcept { return initialized_; }

    // Replaces the current face. The data is copied.
    bool loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize);
    bool loadFontFromFile(const std::string& filePath);

    // True when a face is loaded and widths can be measured.
    bool isAvailable() const noexcept;

    // Width of `utf8` at `fontSize` (same unit as the result); nullopt when unavailable.
    std::optional<float> measureWidth(std::string_view utf8, float fontSize) const;

private:
    static constexpr float kReferenceSize = 64.0f;

    bool initialized_{false};
    FT_Library ftLibrary_{nullptr};
    FT_Face ftFace_{nullptr};
    hb_font_t* hbFont_{nullptr};
    hb_buffer_t* hbBuffer_{nullptr};
    std::vector<std::uint8_t> fontData_;

    void releaseFace();
};

} // namespace geoliner::text
