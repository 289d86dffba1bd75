#ifndef TEXTAREA_TEXT_FONT_MEASURER_H
#define TEXTAREA_TEXT_FONT_MEASURER_H

#include "textarea/text/font_manager.h"
#include "textarea/text/text_measurer.h"
#include <cstdint>
#include <string_view>

// Forward declarations
typedef struct hb_buffer_t hb_buffer_t;

namespace textarea::text {

/**
 * FontMeasurer: TextMeasurer backed by HarfBuzz shaping of a FreeType face.
 *
 * Measures are in pixels at the configured size. Ink bounds use glyph
 * extents, so whitespace adds advance but no ink. The y axis points down:
 * InkBounds::y is the top of the ink relative to the baseline.
 */
class FontMeasurer : public TextMeasurer {
public:
    /**
     * @param fonts Font manager owning the face (must outlive the measurer)
     * @param fontId Font to shape with
     * @param fontSize Pixel size
     * @throws FontError if the font is missing or cannot be sized
     */
    FontMeasurer(FontManager& fonts, std::uint32_t fontId, float fontSize);
    ~FontMeasurer() override;

    FontMeasurer(const FontMeasurer&) = delete;
    FontMeasurer& operator=(const FontMeasurer&) = delete;

    InkBounds measureBounds(std::string_view text) const override;
    float advanceX(std::string_view text) const override;

    std::uint32_t fontId() const { return fontId_; }
    float fontSize() const { return fontSize_; }

    /**
     * Ascender + descender + line gap at the configured size.
     */
    float lineHeight() const;

private:
    // Shape text into buffer_; returns the font to query extents from
    hb_font_t* shape(std::string_view text) const;

    FontFace& face_;
    std::uint32_t fontId_;
    float fontSize_;
    hb_buffer_t* buffer_ = nullptr;
};

} // namespace textarea::text

#endif // TEXTAREA_TEXT_FONT_MEASURER_H
