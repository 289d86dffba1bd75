#include "textarea/text/font_measurer.h"

#include <hb.h>

#include <algorithm>
#include <string>

namespace textarea::text {

namespace {

FontFace& resolveFace(FontManager& fonts, std::uint32_t fontId) {
    FontFace* face = fonts.face(fontId);
    if (!face) {
        throw FontError("FontMeasurer: font " + std::to_string(fontId) + " is not loaded");
    }
    return *face;
}

} // namespace

FontMeasurer::FontMeasurer(FontManager& fonts, std::uint32_t fontId, float fontSize)
    : face_(resolveFace(fonts, fontId)), fontId_(fontId), fontSize_(fontSize) {
    if (!face_.setPixelSize(fontSize_)) {
        throw FontError("FontMeasurer: cannot set font size");
    }
    buffer_ = hb_buffer_create();
    if (!hb_buffer_allocation_successful(buffer_)) {
        hb_buffer_destroy(buffer_);
        buffer_ = nullptr;
        throw FontError("FontMeasurer: cannot allocate shaping buffer");
    }
}

FontMeasurer::~FontMeasurer() {
    if (buffer_) {
        hb_buffer_destroy(buffer_);
    }
}

hb_font_t* FontMeasurer::shape(std::string_view text) const {
    // Faces are shared between measurers; restore our size if another changed it
    if (!face_.setPixelSize(fontSize_)) {
        return nullptr;
    }

    hb_buffer_clear_contents(buffer_);
    hb_buffer_add_utf8(buffer_, text.data(), static_cast<int>(text.size()), 0, static_cast<int>(text.size()));
    hb_buffer_guess_segment_properties(buffer_);
    hb_shape(face_.shaper(), buffer_, nullptr, 0);
    return face_.shaper();
}

float FontMeasurer::advanceX(std::string_view text) const {
    if (text.empty()) {
        return 0.0f;
    }
    hb_font_t* font = shape(text);
    if (!font) {
        return 0.0f;
    }

    unsigned int count = 0;
    const hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(buffer_, &count);
    hb_position_t pen = 0;
    for (unsigned int i = 0; i < count; ++i) {
        pen += positions[i].x_advance;
    }
    return static_cast<float>(pen) / 64.0f;
}

InkBounds FontMeasurer::measureBounds(std::string_view text) const {
    InkBounds bounds{};
    if (text.empty()) {
        return bounds;
    }
    hb_font_t* font = shape(text);
    if (!font) {
        return bounds;
    }

    unsigned int count = 0;
    const hb_glyph_info_t* infos = hb_buffer_get_glyph_infos(buffer_, &count);
    const hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(buffer_, &count);

    bool any = false;
    float left = 0.0f, right = 0.0f, top = 0.0f, bottom = 0.0f;
    hb_position_t pen = 0;
    for (unsigned int i = 0; i < count; ++i) {
        hb_glyph_extents_t ext{};
        if (hb_font_get_glyph_extents(font, infos[i].codepoint, &ext) && ext.width != 0 && ext.height != 0) {
            // Extents are y-up: y_bearing is the top, height is negative
            const float gx0 = static_cast<float>(pen + positions[i].x_offset + ext.x_bearing) / 64.0f;
            const float gx1 = gx0 + static_cast<float>(ext.width) / 64.0f;
            const float gTop = static_cast<float>(positions[i].y_offset + ext.y_bearing) / 64.0f;
            const float gBottom = gTop + static_cast<float>(ext.height) / 64.0f;
            if (!any) {
                left = std::min(gx0, gx1);
                right = std::max(gx0, gx1);
                top = gTop;
                bottom = gBottom;
                any = true;
            } else {
                left = std::min(left, std::min(gx0, gx1));
                right = std::max(right, std::max(gx0, gx1));
                top = std::max(top, gTop);
                bottom = std::min(bottom, gBottom);
            }
        }
        pen += positions[i].x_advance;
    }

    if (!any) {
        return bounds;
    }
    bounds.x = left;
    bounds.y = -top;
    bounds.width = right - left;
    bounds.height = top - bottom;
    return bounds;
}

float FontMeasurer::lineHeight() const {
    if (!face_.setPixelSize(fontSize_)) {
        return 0.0f;
    }
    const FontMetrics metrics = face_.metricsAt(fontSize_);
    return metrics.ascender - metrics.descender + metrics.lineGap;
}

} // namespace textarea::text
