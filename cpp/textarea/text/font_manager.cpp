#include "textarea/text/font_manager.h"
#include "textarea/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

namespace textarea::text {

namespace {

// Design-unit metrics; OS/2 typo values win when the table carries them
FontMetrics readDesignMetrics(FT_Face face) {
    FontMetrics m{};
    m.unitsPerEM = static_cast<float>(face->units_per_EM);
    if (!FT_IS_SCALABLE(face)) {
        return m;
    }

    const TT_OS2* os2 = static_cast<const TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && (os2->sTypoAscender != 0 || os2->sTypoDescender != 0)) {
        m.ascender = static_cast<float>(os2->sTypoAscender);
        m.descender = static_cast<float>(os2->sTypoDescender);
        m.lineGap = static_cast<float>(os2->sTypoLineGap);
    } else {
        m.ascender = static_cast<float>(face->ascender);
        m.descender = static_cast<float>(face->descender);
        m.lineGap = static_cast<float>(face->height - face->ascender + face->descender);
    }
    return m;
}

} // namespace

void FtFaceDeleter::operator()(FT_Face face) const {
    FT_Done_Face(face);
}

void HbFontDeleter::operator()(hb_font_t* font) const {
    hb_font_destroy(font);
}

// =============================================================================
// FontFace
// =============================================================================

bool FontFace::setPixelSize(float pixelSize) {
    if (pixelSize <= 0.0f) {
        return false;
    }
    if (pixelSize == pixelSize_) {
        return true;
    }

    // 26.6 fixed point at 72 DPI, so one point is one pixel
    const FT_F26Dot6 size = static_cast<FT_F26Dot6>(pixelSize * 64.0f);
    const FT_Error error = FT_Set_Char_Size(ftFace_.get(), 0, size, 72, 72);
    if (error) {
        TEXTAREA_LOG_WARN("FT_Set_Char_Size(%.2f) failed (%d)", pixelSize, static_cast<int>(error));
        return false;
    }

    hb_ft_font_changed(hbFont_.get());
    hb_font_set_scale(hbFont_.get(), static_cast<int>(size), static_cast<int>(size));
    pixelSize_ = pixelSize;
    return true;
}

FontMetrics FontFace::metricsAt(float pixelSize) const {
    FontMetrics m{};
    if (designMetrics_.unitsPerEM > 0.0f && designMetrics_.ascender != 0.0f) {
        const float scale = pixelSize / designMetrics_.unitsPerEM;
        m.unitsPerEM = designMetrics_.unitsPerEM;
        m.ascender = designMetrics_.ascender * scale;
        m.descender = designMetrics_.descender * scale;
        m.lineGap = designMetrics_.lineGap * scale;
        return m;
    }

    // Bitmap faces only know the strike that is currently selected
    const FT_Size_Metrics& sm = ftFace_->size->metrics;
    m.ascender = static_cast<float>(sm.ascender) / 64.0f;
    m.descender = static_cast<float>(sm.descender) / 64.0f;
    m.lineGap = static_cast<float>(sm.height - sm.ascender + sm.descender) / 64.0f;
    return m;
}

// =============================================================================
// FontManager
// =============================================================================

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (ftLibrary_) {
        return true;
    }
    const FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        TEXTAREA_LOG_WARN("FT_Init_FreeType failed (%d)", static_cast<int>(error));
        ftLibrary_ = nullptr;
        return false;
    }
    return true;
}

void FontManager::shutdown() {
    // Faces must close before the library that opened them
    faces_.clear();
    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }
}

std::uint32_t FontManager::loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize) {
    if (!ftLibrary_ || !fontData || dataSize == 0) {
        return 0;
    }

    std::unique_ptr<FontFace> face(new FontFace());
    face->data_.assign(fontData, fontData + dataSize);

    FT_Face ftFace = nullptr;
    const FT_Error error = FT_New_Memory_Face(ftLibrary_, face->data_.data(),
        static_cast<FT_Long>(face->data_.size()), 0, &ftFace);
    if (error) {
        TEXTAREA_LOG_WARN("FT_New_Memory_Face failed (%d)", static_cast<int>(error));
        return 0;
    }
    return adopt(std::move(face), ftFace);
}

std::uint32_t FontManager::loadFontFromFile(const std::string& filePath) {
    if (!ftLibrary_) {
        return 0;
    }

    FT_Face ftFace = nullptr;
    const FT_Error error = FT_New_Face(ftLibrary_, filePath.c_str(), 0, &ftFace);
    if (error) {
        TEXTAREA_LOG_DEBUG("FT_New_Face(%s) failed (%d)", filePath.c_str(), static_cast<int>(error));
        return 0;
    }
    return adopt(std::unique_ptr<FontFace>(new FontFace()), ftFace);
}

std::uint32_t FontManager::adopt(std::unique_ptr<FontFace> face, FT_Face ftFace) {
    face->ftFace_.reset(ftFace);
    face->hbFont_.reset(hb_ft_font_create(ftFace, nullptr));
    if (!face->hbFont_) {
        TEXTAREA_LOG_WARN("hb_ft_font_create failed");
        return 0;
    }
    face->designMetrics_ = readDesignMetrics(ftFace);

    faces_.push_back(std::move(face));
    const std::uint32_t fontId = static_cast<std::uint32_t>(faces_.size());
    TEXTAREA_LOG_DEBUG("opened font %u (%s)", fontId, ftFace->family_name ? ftFace->family_name : "?");
    return fontId;
}

FontFace* FontManager::face(std::uint32_t fontId) {
    if (fontId == 0 || fontId > faces_.size()) {
        return nullptr;
    }
    return faces_[fontId - 1].get();
}

} // namespace textarea::text
