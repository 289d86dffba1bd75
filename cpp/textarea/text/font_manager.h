#ifndef TEXTAREA_TEXT_FONT_MANAGER_H
#define TEXTAREA_TEXT_FONT_MANAGER_H

#include "textarea/text/text_types.h"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace textarea::text {

// Raised when the font backend cannot serve a measurer.
class FontError : public std::runtime_error {
public:
    explicit FontError(const std::string& what) : std::runtime_error(what) {}
};

struct FtFaceDeleter {
    void operator()(FT_Face face) const;
};

struct HbFontDeleter {
    void operator()(hb_font_t* font) const;
};

/**
 * FontFace: one FreeType face plus the HarfBuzz font that shapes against it.
 *
 * Faces are shared by every measurer built on the same font id, so the pixel
 * size is whatever the last setPixelSize call applied.
 */
class FontFace {
public:
    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    hb_font_t* shaper() const noexcept { return hbFont_.get(); }
    float pixelSize() const noexcept { return pixelSize_; }

    /**
     * Apply a pixel size to both the FreeType face and the HarfBuzz scale.
     * @return False if FreeType rejects the size
     */
    bool setPixelSize(float pixelSize);

    /**
     * Vertical metrics at a pixel size, from the design units when the face
     * has them, otherwise from the currently applied FreeType size.
     */
    FontMetrics metricsAt(float pixelSize) const;

private:
    friend class FontManager;
    FontFace() = default;

    // Backing store for faces opened from memory; FreeType reads it lazily
    std::vector<std::uint8_t> data_;
    std::unique_ptr<std::remove_pointer_t<FT_Face>, FtFaceDeleter> ftFace_;
    std::unique_ptr<hb_font_t, HbFontDeleter> hbFont_;
    FontMetrics designMetrics_;
    float pixelSize_ = 0.0f;
};

/**
 * FontManager: owns the FreeType library and the faces opened through it.
 * Font ids start at 1; 0 means "not loaded".
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize FreeType. Must be called before loading fonts.
     * @return True if initialization succeeded
     */
    bool initialize();

    /**
     * Close every face, then the FreeType library. Faces handed out earlier
     * are invalid afterwards.
     */
    void shutdown();

    bool isInitialized() const { return ftLibrary_ != nullptr; }

    /**
     * Open a face from TTF/OTF bytes (copied).
     * @return Font id, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize);

    /**
     * Open a face from a font file.
     * @return Font id, or 0 on failure
     */
    std::uint32_t loadFontFromFile(const std::string& filePath);

    // nullptr for unknown ids
    FontFace* face(std::uint32_t fontId);

private:
    std::uint32_t adopt(std::unique_ptr<FontFace> face, FT_Face ftFace);

    FT_Library ftLibrary_ = nullptr;
    std::vector<std::unique_ptr<FontFace>> faces_;
};

} // namespace textarea::text

#endif // TEXTAREA_TEXT_FONT_MANAGER_H
