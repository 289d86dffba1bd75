#ifndef TEXTAREA_TEXT_TYPES_H
#define TEXTAREA_TEXT_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace textarea::text {

// ============================================================================
// Layout Types
// ============================================================================

// Ink bounding box returned by a measurer
struct InkBounds {
    float x = 0.0f;             // Left edge of ink relative to pen origin
    float y = 0.0f;             // Top edge of ink relative to baseline
    float width = 0.0f;
    float height = 0.0f;
};

// Font-wide vertical metrics (font units, or pixels once scaled)
struct FontMetrics {
    float unitsPerEM = 0.0f;
    float ascender = 0.0f;      // Positive, above baseline
    float descender = 0.0f;     // Negative, below baseline
    float lineGap = 0.0f;
};

// One codepoint of wrapped text (plus a trailing zero-width sentinel)
struct CharCell {
    std::uint32_t row = 0;      // Wrapped row, 0-based
    std::uint32_t col = 0;      // Column within the row, 0-based
    float xStart = 0.0f;        // Left edge in row-local pixels
    float xEnd = 0.0f;          // Right edge in row-local pixels
    std::string glyph;          // UTF-8 codepoint, empty for the sentinel

    bool isNewline() const { return glyph == "\n"; }
    bool isSpace() const { return glyph == " "; }
    bool isSentinel() const { return glyph.empty(); }
    bool isVisible() const { return !glyph.empty() && !isSpace() && !isNewline(); }
};

// Inclusive cell range covered by one row
struct Section {
    std::uint32_t first = 0;
    std::uint32_t last = 0;

    bool operator==(const Section& other) const { return first == other.first && last == other.last; }
};

// Result of line breaking: cells, sections and row strings
struct WrappedLayout {
    std::vector<CharCell> chars;
    std::vector<Section> sections;
    std::vector<std::string> lines;

    // Index of the trailing sentinel (== codepoint count of the text)
    std::uint32_t sentinel() const {
        return chars.empty() ? 0u : static_cast<std::uint32_t>(chars.size() - 1);
    }
    std::uint32_t rowCount() const { return static_cast<std::uint32_t>(sections.size()); }
};

// Constraints for wrapLines
struct WrapOptions {
    float letterSpacing = 0.0f;
    std::optional<float> maxWidth;          // Unbounded when absent
    std::optional<std::uint32_t> maxChars;  // Per-row codepoint limit, unbounded when absent
    bool wholeWords = false;
};

} // namespace textarea::text

#endif // TEXTAREA_TEXT_TYPES_H
