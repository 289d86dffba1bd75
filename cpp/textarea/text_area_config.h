#pragma once

#include "textarea/types.h"
#include "textarea/text/text_measurer.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace textarea {

/**
 * Resolved configuration of a TextArea.
 */
struct TextAreaConfig {
    const text::TextMeasurer* measurer = nullptr;   // Not owned, must outlive the area
    std::string text;
    std::string sample = defaultSample;             // Line height = sample ink height + lineSpacing

    TextAlign align = TextAlign::Left;
    float alignFraction = 0.0f;                     // Used by TextAlign::Fraction
    float valign = 0.0f;                            // 0 top .. 1 bottom, when content fits

    std::optional<float> width;                     // Wrap width and viewport width
    std::optional<float> height;                    // Viewport height

    float letterSpacing = 0.0f;
    float lineSpacing = 0.0f;

    std::optional<Paint> color;                     // Default text color
    std::vector<Paint> colors;                      // Per-paragraph colors

    bool wholeWords = false;
    bool oneLine = false;
    std::optional<std::uint32_t> maxChars;          // Total codepoint capacity
    std::size_t undoLevels = defaultUndoLevels;

    float caretWidth = defaultCaretWidth;
    Paint caretPaint{defaultCaretColor, 1.0f};
    Paint selectionPaint{defaultSelectionColor, defaultSelectionAlpha};
    float sliderWidth = defaultSliderWidth;
    Paint sliderPaint{defaultSliderColor, defaultSliderAlpha};

    bool edit = false;
    bool scroll = false;
};

/**
 * Partial update: only the fields that are set are applied.
 */
struct TextAreaOptions {
    std::optional<const text::TextMeasurer*> measurer;
    std::optional<std::string> text;
    std::optional<std::string> sample;
    std::optional<TextAlign> align;
    std::optional<float> alignFraction;
    std::optional<float> valign;
    std::optional<float> width;
    std::optional<float> height;
    std::optional<float> letterSpacing;
    std::optional<float> lineSpacing;
    std::optional<Paint> color;
    std::optional<std::vector<Paint>> colors;
    std::optional<bool> wholeWords;
    std::optional<bool> oneLine;
    std::optional<std::uint32_t> maxChars;
    std::optional<std::size_t> undoLevels;
    std::optional<float> caretWidth;
    std::optional<Paint> caretPaint;
    std::optional<Paint> selectionPaint;
    std::optional<float> sliderWidth;
    std::optional<Paint> sliderPaint;
    std::optional<bool> edit;
    std::optional<bool> scroll;
};

/**
 * Merge options over a base configuration.
 */
TextAreaConfig applyOptions(TextAreaConfig base, const TextAreaOptions& options);

/**
 * Check a merged configuration.
 * @throws ConfigurationError when the measurer is missing, when dimensions are
 *         not positive, or when edit/scroll is requested without width and height
 */
void validateConfig(const TextAreaConfig& config);

} // namespace textarea
