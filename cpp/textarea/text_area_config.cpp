#include "textarea/text_area_config.h"

namespace textarea {

namespace {

template <typename T>
void assignIfSet(T& target, const std::optional<T>& value) {
    if (value) {
        target = *value;
    }
}

template <typename T>
void assignIfSet(std::optional<T>& target, const std::optional<T>& value) {
    if (value) {
        target = *value;
    }
}

} // namespace

TextAreaConfig applyOptions(TextAreaConfig base, const TextAreaOptions& options) {
    assignIfSet(base.measurer, options.measurer);
    assignIfSet(base.text, options.text);
    assignIfSet(base.sample, options.sample);
    assignIfSet(base.align, options.align);
    assignIfSet(base.alignFraction, options.alignFraction);
    assignIfSet(base.valign, options.valign);
    assignIfSet(base.width, options.width);
    assignIfSet(base.height, options.height);
    assignIfSet(base.letterSpacing, options.letterSpacing);
    assignIfSet(base.lineSpacing, options.lineSpacing);
    assignIfSet(base.color, options.color);
    assignIfSet(base.colors, options.colors);
    assignIfSet(base.wholeWords, options.wholeWords);
    assignIfSet(base.oneLine, options.oneLine);
    assignIfSet(base.maxChars, options.maxChars);
    assignIfSet(base.undoLevels, options.undoLevels);
    assignIfSet(base.caretWidth, options.caretWidth);
    assignIfSet(base.caretPaint, options.caretPaint);
    assignIfSet(base.selectionPaint, options.selectionPaint);
    assignIfSet(base.sliderWidth, options.sliderWidth);
    assignIfSet(base.sliderPaint, options.sliderPaint);
    assignIfSet(base.edit, options.edit);
    assignIfSet(base.scroll, options.scroll);
    return base;
}

void validateConfig(const TextAreaConfig& config) {
    if (!config.measurer) {
        throw ConfigurationError("TextArea: a text measurer is required");
    }
    if ((config.width && *config.width <= 0.0f) || (config.height && *config.height <= 0.0f)) {
        throw ConfigurationError("TextArea: width and height must be positive");
    }
    if ((config.edit || config.scroll) && (!config.width || !config.height)) {
        throw ConfigurationError("TextArea: set width and height to edit or scroll text");
    }
}

} // namespace textarea
