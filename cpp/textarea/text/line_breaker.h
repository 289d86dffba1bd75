#ifndef TEXTAREA_TEXT_LINE_BREAKER_H
#define TEXTAREA_TEXT_LINE_BREAKER_H

#include "textarea/text/text_measurer.h"
#include "textarea/text/text_types.h"
#include <string_view>

namespace textarea::text {

/**
 * Break UTF-8 text into rows.
 *
 * Produces one CharCell per codepoint plus a trailing sentinel, the inclusive
 * cell range of each row, and each row's string. A row closed by a newline
 * keeps the '\n' in its string. A row broken at a space by whole-word wrapping
 * keeps the space cell but its string omits it.
 *
 * Rows overflow when the ink width of the row plus the next codepoint exceeds
 * maxWidth, or when the row would hold more than maxChars codepoints. A row
 * always receives at least one codepoint, so a single glyph wider than
 * maxWidth still lays out.
 *
 * @param measurer Font metrics
 * @param text UTF-8 content
 * @param options Width/length constraints, letter spacing, whole-word mode
 * @return Wrapped layout (never empty: at least one row with the sentinel)
 */
WrappedLayout wrapLines(const TextMeasurer& measurer, std::string_view text, const WrapOptions& options);

/**
 * Right edge of the ink of a string, including letter spacing.
 */
float measureInkExtent(const TextMeasurer& measurer, std::string_view text, std::uint32_t count, float letterSpacing);

} // namespace textarea::text

#endif // TEXTAREA_TEXT_LINE_BREAKER_H
