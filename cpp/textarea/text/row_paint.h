#ifndef TEXTAREA_TEXT_ROW_PAINT_H
#define TEXTAREA_TEXT_ROW_PAINT_H

#include "textarea/types.h"
#include <optional>
#include <string>
#include <vector>

namespace textarea::text {

/**
 * Resolve the color of each wrapped row.
 *
 * Paragraph colors are indexed by paragraph: the index advances after every
 * row whose string ends with '\n'. Rows past the end of `colors` fall back to
 * `color`. Rows with neither stay unset (renderer default).
 */
std::vector<std::optional<Paint>> resolveRowPaint(
    const std::vector<std::string>& lines,
    const std::optional<Paint>& color,
    const std::vector<Paint>& colors
);

} // namespace textarea::text

#endif // TEXTAREA_TEXT_ROW_PAINT_H
