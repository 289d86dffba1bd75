#ifndef TEXTAREA_TEXT_JUSTIFIER_H
#define TEXTAREA_TEXT_JUSTIFIER_H

#include "textarea/types.h"
#include "textarea/text/text_measurer.h"
#include "textarea/text/text_types.h"
#include <cstdint>
#include <optional>

namespace textarea::text {

/**
 * Stretch inter-word space so each row's visible content fills maxWidth.
 *
 * The last row and rows closed by a newline are left alone. Gaps are the
 * interior space runs of a row (leading and trailing whitespace excluded).
 * The free width floor(maxWidth - xEnd of the last visible cell) is split
 * across gaps left to right, the first (extra % gaps) gaps receiving one extra
 * pixel. Each gap's row string gains floor(added / spaceAdvance) spaces.
 *
 * @return A new layout; the input is not modified
 */
WrappedLayout justifyLayout(
    const WrappedLayout& layout,
    const TextMeasurer& measurer,
    float maxWidth,
    float letterSpacing
);

/**
 * Shift each row by k * (maxWidth - row width), with k = 0.5 for Center,
 * 1 for Right and alignFraction for Fraction. Other modes return a copy.
 */
WrappedLayout alignLayout(
    const WrappedLayout& layout,
    TextAlign align,
    float alignFraction,
    float maxWidth
);

/**
 * Right edge of the last visible (non-space, non-newline) cell of a row,
 * or 0 when the row holds none.
 */
float rowVisibleWidth(const WrappedLayout& layout, std::uint32_t row);

/**
 * Index of the last visible cell of a row.
 */
std::optional<std::uint32_t> lastVisibleCell(const WrappedLayout& layout, std::uint32_t row);

} // namespace textarea::text

#endif // TEXTAREA_TEXT_JUSTIFIER_H
