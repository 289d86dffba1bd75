#ifndef TEXTAREA_TEXT_MEASURER_H
#define TEXTAREA_TEXT_MEASURER_H

#include "textarea/text/text_types.h"
#include <string_view>

namespace textarea::text {

/**
 * TextMeasurer: font-metric query used by layout.
 *
 * Implementations must be deterministic: the same string always yields the
 * same result.
 */
class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    /**
     * Ink bounding box of a UTF-8 string laid out on a single line.
     * Whitespace contributes advance but no ink.
     */
    virtual InkBounds measureBounds(std::string_view text) const = 0;

    /**
     * Total pen advance of a UTF-8 string.
     */
    virtual float advanceX(std::string_view text) const = 0;
};

} // namespace textarea::text

#endif // TEXTAREA_TEXT_MEASURER_H
