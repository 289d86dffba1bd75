#pragma once

#include "textarea/types.h"
#include "textarea/text/text_types.h"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <vector>

namespace textarea::edit {

// Stored literally; consumers normalize with lo()/hi().
struct Selection {
    std::uint32_t anchor = 0;
    std::uint32_t moving = 0;

    bool empty() const noexcept { return anchor == moving; }
    std::uint32_t lo() const noexcept { return std::min(anchor, moving); }
    std::uint32_t hi() const noexcept { return std::max(anchor, moving); }
};

/**
 * CursorModel: caret position, selection and sticky column over a wrapped layout.
 *
 * Positions are cell indices in [0, sentinel]. The sticky column is the pixel
 * x remembered across consecutive vertical moves.
 */
class CursorModel {
public:
    std::uint32_t position() const noexcept { return position_; }
    const Selection& selection() const noexcept { return selection_; }
    std::optional<float> stickyX() const noexcept { return stickyX_; }

    /**
     * Set the caret (clamped). Clears the sticky column; selection is untouched.
     */
    void setPosition(const text::WrappedLayout& layout, std::uint32_t pos);

    /**
     * Store a selection as given. Empty when p1 == p2.
     */
    void setSelection(std::uint32_t p1, std::uint32_t p2) { selection_ = {p1, p2}; }

    /**
     * Collapse the selection onto the caret.
     */
    void collapseSelection() { selection_ = {position_, position_}; }

    void clearStickyX() { stickyX_.reset(); }

    /**
     * Clamp caret and selection into [0, sentinel] after a relayout.
     */
    void clamp(const text::WrappedLayout& layout);

    /**
     * Move the caret.
     * @param dir Direction key
     * @param extend Grow the selection instead of collapsing it
     * @param pageRows Rows per PageUp/PageDown step
     * @return New caret position
     */
    std::uint32_t move(const text::WrappedLayout& layout, Direction dir, bool extend, std::uint32_t pageRows);

    // =========================================================================
    // Geometry
    // =========================================================================

    /**
     * Map a layout-space point to a caret position.
     * @param clipWidth Hit area extends at least this far right when set
     * @return Index, or nullopt when the point misses every row
     */
    static std::optional<std::uint32_t> hitTest(
        const text::WrappedLayout& layout,
        float x,
        float y,
        float lineHeight,
        std::optional<float> clipWidth
    );

    /**
     * Nearest caret boundary to x within a row (row must exist).
     */
    static std::uint32_t findIndexInRow(const text::WrappedLayout& layout, std::uint32_t row, float x);

    /**
     * Caret bar in layout space.
     */
    Rect caretRect(const text::WrappedLayout& layout, float lineHeight, float caretWidth, float caretHeight) const;

    /**
     * One rectangle per row covered by the selection; empty when nothing is selected.
     */
    std::vector<Rect> selectionRects(const text::WrappedLayout& layout, float lineHeight) const;

private:
    std::uint32_t position_ = 0;
    Selection selection_;
    std::optional<float> stickyX_;
};

} // namespace textarea::edit
