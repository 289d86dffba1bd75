#include "textarea/edit/cursor_model.h"
#include <cmath>

namespace textarea::edit {

using text::WrappedLayout;

void CursorModel::setPosition(const WrappedLayout& layout, std::uint32_t pos) {
    position_ = std::min(pos, layout.sentinel());
    stickyX_.reset();
}

void CursorModel::clamp(const WrappedLayout& layout) {
    const std::uint32_t last = layout.sentinel();
    position_ = std::min(position_, last);
    selection_.anchor = std::min(selection_.anchor, last);
    selection_.moving = std::min(selection_.moving, last);
}

std::uint32_t CursorModel::findIndexInRow(const WrappedLayout& layout, std::uint32_t row, float x) {
    const text::Section& sec = layout.sections[row];
    for (std::uint32_t i = sec.first; i <= sec.last; ++i) {
        const text::CharCell& cell = layout.chars[i];
        if (x < cell.xEnd) {
            const float mid = 0.5f * (cell.xStart + cell.xEnd);
            const std::uint32_t pos = (x < mid) ? i : i + 1;
            return std::min(pos, layout.sentinel());
        }
    }
    return sec.last;
}

std::optional<std::uint32_t> CursorModel::hitTest(
    const WrappedLayout& layout,
    float x,
    float y,
    float lineHeight,
    std::optional<float> clipWidth
) {
    if (lineHeight <= 0.0f) {
        return std::nullopt;
    }
    const double rowNumber = std::ceil(static_cast<double>(y) / lineHeight);
    if (rowNumber < 1.0 || rowNumber > static_cast<double>(layout.rowCount())) {
        return std::nullopt;
    }
    const std::uint32_t row = static_cast<std::uint32_t>(rowNumber) - 1;
    const text::Section& sec = layout.sections[row];

    float maxX = layout.chars[sec.last].xEnd;
    if (clipWidth) {
        maxX = std::max(maxX, *clipWidth);
    }
    if (x < 0.0f || x > maxX) {
        return std::nullopt;
    }
    return findIndexInRow(layout, row, x);
}

std::uint32_t CursorModel::move(const WrappedLayout& layout, Direction dir, bool extend, std::uint32_t pageRows) {
    const std::uint32_t old = position_;
    const std::uint32_t row = layout.chars[old].row;
    const std::uint32_t rows = layout.rowCount();
    const std::uint32_t step = std::max<std::uint32_t>(pageRows, 1);

    // Vertical target row; -1 means above the first row, rows means below the last
    auto verticalTarget = [&](std::int64_t target) -> std::uint32_t {
        if (!stickyX_) {
            stickyX_ = layout.chars[old].xStart;
        }
        if (target < 0) {
            return 0;
        }
        if (target >= static_cast<std::int64_t>(rows)) {
            return layout.sentinel();
        }
        return findIndexInRow(layout, static_cast<std::uint32_t>(target), *stickyX_);
    };

    std::uint32_t next = old;
    switch (dir) {
        case Direction::Left:
            stickyX_.reset();
            next = old > 0 ? old - 1 : 0;
            break;
        case Direction::Right:
            stickyX_.reset();
            next = std::min(old + 1, layout.sentinel());
            break;
        case Direction::Home:
            stickyX_.reset();
            next = layout.sections[row].first;
            break;
        case Direction::End:
            stickyX_.reset();
            next = layout.sections[row].last;
            break;
        case Direction::Up:
            next = verticalTarget(static_cast<std::int64_t>(row) - 1);
            break;
        case Direction::Down:
            next = verticalTarget(static_cast<std::int64_t>(row) + 1);
            break;
        case Direction::PageUp:
            next = verticalTarget(static_cast<std::int64_t>(row) - step);
            break;
        case Direction::PageDown:
            next = verticalTarget(static_cast<std::int64_t>(row) + step);
            break;
    }

    if (extend) {
        if (selection_.empty()) {
            selection_.anchor = old;
        }
        selection_.moving = next;
    } else {
        selection_ = {next, next};
    }
    position_ = next;
    return next;
}

Rect CursorModel::caretRect(const WrappedLayout& layout, float lineHeight, float caretWidth, float caretHeight) const {
    const text::CharCell& cell = layout.chars[std::min(position_, layout.sentinel())];
    return Rect{cell.xStart, static_cast<float>(cell.row) * lineHeight, caretWidth, caretHeight};
}

std::vector<Rect> CursorModel::selectionRects(const WrappedLayout& layout, float lineHeight) const {
    std::vector<Rect> rects;
    if (selection_.empty()) {
        return rects;
    }
    const std::uint32_t lo = std::min(selection_.lo(), layout.sentinel());
    const std::uint32_t hi = std::min(selection_.hi(), layout.sentinel());
    const std::uint32_t row1 = layout.chars[lo].row;
    const std::uint32_t row2 = layout.chars[hi].row;

    auto push = [&](std::uint32_t row, float x1, float x2) {
        if (x2 - x1 < minSelectionRectWidth) {
            x2 = x1 + minSelectionRectWidth;
        }
        rects.push_back(Rect{x1, static_cast<float>(row) * lineHeight, x2 - x1, lineHeight});
    };

    if (row1 == row2) {
        push(row1, layout.chars[lo].xStart, layout.chars[hi].xStart);
        return rects;
    }

    push(row1, layout.chars[lo].xStart, layout.chars[layout.sections[row1].last].xEnd);
    for (std::uint32_t row = row1 + 1; row < row2; ++row) {
        const text::Section& sec = layout.sections[row];
        push(row, layout.chars[sec.first].xStart, layout.chars[sec.last].xEnd);
    }
    push(row2, layout.chars[layout.sections[row2].first].xStart, layout.chars[hi].xStart);
    return rects;
}

} // namespace textarea::edit
