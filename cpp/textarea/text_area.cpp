#include "textarea/text_area.h"
#include "textarea/core/utf8.h"
#include "textarea/text/justifier.h"
#include "textarea/text/line_breaker.h"
#include "textarea/text/row_paint.h"
#include <algorithm>
#include <cmath>

namespace textarea {

TextArea::TextArea(const TextAreaOptions& options)
    : config_(applyOptions(TextAreaConfig{}, options)),
      history_(config_.undoLevels) {
    validateConfig(config_);
    history_.reset(config_.text);
    relayout();
}

void TextArea::update(const TextAreaOptions& options) {
    TextAreaConfig next = applyOptions(config_, options);
    validateConfig(next);

    const std::uint32_t caretBefore = cursor_.position();
    const bool textChanged = next.text != config_.text;
    const bool levelsChanged = next.undoLevels != config_.undoLevels;

    if (levelsChanged) {
        syncHistoryCapacity(next.undoLevels, config_.text);
    }
    config_ = std::move(next);
    if (textChanged) {
        history_.recordEdit(config_.text, caretBefore);
    }
    relayout();
}

void TextArea::syncHistoryCapacity(std::size_t levels, const std::string& liveText) {
    history_.setCapacity(levels);
    // Eviction can drop the active level; restart from the live text then
    if (history_.capacity() > 0 &&
        (history_.getHistorySize() == 0 || history_.entry(history_.getCursor()).text != liveText)) {
        history_.reset(liveText);
    }
}

void TextArea::relayout() {
    const text::TextMeasurer& measurer = *config_.measurer;

    lineHeight_ = measurer.measureBounds(config_.sample).height + config_.lineSpacing;

    std::string source = config_.text;
    if (config_.oneLine) {
        std::replace(source.begin(), source.end(), '\n', ' ');
    }

    text::WrapOptions wrap;
    wrap.letterSpacing = config_.letterSpacing;
    wrap.wholeWords = config_.wholeWords;
    if (!config_.oneLine) {
        wrap.maxWidth = config_.width;
    }
    layout_ = text::wrapLines(measurer, source, wrap);

    if (config_.width) {
        if (config_.align == TextAlign::Justify) {
            if (wrap.maxWidth) {
                layout_ = text::justifyLayout(layout_, measurer, *config_.width, config_.letterSpacing);
            }
        } else {
            layout_ = text::alignLayout(layout_, config_.align, config_.alignFraction, *config_.width);
        }
    }

    rowPaint_ = text::resolveRowPaint(layout_.lines, config_.color, config_.colors);

    if (config_.oneLine) {
        contentWidth_ = layout_.chars.back().xEnd + config_.caretWidth;
    } else {
        contentWidth_ = 0.0f;
        for (std::uint32_t r = 0; r < layout_.rowCount(); ++r) {
            contentWidth_ = std::max(contentWidth_, text::rowVisibleWidth(layout_, r));
        }
    }
    contentHeight_ = static_cast<float>(layout_.rowCount()) * lineHeight_;

    cursor_.clamp(layout_);

    if (hasViewport()) {
        viewport_.setVerticalAlign(config_.valign);
        viewport_.setViewport(*config_.width, *config_.height);
        viewport_.setContent(contentWidth_, contentHeight_);
    }
}

// =============================================================================
// Caret & Selection
// =============================================================================

std::string TextArea::selectedText() const {
    const edit::Selection& sel = cursor_.selection();
    if (sel.empty()) {
        return {};
    }
    return substrCodepoints(config_.text, sel.lo(), sel.hi() - sel.lo());
}

void TextArea::setCaret(std::uint32_t pos, bool noScroll) {
    cursor_.setPosition(layout_, pos);
    if (!noScroll) {
        scrollToCaret();
    }
}

void TextArea::scrollToCaret() {
    if (!hasViewport()) {
        return;
    }
    const text::CharCell& cell = layout_.chars[cursor_.position()];
    viewport_.scrollToCaret(cell.xStart, static_cast<float>(cell.row) * lineHeight_, lineHeight_, config_.caretWidth);
}

std::uint32_t TextArea::pageRows() const {
    if (!config_.height || lineHeight_ <= 0.0f) {
        return 1;
    }
    return static_cast<std::uint32_t>(std::max(1.0f, std::floor(*config_.height / lineHeight_)));
}

void TextArea::moveCaret(Direction dir, bool extend) {
    cursor_.move(layout_, dir, extend, pageRows());
    scrollToCaret();
}

std::optional<std::uint32_t> TextArea::hitTest(float contentX, float contentY) const {
    return edit::CursorModel::hitTest(layout_, contentX, contentY, lineHeight_, config_.width);
}

std::pair<float, float> TextArea::viewportToContent(float x, float y) const {
    if (!hasViewport()) {
        return {x, y};
    }
    return {x + viewport_.originX(), y + viewport_.originY()};
}

Rect TextArea::caretRect() const {
    return cursor_.caretRect(layout_, lineHeight_, config_.caretWidth, lineHeight_ - config_.lineSpacing);
}

std::vector<Rect> TextArea::selectionRects() const {
    return cursor_.selectionRects(layout_, lineHeight_);
}

// =============================================================================
// Viewport
// =============================================================================

void TextArea::scrollBy(float dx, float dy) {
    if (hasViewport()) {
        viewport_.scrollBy(dx, dy);
    }
}

void TextArea::scrollTo(float x, float y, std::uint32_t frames) {
    if (hasViewport()) {
        viewport_.animateTo(x, y, frames);
    }
}

bool TextArea::tickAnimation(std::uint32_t frames) {
    return viewport_.tick(frames);
}

edit::SliderGeometry TextArea::horizontalSlider() const {
    if (!hasViewport()) {
        return {};
    }
    return viewport_.horizontalSlider(config_.sliderWidth);
}

edit::SliderGeometry TextArea::verticalSlider() const {
    if (!hasViewport()) {
        return {};
    }
    return viewport_.verticalSlider(config_.sliderWidth);
}

void TextArea::notifyEditingFinished(bool wasEscaped) {
    if (onEditingFinished_) {
        onEditingFinished_(*this, wasEscaped);
    }
}

} // namespace textarea
