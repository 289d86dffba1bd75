#pragma once

#include "textarea/types.h"
#include "textarea/text_area_config.h"
#include "textarea/text/text_types.h"
#include "textarea/edit/clipboard.h"
#include "textarea/edit/cursor_model.h"
#include "textarea/edit/history_manager.h"
#include "textarea/edit/viewport_controller.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace textarea {

class TextArea;

// Fired when a focus session ends with changed text.
using EditingFinishedCallback = std::function<void(TextArea& area, bool wasEscaped)>;

/**
 * TextArea: one editable (or display-only) block of wrapped text.
 *
 * Owns the text, its layout, the caret and selection, the undo history and
 * the scroll viewport. Every text change relayouts from scratch.
 *
 * Coordinates: "content" space is the laid-out text (row 0 at y = 0);
 * "viewport" space is relative to the visible window's top-left corner.
 */
class TextArea {
public:
    /**
     * @throws ConfigurationError on an invalid configuration
     */
    explicit TextArea(const TextAreaOptions& options);

    // Non-copyable: focus sessions hold references to areas
    TextArea(const TextArea&) = delete;
    TextArea& operator=(const TextArea&) = delete;

    /**
     * Apply a partial configuration. A text change is recorded in history.
     * @throws ConfigurationError on an invalid result; nothing changes then
     */
    void update(const TextAreaOptions& options);

    // =========================================================================
    // State
    // =========================================================================

    const TextAreaConfig& config() const noexcept { return config_; }
    const std::string& text() const noexcept { return config_.text; }
    const text::WrappedLayout& layout() const noexcept { return layout_; }
    const std::vector<std::optional<Paint>>& rowPaint() const noexcept { return rowPaint_; }

    float lineHeight() const noexcept { return lineHeight_; }
    float contentWidth() const noexcept { return contentWidth_; }
    float contentHeight() const noexcept { return contentHeight_; }

    // Codepoints in the text (== sentinel index)
    std::uint32_t charCount() const noexcept { return layout_.sentinel(); }

    std::uint32_t caret() const noexcept { return cursor_.position(); }
    const edit::Selection& selection() const noexcept { return cursor_.selection(); }
    std::optional<float> stickyX() const noexcept { return cursor_.stickyX(); }
    std::string selectedText() const;

    const edit::HistoryManager& history() const noexcept { return history_; }
    const edit::ViewportController& viewport() const noexcept { return viewport_; }
    bool hasViewport() const noexcept { return config_.width.has_value() && config_.height.has_value(); }

    // =========================================================================
    // Caret & Selection
    // =========================================================================

    /**
     * Place the caret (clamped) and scroll it into view unless noScroll.
     */
    void setCaret(std::uint32_t pos, bool noScroll = false);

    void setSelection(std::uint32_t p1, std::uint32_t p2) { cursor_.setSelection(p1, p2); }
    void collapseSelection() { cursor_.collapseSelection(); }
    void clearStickyX() { cursor_.clearStickyX(); }

    /**
     * Directional caret move; extend grows the selection.
     */
    void moveCaret(Direction dir, bool extend);

    /**
     * Rows stepped by PageUp/PageDown.
     */
    std::uint32_t pageRows() const;

    /**
     * Caret position under a content-space point, nullopt outside the rows.
     */
    std::optional<std::uint32_t> hitTest(float contentX, float contentY) const;

    std::pair<float, float> viewportToContent(float x, float y) const;

    Rect caretRect() const;
    std::vector<Rect> selectionRects() const;

    // =========================================================================
    // Editing (impl/text_area_edit.cpp)
    // =========================================================================

    /**
     * Replace the selection (if any) with text and put the caret after it.
     * @return False when nothing was inserted (empty text or capacity exceeded)
     */
    bool insertText(std::string_view text);

    bool deleteSelection();
    bool backspace();
    bool deleteForward();

    bool copy(edit::Clipboard& clipboard) const;
    bool cut(edit::Clipboard& clipboard);
    bool paste(edit::Clipboard& clipboard);

    /**
     * Duplicate the selection in place, or the caret's paragraph below itself.
     */
    bool duplicate();

    void selectAll();
    bool undo();
    bool redo();

    // =========================================================================
    // Viewport
    // =========================================================================

    void scrollBy(float dx, float dy);

    /**
     * Scroll to an anchor, interpolated over `frames` ticks (0 = immediately).
     */
    void scrollTo(float x, float y, std::uint32_t frames = 0);

    /**
     * Advance viewport animation; true while still animating.
     */
    bool tickAnimation(std::uint32_t frames);

    edit::SliderGeometry horizontalSlider() const;
    edit::SliderGeometry verticalSlider() const;

    // =========================================================================
    // Callback
    // =========================================================================

    void setEditingFinishedCallback(EditingFinishedCallback callback) { onEditingFinished_ = std::move(callback); }
    void notifyEditingFinished(bool wasEscaped);

private:
    void relayout();
    void scrollToCaret();
    // Resize history to levels; liveText is the text the active level must hold
    void syncHistoryCapacity(std::size_t levels, const std::string& liveText);

    // Record newText in history and relayout; the caret is left for the caller to place
    void commitText(std::string newText);

    TextAreaConfig config_;
    text::WrappedLayout layout_;
    std::vector<std::optional<Paint>> rowPaint_;
    float lineHeight_ = 0.0f;
    float contentWidth_ = 0.0f;
    float contentHeight_ = 0.0f;

    edit::CursorModel cursor_;
    edit::HistoryManager history_;
    edit::ViewportController viewport_;

    EditingFinishedCallback onEditingFinished_;
};

} // namespace textarea
