#include "textarea/edit_session.h"
#include "textarea/core/logging.h"
#include "textarea/core/utf8.h"
#include <algorithm>
#include <cmath>

namespace textarea {

using input::SpecialKey;

// Timing values are milliseconds; one tick is about 1000 / 60 ms.
std::uint32_t SessionTiming::repeatDelayFrames() const {
    return static_cast<std::uint32_t>(std::floor(repeatDelay * 0.06));
}

std::uint32_t SessionTiming::repeatSpanFrames() const {
    return std::max<std::uint32_t>(1, static_cast<std::uint32_t>(std::floor(repeatSpan * 0.06)));
}

std::uint32_t SessionTiming::animationFrames() const {
    return std::max<std::uint32_t>(1, static_cast<std::uint32_t>(std::ceil(aniTime / 16.0)));
}

EditSession::EditSession(SessionTiming timing) : timing_(timing) {}

// =============================================================================
// Focus
// =============================================================================

void EditSession::focus(TextArea& area) {
    if (!area.hasViewport()) {
        throw ConfigurationError("TextArea: set width and height to focus");
    }
    if (focused_ == &area) {
        return;
    }
    if (focused_) {
        blur(BlurReason::Switch);
    }

    focused_ = &area;
    originalText_ = area.text();
    blinkCounter_ = 0;
    repeat_ = {};
    pointer_ = {};
    area.setCaret(area.caret(), true);
    TEXTAREA_LOG_DEBUG("focus acquired (%u codepoints)", area.charCount());
}

void EditSession::blur(BlurReason reason) {
    if (!focused_) {
        return;
    }
    TextArea& area = *focused_;
    focused_ = nullptr;

    modifiers_ = {};
    repeat_ = {};
    pointer_ = {};
    area.clearStickyX();
    area.collapseSelection();

    const bool changed = area.text() != originalText_;
    originalText_.clear();
    TEXTAREA_LOG_DEBUG("focus released (reason %d, changed %d)", static_cast<int>(reason), changed ? 1 : 0);
    if (changed) {
        area.notifyEditingFinished(reason == BlurReason::Esc || reason == BlurReason::Switch);
    }
}

// =============================================================================
// Keys
// =============================================================================

void EditSession::keyDown(const input::KeyDown& event) {
    if (!focused_ || !focused_->config().edit) {
        return;
    }
    repeat_.event = event;
    repeat_.counter = 0;
    blinkCounter_ = 0;
    handleKey(event);
}

void EditSession::keyUp(const input::KeyUp& event) {
    std::optional<SpecialKey> key = event.special;
    if (!key) {
        key = input::specialKeyFromHostCode(event.code, swapCtrlWin_);
    }
    if (key && input::isModifier(*key)) {
        setModifier(*key, false);
    }
    repeat_ = {};
}

std::optional<SpecialKey> EditSession::resolveKey(const input::KeyDown& event) const {
    if (modifiers_.ctrl) {
        if (auto hotkey = input::hotkeyFromCode(event.code)) {
            return hotkey;
        }
    }
    if (event.special) {
        return event.special;
    }
    return input::specialKeyFromHostCode(event.code, swapCtrlWin_);
}

void EditSession::setModifier(SpecialKey key, bool down) {
    switch (key) {
        case SpecialKey::Shift: modifiers_.shift = down; break;
        case SpecialKey::Ctrl: modifiers_.ctrl = down; break;
        case SpecialKey::Win: modifiers_.win = down; break;
        case SpecialKey::Alt: modifiers_.alt = down; break;
        default: break;
    }
}

void EditSession::handleKey(const input::KeyDown& event) {
    if (!focused_) {
        return;
    }
    TextArea& area = *focused_;

    std::optional<SpecialKey> key = resolveKey(event);
    if (modifiers_.ctrl && !key) {
        return;
    }
    if (event.code >= input::hostSpecialKeyBase && !key) {
        return;
    }
    if (key && input::isModifier(*key)) {
        setModifier(*key, true);
        repeat_.event.reset();
        return;
    }

    const bool shift = modifiers_.shift;

    std::optional<std::string> text;
    if (key) {
        switch (*key) {
            case SpecialKey::Paste: {
                std::string clip = clipboard_.get();
                if (clip.empty()) {
                    return;
                }
                text = std::move(clip);
                break;
            }
            case SpecialKey::Tab:
                text = "  ";
                break;
            case SpecialKey::Enter:
            case SpecialKey::NumEnter:
                if (shift || area.config().oneLine) {
                    key = SpecialKey::Go;
                } else {
                    text = "\n";
                }
                break;
            default:
                break;
        }
    } else if (!event.text.empty()) {
        text = event.text;
    } else if (event.code >= 0x20 && event.code != 0x7F) {
        text = encodeUtf8(shift ? event.code : toLowerCodepoint(event.code));
    }

    if (text) {
        area.insertText(*text);
        return;
    }
    if (!key) {
        return;
    }

    if (auto dir = input::directionOf(*key)) {
        area.moveCaret(*dir, shift || event.shift);
        return;
    }

    switch (*key) {
        case SpecialKey::SelectAll:
            area.selectAll();
            break;
        case SpecialKey::Esc:
            blur(BlurReason::Esc);
            break;
        case SpecialKey::Go:
            blur(BlurReason::Go);
            break;
        case SpecialKey::Backspace:
            area.backspace();
            break;
        case SpecialKey::Delete:
            area.deleteForward();
            break;
        case SpecialKey::Copy:
            area.copy(clipboard_);
            break;
        case SpecialKey::Cut:
            area.cut(clipboard_);
            break;
        case SpecialKey::Duplicate:
            area.duplicate();
            break;
        case SpecialKey::Undo:
            area.undo();
            break;
        case SpecialKey::Redo:
            area.redo();
            break;
        case SpecialKey::Paste:
        case SpecialKey::Tab:
        case SpecialKey::Enter:
        case SpecialKey::NumEnter:
        case SpecialKey::Home:
        case SpecialKey::End:
        case SpecialKey::Left:
        case SpecialKey::Up:
        case SpecialKey::Right:
        case SpecialKey::Down:
        case SpecialKey::PageUp:
        case SpecialKey::PageDown:
        case SpecialKey::Shift:
        case SpecialKey::Ctrl:
        case SpecialKey::Win:
        case SpecialKey::Alt:
            // Handled above
            break;
        case SpecialKey::Insert:
        case SpecialKey::PauseBreak:
        case SpecialKey::CapsLock:
        case SpecialKey::NumLock:
        case SpecialKey::ScrollLock:
        case SpecialKey::F1:
        case SpecialKey::F2:
        case SpecialKey::F3:
        case SpecialKey::F4:
        case SpecialKey::F5:
        case SpecialKey::F6:
        case SpecialKey::F7:
        case SpecialKey::F8:
        case SpecialKey::F9:
        case SpecialKey::F10:
        case SpecialKey::F11:
        case SpecialKey::F12:
        case SpecialKey::Menu:
            // No editing meaning
            break;
    }
}

// =============================================================================
// Pointer
// =============================================================================

bool EditSession::insideViewport(const TextArea& area, float x, float y) const {
    return x >= 0.0f && y >= 0.0f && x <= *area.config().width && y <= *area.config().height;
}

void EditSession::placeCaretAt(const PointerEvent& event) {
    TextArea& area = *focused_;
    const auto [cx, cy] = area.viewportToContent(event.x, event.y);
    area.setCaret(area.hitTest(cx, cy).value_or(area.caret()));
}

void EditSession::pointerDown(TextArea& area, const PointerEvent& event) {
    if (!area.hasViewport() || area.viewport().isAnimating()) {
        return;
    }
    if (!insideViewport(area, event.x, event.y)) {
        return;
    }
    if (focused_ != &area) {
        if (!area.config().edit && !area.config().scroll) {
            return;
        }
        focus(area);
    }

    blinkCounter_ = 0;
    if (!area.config().edit || event.button != 1 || event.isTouch) {
        pointer_ = {PointerMode::DragScroll, event.x, event.y};
        return;
    }

    pointer_.mode = PointerMode::Select;
    placeCaretAt(event);
    area.collapseSelection();
}

void EditSession::pointerMove(const PointerEvent& event) {
    if (!focused_ || pointer_.mode == PointerMode::Idle || focused_->viewport().isAnimating()) {
        return;
    }
    TextArea& area = *focused_;

    if (pointer_.mode == PointerMode::DragScroll) {
        const float dx = event.x - pointer_.lastX;
        const float dy = event.y - pointer_.lastY;
        pointer_.lastX = event.x;
        pointer_.lastY = event.y;
        area.scrollBy(-dx, -dy);
        return;
    }

    PointerEvent clamped = event;
    if (event.isTouch) {
        clamped.x = std::clamp(event.x, 0.0f, *area.config().width);
        clamped.y = std::clamp(event.y, 0.0f, *area.config().height);
    }

    const std::uint32_t anchor = area.selection().anchor;
    placeCaretAt(clamped);
    if (event.isTouch) {
        area.collapseSelection();
    } else {
        area.setSelection(anchor, area.caret());
    }
    blinkCounter_ = 0;
}

void EditSession::pointerUp(const PointerEvent& event) {
    if (!focused_ || pointer_.mode == PointerMode::Idle) {
        pointer_.mode = PointerMode::Idle;
        return;
    }

    if (pointer_.mode == PointerMode::Select) {
        pointerMove(event);
    } else if (event.isTouch && focused_->config().edit) {
        // A touch that did not start a selection acts as a tap
        pointer_.mode = PointerMode::Select;
        pointerMove(event);
    }

    if (focused_) {
        focused_->clearStickyX();
    }
    pointer_.mode = PointerMode::Idle;
}

// =============================================================================
// Frame
// =============================================================================

bool EditSession::isCaretVisible() const noexcept {
    if (!focused_ || !focused_->config().edit) {
        return false;
    }
    const std::uint32_t total = timing_.cursorShowTime + timing_.cursorHideTime;
    if (total == 0) {
        return true;
    }
    return blinkCounter_ % total < timing_.cursorShowTime;
}

bool EditSession::tickRepeat() {
    if (!focused_ || !repeat_.event) {
        repeat_.counter = 0;
        return false;
    }
    const std::uint32_t c = repeat_.counter + 1;
    const std::uint32_t d = timing_.repeatDelayFrames();
    const std::uint32_t s = timing_.repeatSpanFrames();
    repeat_.counter = c;
    if (c >= d && (c - d) % s == 0) {
        const input::KeyDown event = *repeat_.event;
        blinkCounter_ = 0;
        handleKey(event);
        return true;
    }
    return false;
}

bool EditSession::tickBlink() {
    const std::uint32_t total = timing_.cursorShowTime + timing_.cursorHideTime;
    blinkCounter_++;
    if (blinkCounter_ > total) {
        blinkCounter_ = 0;
    }
    return isCaretVisible();
}

FrameState EditSession::tick(std::uint32_t frames) {
    FrameState state;
    state.caretVisible = isCaretVisible();
    for (std::uint32_t i = 0; i < frames; ++i) {
        if (tickRepeat()) {
            state.keyRepeated = true;
        }
        state.caretVisible = tickBlink();
    }
    if (focused_) {
        state.animating = focused_->tickAnimation(frames);
    }
    return state;
}

void EditSession::scrollFocusedTo(float x, float y) {
    if (focused_) {
        focused_->scrollTo(x, y, timing_.animationFrames());
    }
}

} // namespace textarea
