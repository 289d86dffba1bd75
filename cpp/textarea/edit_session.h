#pragma once

#include "textarea/types.h"
#include "textarea/text_area.h"
#include "textarea/edit/clipboard.h"
#include "textarea/input/key_codes.h"
#include <cstdint>
#include <optional>
#include <string>

namespace textarea {

// Frame timing, in ticks of roughly 16 ms.
struct SessionTiming {
    std::uint32_t cursorShowTime = 30;
    std::uint32_t cursorHideTime = 30;
    std::uint32_t repeatDelay = 500;    // ms before a held key repeats
    std::uint32_t repeatSpan = 50;      // ms between repeats
    std::uint32_t aniTime = 250;        // ms for animated scrolls

    std::uint32_t repeatDelayFrames() const;
    std::uint32_t repeatSpanFrames() const;
    std::uint32_t animationFrames() const;
};

// Pointer event in the target area's viewport coordinates.
struct PointerEvent {
    float x = 0.0f;
    float y = 0.0f;
    bool isTouch = false;
    std::uint8_t button = 1;            // 1 = primary
};

enum class PointerMode : std::uint8_t {
    Idle = 0,
    Select = 1,         // Primary mouse drag: caret and selection follow
    DragScroll = 2,     // Touch, secondary button or read-only area: content follows
};

// Result of one tick.
struct FrameState {
    bool caretVisible = false;
    bool keyRepeated = false;
    bool animating = false;
};

/**
 * EditSession: the input context that routes keys, pointer gestures and ticks
 * to the single focused TextArea.
 *
 * Focus changes are strictly blur-then-focus. A focus session ends with
 * onEditingFinished (on the area) when its text differs from the text at
 * focus time. Areas must outlive their focus session; blur before destroying
 * a focused area.
 */
class EditSession {
public:
    explicit EditSession(SessionTiming timing = {});

    // =========================================================================
    // Focus
    // =========================================================================

    /**
     * Focus an area, blurring the previous one with BlurReason::Switch.
     * @throws ConfigurationError if the area has no width or height
     */
    void focus(TextArea& area);

    /**
     * End the focus session. No-op without a focused area.
     */
    void blur(BlurReason reason);

    TextArea* focused() const noexcept { return focused_; }
    bool isFocused(const TextArea& area) const noexcept { return focused_ == &area; }

    // =========================================================================
    // Input
    // =========================================================================

    void keyDown(const input::KeyDown& event);
    void keyUp(const input::KeyUp& event);

    /**
     * Press on an area. Focuses it first when it is editable or scrollable.
     */
    void pointerDown(TextArea& area, const PointerEvent& event);
    void pointerMove(const PointerEvent& event);
    void pointerUp(const PointerEvent& event);

    // =========================================================================
    // Frame
    // =========================================================================

    /**
     * Advance key repeat, caret blink and scroll animation by `frames` ticks.
     */
    FrameState tick(std::uint32_t frames = 1);

    /**
     * Animated scroll of the focused area over SessionTiming::aniTime.
     */
    void scrollFocusedTo(float x, float y);

    // =========================================================================
    // State
    // =========================================================================

    struct Modifiers {
        bool shift = false;
        bool ctrl = false;
        bool win = false;
        bool alt = false;
    };

    const Modifiers& modifiers() const noexcept { return modifiers_; }
    PointerMode pointerMode() const noexcept { return pointer_.mode; }
    bool isCaretVisible() const noexcept;
    bool isKeyRepeating() const noexcept { return repeat_.event.has_value(); }

    edit::Clipboard& clipboard() noexcept { return clipboard_; }
    const SessionTiming& timing() const noexcept { return timing_; }
    void setTiming(const SessionTiming& timing) { timing_ = timing; }

    // Hosts where Command reports as Win swap the two modifiers
    void setSwapCtrlWin(bool swap) { swapCtrlWin_ = swap; }

private:
    struct RepeatState {
        std::optional<input::KeyDown> event;
        std::uint32_t counter = 0;
    };

    struct PointerState {
        PointerMode mode = PointerMode::Idle;
        float lastX = 0.0f;
        float lastY = 0.0f;
    };

    std::optional<input::SpecialKey> resolveKey(const input::KeyDown& event) const;
    void handleKey(const input::KeyDown& event);
    void setModifier(input::SpecialKey key, bool down);
    void placeCaretAt(const PointerEvent& event);
    bool insideViewport(const TextArea& area, float x, float y) const;
    bool tickRepeat();
    bool tickBlink();

    SessionTiming timing_;
    edit::Clipboard clipboard_;
    bool swapCtrlWin_ = false;

    TextArea* focused_ = nullptr;
    std::string originalText_;

    Modifiers modifiers_;
    RepeatState repeat_;
    PointerState pointer_;
    std::uint32_t blinkCounter_ = 0;
};

} // namespace textarea
