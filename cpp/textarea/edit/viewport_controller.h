#pragma once

#include "textarea/types.h"
#include <cstdint>

namespace textarea::edit {

// Scrollbar thumb in viewport coordinates; zero-sized when hidden.
struct SliderGeometry {
    Rect rect;
    bool visible = false;
};

/**
 * ViewportController: scroll anchor of a fixed-size window over laid-out content.
 *
 * The anchor is the scroll offset, clamped into [0, scrollWidth] x
 * [0, scrollHeight]. When content fits vertically, valign adds a static
 * offset instead of scrolling. origin() is the content point shown at the
 * viewport's top-left corner.
 */
class ViewportController {
public:
    void setViewport(float width, float height);
    void setContent(float width, float height);
    void setVerticalAlign(float valign);

    float viewportWidth() const noexcept { return viewportWidth_; }
    float viewportHeight() const noexcept { return viewportHeight_; }
    float contentWidth() const noexcept { return contentWidth_; }
    float contentHeight() const noexcept { return contentHeight_; }

    float scrollWidth() const noexcept;
    float scrollHeight() const noexcept;

    float anchorX() const noexcept { return anchorX_; }
    float anchorY() const noexcept { return anchorY_; }

    /**
     * Static vertical offset applied when the content needs no vertical scroll.
     */
    float alignOffsetY() const noexcept;

    float originX() const noexcept { return anchorX_; }
    float originY() const noexcept { return anchorY_ + alignOffsetY(); }

    /**
     * Set the anchor (clamped). Cancels any animation.
     */
    void setAnchor(float x, float y);

    /**
     * Shift the anchor by (dx, dy), clamped.
     */
    void scrollBy(float dx, float dy);

    /**
     * Minimal scroll that brings the caret into view.
     * @param caretX Caret x in content space
     * @param rowTop Top of the caret row in content space
     * @param lineHeight Row height
     * @param caretWidth Margin kept at the right edge
     */
    void scrollToCaret(float caretX, float rowTop, float lineHeight, float caretWidth);

    SliderGeometry horizontalSlider(float thickness) const;
    SliderGeometry verticalSlider(float thickness) const;

    // =========================================================================
    // Animation
    // =========================================================================

    /**
     * Interpolate the anchor linearly to (x, y) over `frames` ticks.
     * frames == 0 jumps immediately.
     */
    void animateTo(float x, float y, std::uint32_t frames);

    /**
     * Advance the animation.
     * @return True while an animation is still in flight
     */
    bool tick(std::uint32_t frames);

    bool isAnimating() const noexcept { return animation_.active; }

private:
    struct Animation {
        bool active = false;
        float fromX = 0.0f;
        float fromY = 0.0f;
        float toX = 0.0f;
        float toY = 0.0f;
        std::uint32_t elapsed = 0;
        std::uint32_t total = 0;
    };

    void clampAnchor();

    float viewportWidth_ = 0.0f;
    float viewportHeight_ = 0.0f;
    float contentWidth_ = 0.0f;
    float contentHeight_ = 0.0f;
    float valign_ = 0.0f;
    float anchorX_ = 0.0f;
    float anchorY_ = 0.0f;
    Animation animation_;
};

} // namespace textarea::edit
