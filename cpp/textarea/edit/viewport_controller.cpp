#include "textarea/edit/viewport_controller.h"
#include <algorithm>

namespace textarea::edit {

namespace {

SliderGeometry thumb(float viewport, float content, float anchor, float range) {
    SliderGeometry slider;
    if (range <= 1.0f || content <= 0.0f) {
        return slider;
    }
    const float length = viewport * viewport / content;
    slider.rect.x = (viewport - length) * anchor / range;
    slider.rect.width = length;
    slider.visible = true;
    return slider;
}

} // namespace

void ViewportController::setViewport(float width, float height) {
    viewportWidth_ = width;
    viewportHeight_ = height;
    clampAnchor();
}

void ViewportController::setContent(float width, float height) {
    contentWidth_ = width;
    contentHeight_ = height;
    clampAnchor();
}

void ViewportController::setVerticalAlign(float valign) {
    valign_ = std::clamp(valign, 0.0f, 1.0f);
}

float ViewportController::scrollWidth() const noexcept {
    return std::max(contentWidth_ - viewportWidth_ - scrollRangeEpsilon, 0.0f);
}

float ViewportController::scrollHeight() const noexcept {
    return std::max(contentHeight_ - viewportHeight_ - scrollRangeEpsilon, 0.0f);
}

float ViewportController::alignOffsetY() const noexcept {
    if (valign_ == 0.0f || scrollHeight() != 0.0f) {
        return 0.0f;
    }
    return valign_ * (contentHeight_ - viewportHeight_);
}

void ViewportController::clampAnchor() {
    anchorX_ = std::clamp(anchorX_, 0.0f, scrollWidth());
    anchorY_ = std::clamp(anchorY_, 0.0f, scrollHeight());
}

void ViewportController::setAnchor(float x, float y) {
    animation_.active = false;
    anchorX_ = x;
    anchorY_ = y;
    clampAnchor();
}

void ViewportController::scrollBy(float dx, float dy) {
    setAnchor(anchorX_ + dx, anchorY_ + dy);
}

void ViewportController::scrollToCaret(float caretX, float rowTop, float lineHeight, float caretWidth) {
    float x = anchorX_;
    const float x1 = std::min(anchorX_ + viewportWidth_, contentWidth_);
    if (caretX < anchorX_) {
        x = caretX;
    } else if (caretX > x1) {
        x = caretX - viewportWidth_ + caretWidth;
    }

    float y = anchorY_;
    const float y1 = std::min(anchorY_ + viewportHeight_, contentHeight_) - lineHeight;
    if (rowTop < anchorY_) {
        y = rowTop;
    } else if (rowTop > y1) {
        y = rowTop - viewportHeight_ + lineHeight;
    }

    setAnchor(x, y);
}

SliderGeometry ViewportController::horizontalSlider(float thickness) const {
    SliderGeometry slider = thumb(viewportWidth_, contentWidth_, anchorX_, scrollWidth());
    if (slider.visible) {
        slider.rect.y = viewportHeight_ - thickness;
        slider.rect.height = thickness;
    }
    return slider;
}

SliderGeometry ViewportController::verticalSlider(float thickness) const {
    SliderGeometry along = thumb(viewportHeight_, contentHeight_, anchorY_, scrollHeight());
    SliderGeometry slider;
    if (along.visible) {
        slider.visible = true;
        slider.rect.x = viewportWidth_ - thickness;
        slider.rect.y = along.rect.x;
        slider.rect.width = thickness;
        slider.rect.height = along.rect.width;
    }
    return slider;
}

void ViewportController::animateTo(float x, float y, std::uint32_t frames) {
    if (frames == 0) {
        setAnchor(x, y);
        return;
    }
    animation_.active = true;
    animation_.fromX = anchorX_;
    animation_.fromY = anchorY_;
    animation_.toX = std::clamp(x, 0.0f, scrollWidth());
    animation_.toY = std::clamp(y, 0.0f, scrollHeight());
    animation_.elapsed = 0;
    animation_.total = frames;
}

bool ViewportController::tick(std::uint32_t frames) {
    if (!animation_.active) {
        return false;
    }
    animation_.elapsed = std::min(animation_.elapsed + frames, animation_.total);
    if (animation_.elapsed >= animation_.total) {
        anchorX_ = animation_.toX;
        anchorY_ = animation_.toY;
        animation_.active = false;
    } else {
        const float t = static_cast<float>(animation_.elapsed) / static_cast<float>(animation_.total);
        anchorX_ = animation_.fromX + (animation_.toX - animation_.fromX) * t;
        anchorY_ = animation_.fromY + (animation_.toY - animation_.fromY) * t;
    }
    clampAnchor();
    return animation_.active;
}

} // namespace textarea::edit
