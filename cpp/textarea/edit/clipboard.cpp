#include "textarea/edit/clipboard.h"
#include "textarea/core/logging.h"
#include <exception>

namespace textarea::edit {

std::string Clipboard::get() const {
    if (host_) {
        try {
            std::optional<std::string> text = host_->getText();
            if (text) {
                return *text;
            }
        } catch (const std::exception& e) {
            TEXTAREA_LOG_WARN("clipboard read failed: %s", e.what());
        }
    }
    return buffer_;
}

void Clipboard::set(const std::string& text) {
    buffer_ = text;
    if (!host_) {
        return;
    }
    try {
        host_->setText(text);
    } catch (const std::exception& e) {
        TEXTAREA_LOG_WARN("clipboard write failed: %s", e.what());
    }
}

} // namespace textarea::edit
