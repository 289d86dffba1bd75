#include "textarea/edit/history_manager.h"
#include <algorithm>

namespace textarea::edit {

HistoryManager::HistoryManager(std::size_t capacity) : capacity_(capacity) {}

void HistoryManager::reset(std::string text) {
    entries_.clear();
    cursor_ = 0;
    if (capacity_ == 0) {
        return;
    }
    entries_.push_back(TextSnapshot{std::move(text), std::nullopt});
}

void HistoryManager::recordEdit(std::string newText, std::uint32_t caretBefore) {
    if (capacity_ == 0) {
        return;
    }

    if (!entries_.empty()) {
        // Discard redo branch
        entries_.resize(cursor_ + 1);
        entries_[cursor_].caret = caretBefore;
        if (entries_.size() >= capacity_) {
            entries_.erase(entries_.begin());
        }
    }

    entries_.push_back(TextSnapshot{std::move(newText), std::nullopt});
    cursor_ = entries_.size() - 1;
}

std::optional<TextSnapshot> HistoryManager::navigate(int delta, std::uint32_t liveCaret) {
    if (entries_.empty()) {
        return std::nullopt;
    }

    const long long last = static_cast<long long>(entries_.size()) - 1;
    const long long target = std::clamp(static_cast<long long>(cursor_) + delta, 0LL, last);
    const std::size_t level = static_cast<std::size_t>(target);
    if (level == cursor_) {
        return std::nullopt;
    }

    if (level < cursor_ && cursor_ == entries_.size() - 1) {
        entries_[cursor_].caret = liveCaret;
    }
    cursor_ = level;
    return entries_[cursor_];
}

bool HistoryManager::canUndo() const noexcept {
    return !entries_.empty() && cursor_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return !entries_.empty() && cursor_ + 1 < entries_.size();
}

void HistoryManager::setCapacity(std::size_t capacity) {
    capacity_ = capacity;
    if (capacity_ == 0) {
        entries_.clear();
        cursor_ = 0;
        return;
    }
    while (entries_.size() > capacity_) {
        entries_.erase(entries_.begin());
        if (cursor_ > 0) {
            cursor_--;
        }
    }
}

} // namespace textarea::edit
