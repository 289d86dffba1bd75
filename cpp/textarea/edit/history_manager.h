#pragma once

#include "textarea/edit/history_types.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace textarea::edit {

/**
 * HistoryManager: bounded list of text snapshots with an active level.
 *
 * Recording an edit discards the redo branch, evicts the oldest snapshot at
 * capacity and stores the caret that preceded the edit in the level being
 * left. A capacity of 0 disables recording and navigation.
 */
class HistoryManager {
public:
    explicit HistoryManager(std::size_t capacity);

    /**
     * Drop all levels and start over from a single snapshot of `text`.
     */
    void reset(std::string text);

    /**
     * Record a text-changing edit.
     * @param newText Text after the edit
     * @param caretBefore Caret position before the edit
     */
    void recordEdit(std::string newText, std::uint32_t caretBefore);

    /**
     * Move the active level by delta (clamped).
     * @param liveCaret Current caret, stored first when leaving the newest level backwards
     * @return Snapshot to restore, or nullopt when the level did not change
     */
    std::optional<TextSnapshot> navigate(int delta, std::uint32_t liveCaret);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    std::size_t capacity() const noexcept { return capacity_; }

    /**
     * Change capacity, evicting the oldest levels that no longer fit.
     */
    void setCapacity(std::size_t capacity);

    std::size_t getHistorySize() const noexcept { return entries_.size(); }
    std::size_t getCursor() const noexcept { return cursor_; }
    const TextSnapshot& entry(std::size_t level) const { return entries_.at(level); }

private:
    std::size_t capacity_;
    std::vector<TextSnapshot> entries_;
    std::size_t cursor_ = 0;
};

} // namespace textarea::edit
