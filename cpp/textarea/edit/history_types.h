#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace textarea::edit {

// A single entry in the undo/redo list
struct TextSnapshot {
    std::string text;
    // Caret to restore at this level; resolved when the level is left
    std::optional<std::uint32_t> caret;
};

} // namespace textarea::edit
