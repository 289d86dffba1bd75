#pragma once

#include "textarea/types.h"
#include <cstdint>
#include <optional>
#include <string>

namespace textarea::input {

// Host key codes for special keys start here.
inline constexpr std::uint32_t hostSpecialKeyBase = 0x01000000;

enum class SpecialKey : std::uint8_t {
    Esc,
    Tab,
    Backspace,
    Enter,
    NumEnter,
    Insert,
    Delete,
    PauseBreak,
    Home,
    End,
    Left,
    Up,
    Right,
    Down,
    PageUp,
    PageDown,
    Shift,
    Ctrl,
    Win,
    Alt,
    CapsLock,
    NumLock,
    ScrollLock,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    Menu,
    Go,
    // Editing actions reached through Ctrl hotkeys
    SelectAll,
    Copy,
    Cut,
    Paste,
    Duplicate,
    Undo,
    Redo,
};

// Key-down event from the host.
struct KeyDown {
    std::uint32_t code = 0;                 // Host key code (character or special)
    std::optional<SpecialKey> special;      // Pre-resolved special key, if the host knows it
    std::string text;                       // Composed text, if any
    bool shift = false;                     // Shift held according to the host
};

// Key-up event from the host.
struct KeyUp {
    std::uint32_t code = 0;
    std::optional<SpecialKey> special;
};

/**
 * Map a host special-key code (hostSpecialKeyBase + n) to a SpecialKey.
 * @param swapCtrlWin Hosts that report Command as Win and Control as Ctrl the other way round
 */
std::optional<SpecialKey> specialKeyFromHostCode(std::uint32_t code, bool swapCtrlWin = false);

/**
 * Ctrl + letter action: A SelectAll, C Copy, X Cut, V Paste, D Duplicate, Z Undo, Y Redo.
 */
std::optional<SpecialKey> hotkeyFromCode(std::uint32_t code);

std::optional<Direction> directionOf(SpecialKey key);

bool isModifier(SpecialKey key);

const char* specialKeyName(SpecialKey key);

} // namespace textarea::input
