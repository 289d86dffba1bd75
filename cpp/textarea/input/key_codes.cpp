#include "textarea/input/key_codes.h"

namespace textarea::input {

std::optional<SpecialKey> specialKeyFromHostCode(std::uint32_t code, bool swapCtrlWin) {
    if (code < hostSpecialKeyBase) {
        return std::nullopt;
    }
    switch (code - hostSpecialKeyBase) {
        case 0: return SpecialKey::Esc;
        case 1: return SpecialKey::Tab;
        case 3: return SpecialKey::Backspace;
        case 4: return SpecialKey::Enter;
        case 5: return SpecialKey::NumEnter;
        case 6: return SpecialKey::Insert;
        case 7: return SpecialKey::Delete;
        case 8: return SpecialKey::PauseBreak;
        case 16: return SpecialKey::Home;
        case 17: return SpecialKey::End;
        case 18: return SpecialKey::Left;
        case 19: return SpecialKey::Up;
        case 20: return SpecialKey::Right;
        case 21: return SpecialKey::Down;
        case 22: return SpecialKey::PageUp;
        case 23: return SpecialKey::PageDown;
        case 32: return SpecialKey::Shift;
        case 33: return swapCtrlWin ? SpecialKey::Win : SpecialKey::Ctrl;
        case 34: return swapCtrlWin ? SpecialKey::Ctrl : SpecialKey::Win;
        case 35: return SpecialKey::Alt;
        case 36: return SpecialKey::CapsLock;
        case 37: return SpecialKey::NumLock;
        case 38: return SpecialKey::ScrollLock;
        case 48: return SpecialKey::F1;
        case 49: return SpecialKey::F2;
        case 50: return SpecialKey::F3;
        case 51: return SpecialKey::F4;
        case 52: return SpecialKey::F5;
        case 53: return SpecialKey::F6;
        case 54: return SpecialKey::F7;
        case 55: return SpecialKey::F8;
        case 56: return SpecialKey::F9;
        case 57: return SpecialKey::F10;
        case 58: return SpecialKey::F11;
        case 59: return SpecialKey::F12;
        case 85: return SpecialKey::Menu;
        default: return std::nullopt;
    }
}

std::optional<SpecialKey> hotkeyFromCode(std::uint32_t code) {
    switch (code) {
        case 'A': case 'a': return SpecialKey::SelectAll;
        case 'C': case 'c': return SpecialKey::Copy;
        case 'X': case 'x': return SpecialKey::Cut;
        case 'V': case 'v': return SpecialKey::Paste;
        case 'D': case 'd': return SpecialKey::Duplicate;
        case 'Z': case 'z': return SpecialKey::Undo;
        case 'Y': case 'y': return SpecialKey::Redo;
        default: return std::nullopt;
    }
}

std::optional<Direction> directionOf(SpecialKey key) {
    switch (key) {
        case SpecialKey::Left: return Direction::Left;
        case SpecialKey::Right: return Direction::Right;
        case SpecialKey::Up: return Direction::Up;
        case SpecialKey::Down: return Direction::Down;
        case SpecialKey::Home: return Direction::Home;
        case SpecialKey::End: return Direction::End;
        case SpecialKey::PageUp: return Direction::PageUp;
        case SpecialKey::PageDown: return Direction::PageDown;
        default: return std::nullopt;
    }
}

bool isModifier(SpecialKey key) {
    return key == SpecialKey::Shift || key == SpecialKey::Ctrl
        || key == SpecialKey::Win || key == SpecialKey::Alt;
}

const char* specialKeyName(SpecialKey key) {
    switch (key) {
        case SpecialKey::Esc: return "Esc";
        case SpecialKey::Tab: return "Tab";
        case SpecialKey::Backspace: return "BS";
        case SpecialKey::Enter: return "Enter";
        case SpecialKey::NumEnter: return "NumEnter";
        case SpecialKey::Insert: return "Insert";
        case SpecialKey::Delete: return "Delete";
        case SpecialKey::PauseBreak: return "PauseBreak";
        case SpecialKey::Home: return "Home";
        case SpecialKey::End: return "End";
        case SpecialKey::Left: return "Left";
        case SpecialKey::Up: return "Up";
        case SpecialKey::Right: return "Right";
        case SpecialKey::Down: return "Down";
        case SpecialKey::PageUp: return "PageUp";
        case SpecialKey::PageDown: return "PageDn";
        case SpecialKey::Shift: return "Shift";
        case SpecialKey::Ctrl: return "Ctrl";
        case SpecialKey::Win: return "Win";
        case SpecialKey::Alt: return "Alt";
        case SpecialKey::CapsLock: return "CapsLock";
        case SpecialKey::NumLock: return "NumLock";
        case SpecialKey::ScrollLock: return "ScrollLock";
        case SpecialKey::F1: return "F1";
        case SpecialKey::F2: return "F2";
        case SpecialKey::F3: return "F3";
        case SpecialKey::F4: return "F4";
        case SpecialKey::F5: return "F5";
        case SpecialKey::F6: return "F6";
        case SpecialKey::F7: return "F7";
        case SpecialKey::F8: return "F8";
        case SpecialKey::F9: return "F9";
        case SpecialKey::F10: return "F10";
        case SpecialKey::F11: return "F11";
        case SpecialKey::F12: return "F12";
        case SpecialKey::Menu: return "Menu";
        case SpecialKey::Go: return "Go";
        case SpecialKey::SelectAll: return "All";
        case SpecialKey::Copy: return "Copy";
        case SpecialKey::Cut: return "Cut";
        case SpecialKey::Paste: return "Paste";
        case SpecialKey::Duplicate: return "Dup";
        case SpecialKey::Undo: return "Undo";
        case SpecialKey::Redo: return "Redo";
    }
    return "Unknown";
}

} // namespace textarea::input
