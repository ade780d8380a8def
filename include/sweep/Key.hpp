#ifndef SWEEP_KEY_HPP
#define SWEEP_KEY_HPP

#include <cstdint>

// Toolkit-independent key event. The TUI layer translates raw notcurses input
// into these so the session and popup logic can run without a terminal.
enum class KeyCode {
    Char,
    Enter,
    Esc,
    Backspace,
    Tab,
    Up,
    Down,
    Left,
    Right,
    PageUp,
    PageDown,
    Other
};

struct KeyEvent {
    KeyCode code = KeyCode::Other;
    char32_t ch = 0; // only meaningful when code == KeyCode::Char

    static KeyEvent Of(KeyCode code) { return KeyEvent{code, 0}; }
    static KeyEvent Character(char32_t ch) { return KeyEvent{KeyCode::Char, ch}; }

    bool IsChar(char32_t expected) const { return code == KeyCode::Char && ch == expected; }
};

#endif // SWEEP_KEY_HPP
