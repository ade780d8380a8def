#include "tui/KeyInput.hpp"

KeyEvent TranslateInput(uint32_t input, const ncinput& details) {
    (void)details;
    switch (input) {
    case NCKEY_ENTER:
    case '\n':
    case '\r':
        return KeyEvent::Of(KeyCode::Enter);
    case NCKEY_ESC:
        return KeyEvent::Of(KeyCode::Esc);
    case NCKEY_BACKSPACE:
    case 0x7f:
    case 0x08:
        return KeyEvent::Of(KeyCode::Backspace);
    case NCKEY_TAB:
        return KeyEvent::Of(KeyCode::Tab);
    case NCKEY_UP:
        return KeyEvent::Of(KeyCode::Up);
    case NCKEY_DOWN:
        return KeyEvent::Of(KeyCode::Down);
    case NCKEY_LEFT:
        return KeyEvent::Of(KeyCode::Left);
    case NCKEY_RIGHT:
        return KeyEvent::Of(KeyCode::Right);
    case NCKEY_PGUP:
        return KeyEvent::Of(KeyCode::PageUp);
    case NCKEY_PGDOWN:
        return KeyEvent::Of(KeyCode::PageDown);
    default:
        break;
    }

    // Synthesized keys (function keys, mouse) live in the private-use planes.
    if (nckey_synthesized_p(input) || input < 0x20) {
        return KeyEvent::Of(KeyCode::Other);
    }
    return KeyEvent::Character(static_cast<char32_t>(input));
}
