#ifndef TUI_KEYINPUT_HPP
#define TUI_KEYINPUT_HPP

#include <cstdint>

#include <notcurses/notcurses.h>

#include "sweep/Key.hpp"

// Maps a notcurses_get() result onto the toolkit-free KeyEvent the session understands.
KeyEvent TranslateInput(uint32_t input, const ncinput& details);

#endif // TUI_KEYINPUT_HPP
