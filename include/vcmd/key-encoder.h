#pragma once

#include <vcmd/base/event.h>
#include <cstdint>
#include <string>

namespace vcmd {

//=============================================================================
// Keyboard to pty bytes (xterm conventions)
//
//   Enter CR, Tab HT, Shift+Tab CSI Z, Backspace DEL (Alt: ESC DEL),
//   arrows CSI A/B/C/D, Home CSI H, End CSI F, PgUp CSI 5~, PgDn CSI 6~,
//   Delete CSI 3~, Ctrl+letter 0x01..0x1a, Alt+key ESC prefix.
//=============================================================================

// Bytes for a KeyDown; "" if the key has no encoding
std::string encodeKey(base::Key key, int mods, uint32_t codepoint = 0);

// Bytes for a text run; "" if it looks like a split mouse/escape sequence
std::string encodeText(const std::string& text, int mods);

// "65;83;57M", "<0;45;12m": tail of an SGR mouse report
bool looksLikeMouseSequence(const std::string& text);

// "[", "<", "[<", "[12;3": head of a split CSI
bool looksLikeEscapeFragment(const std::string& text);

// Ctrl+C, Ctrl+Y and a bare "y" act as copy while a selection exists
bool isCopyKey(const base::Event& event);

// Ctrl+V pastes from the clipboard
bool isPasteKey(const base::Event& event);

} // namespace vcmd
