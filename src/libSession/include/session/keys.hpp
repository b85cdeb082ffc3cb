#pragma once

#include <deque>
#include <optional>
#include <string_view>

namespace lookahead::session {

inline constexpr char QUIT_KEY = 'q';

enum class KeyCode {
	Character, //!< Printable character, see Key::character.
	Backspace,
	Enter,
	Quit,    //!< Quit key, Ctrl-C or Ctrl-D.
	Ignored, //!< Anything else, including escape sequences such as arrow keys.
};

struct Key {
	KeyCode code{KeyCode::Ignored};
	char character{}; //!< Only set for KeyCode::Character.
};

//! Turns raw terminal input bytes into keys. Bytes of one read may hold several keys.
class KeyDecoder {
public:
	void feed(std::string_view bytes);
	std::optional<Key> next(); //!< Next complete key, if any.

private:
	enum class EscapeState {
		None,
		Introduced, //!< ESC seen.
		Sequence,   //!< Inside a CSI or SS3 sequence, waiting for its final byte.
	};

	Key decode(char byte);
	bool skipEscapeByte(char byte); //!< True if byte belongs to an escape sequence.

private:
	std::deque<char> m_pending;
	EscapeState m_escape{EscapeState::None}; //!< Kept across feed() calls, a sequence may span reads.
};

} // namespace lookahead::session
