#include "session/keys.hpp"

namespace lookahead::session {

static constexpr char CTRL_C   = 0x03;
static constexpr char CTRL_D   = 0x04;
static constexpr char CTRL_H   = 0x08;
static constexpr char ESCAPE   = 0x1b;
static constexpr char DELETE   = 0x7f;
static constexpr char ENTER_CR = '\r';
static constexpr char ENTER_LF = '\n';

void KeyDecoder::feed(std::string_view bytes) {
	m_pending.insert(m_pending.end(), bytes.begin(), bytes.end());
}

std::optional<Key> KeyDecoder::next() {
	while (!m_pending.empty()) {
		const char byte = m_pending.front();
		m_pending.pop_front();

		if (!skipEscapeByte(byte)) {
			return decode(byte);
		}
	}
	return std::nullopt;
}

Key KeyDecoder::decode(char byte) {
	switch (byte) {
	case QUIT_KEY:
	case CTRL_C:
	case CTRL_D:
		return Key{.code = KeyCode::Quit};
	case ENTER_CR:
	case ENTER_LF:
		return Key{.code = KeyCode::Enter};
	case DELETE:
	case CTRL_H:
		return Key{.code = KeyCode::Backspace};
	case ESCAPE:
		m_escape = EscapeState::Introduced;
		return Key{.code = KeyCode::Ignored};
	default:
		break;
	}

	if (byte >= 0x20 && byte < DELETE) {
		return Key{.code = KeyCode::Character, .character = byte};
	}
	return Key{.code = KeyCode::Ignored};
}

bool KeyDecoder::skipEscapeByte(char byte) {
	switch (m_escape) {
	case EscapeState::None:
		return false;
	case EscapeState::Introduced:
		// CSI ("ESC [") and SS3 ("ESC O") sequences end with a byte in 0x40..0x7e.
		if (byte == '[' || byte == 'O') {
			m_escape = EscapeState::Sequence;
			return true;
		}
		m_escape = EscapeState::None;
		return false;
	case EscapeState::Sequence:
		if (byte >= 0x40 && byte <= 0x7e) {
			m_escape = EscapeState::None;
		}
		return true;
	}
	return false;
}

} // namespace lookahead::session
