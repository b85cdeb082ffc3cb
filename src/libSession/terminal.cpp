#include "session/terminal.hpp"

#include "Logging.hpp"
#include "core/errors.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>

namespace lookahead::session {

TerminalHandle::TerminalHandle(int inputFd, std::ostream& output) : m_inputFd{inputFd}, m_output{output} {
}

TerminalHandle::~TerminalHandle() {
	disableRawMode();
}

void TerminalHandle::enableRawMode() {
	if (m_savedMode) {
		return;
	}

	termios original{};
	if (::tcgetattr(m_inputFd, &original) != 0) {
		throw TerminalError(std::format("Cannot read terminal mode: {}", std::strerror(errno)));
	}

	termios raw = original;
	raw.c_iflag &= ~static_cast<tcflag_t>(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
	raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | IEXTEN | ISIG);
	raw.c_cflag |= CS8;
	raw.c_cc[VMIN]  = 1;
	raw.c_cc[VTIME] = 0;

	// TCSANOW keeps keys typed ahead of the wait.
	if (::tcsetattr(m_inputFd, TCSANOW, &raw) != 0) {
		throw TerminalError(std::format("Cannot enable raw mode: {}", std::strerror(errno)));
	}
	m_savedMode = original;
}

bool TerminalHandle::disableRawMode() {
	if (!m_savedMode) {
		return true;
	}

	const auto restored = ::tcsetattr(m_inputFd, TCSANOW, &*m_savedMode) == 0;
	if (!restored) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Terminal] Cannot restore terminal mode: {}", std::strerror(errno)));
	}
	m_savedMode.reset();
	return restored;
}

bool TerminalHandle::isRaw() const {
	return m_savedMode.has_value();
}

int TerminalHandle::inputFd() const {
	return m_inputFd;
}

std::ostream& TerminalHandle::output() {
	return m_output;
}

RawModeGuard::RawModeGuard(TerminalHandle& terminal) : m_terminal{terminal} {
	m_terminal.enableRawMode();
}

RawModeGuard::~RawModeGuard() {
	m_terminal.disableRawMode();
}

} // namespace lookahead::session
