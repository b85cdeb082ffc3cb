#pragma once

#include <termios.h>

#include <optional>
#include <ostream>

namespace lookahead::session {

//! Exclusively owned handle to the interactive terminal: the input descriptor and the output stream.
//! The terminal is left in its original mode except while a RawModeGuard is alive.
class TerminalHandle {
public:
	TerminalHandle(int inputFd, std::ostream& output);
	~TerminalHandle(); //!< Restores the original mode if raw mode is still active.

	TerminalHandle(const TerminalHandle&)            = delete;
	TerminalHandle& operator=(const TerminalHandle&) = delete;

	//! Unbuffered, un-echoed input. Throws TerminalError if the input is not a terminal.
	void enableRawMode();
	//! Restore the mode saved by enableRawMode. Returns false if the terminal refused.
	bool disableRawMode();

	bool isRaw() const;
	int inputFd() const;
	std::ostream& output();

private:
	int m_inputFd;
	std::ostream& m_output;
	std::optional<termios> m_savedMode; //!< Set while raw mode is active.
};

//! Raw mode for the lifetime of the guard.
class RawModeGuard {
public:
	explicit RawModeGuard(TerminalHandle& terminal);
	~RawModeGuard();

	RawModeGuard(const RawModeGuard&)            = delete;
	RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
	TerminalHandle& m_terminal;
};

} // namespace lookahead::session
