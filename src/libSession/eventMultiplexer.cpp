#include "session/eventMultiplexer.hpp"

#include "Logging.hpp"
#include "core/errors.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

namespace lookahead::session {

EventMultiplexer::EventMultiplexer(TerminalHandle& terminal) : m_terminal{terminal} {
	std::array<int, 2> fds{};
	if (::pipe2(fds.data(), O_CLOEXEC | O_NONBLOCK) != 0) {
		throw TerminalError(std::format("Cannot create wake-up pipe: {}", std::strerror(errno)));
	}
	m_wakeRead  = fds[0];
	m_wakeWrite = fds[1];
}

EventMultiplexer::~EventMultiplexer() {
	::close(m_wakeRead);
	::close(m_wakeWrite);
}

SessionEvent EventMultiplexer::waitNext() {
	while (true) {
		// Keys read before a reply was posted are handled before that reply.
		if (const auto key = m_decoder.next()) {
			return KeyEvent{.key = *key};
		}
		if (!m_replies.Empty() && !m_inputClosed && pollOnce(0)) {
			continue;
		}
		if (auto reply = m_replies.TryPop()) {
			return RenderReplyEvent{.reply = std::move(*reply)};
		}
		if (m_inputClosed) {
			return InputClosedEvent{};
		}

		pollOnce(-1);
	}
}

bool EventMultiplexer::pollOnce(int timeoutMs) {
	// Leaving this scope restores the terminal, also when an exception is thrown.
	RawModeGuard raw(m_terminal);

	std::array<pollfd, 2> fds{{
	        {.fd = m_terminal.inputFd(), .events = POLLIN, .revents = 0},
	        {.fd = m_wakeRead, .events = POLLIN, .revents = 0},
	}};
	if (::poll(fds.data(), fds.size(), timeoutMs) < 0) {
		if (errno == EINTR) {
			return false;
		}
		throw TerminalError(std::format("Waiting for input failed: {}", std::strerror(errno)));
	}

	if (fds[1].revents & POLLIN) {
		drainWakePipe();
	}
	if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
		m_inputClosed = !readInput();
		return true;
	}
	return false;
}

void EventMultiplexer::postReply(RenderReply reply) {
	m_replies.Push(std::move(reply));

	const char wake = 1;
	if (::write(m_wakeWrite, &wake, 1) < 0 && errno != EAGAIN) {
		// The reply stays queued and is picked up with the next keystroke.
		Logger().Log(Logging::LogLevel::Error, std::format("[Events] Cannot signal render reply: {}", std::strerror(errno)));
	}
}

bool EventMultiplexer::readInput() {
	std::array<char, 64> buffer{};
	const auto count = ::read(m_terminal.inputFd(), buffer.data(), buffer.size());
	if (count < 0) {
		if (errno == EINTR || errno == EAGAIN) {
			return true;
		}
		if (errno == EIO) {
			Logger().Log(Logging::LogLevel::Info, "[Events] Terminal hung up.");
			return false;
		}
		throw TerminalError(std::format("Reading from the terminal failed: {}", std::strerror(errno)));
	}
	if (count == 0) {
		Logger().Log(Logging::LogLevel::Info, "[Events] Terminal input closed.");
		return false;
	}

	m_decoder.feed(std::string_view(buffer.data(), static_cast<std::size_t>(count)));
	return true;
}

void EventMultiplexer::drainWakePipe() {
	std::array<char, 64> buffer{};
	while (::read(m_wakeRead, buffer.data(), buffer.size()) > 0) {
	}
}

} // namespace lookahead::session
