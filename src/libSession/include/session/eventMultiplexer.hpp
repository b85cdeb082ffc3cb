#pragma once

#include "core/SafeQueue.hpp"
#include "session/keys.hpp"
#include "session/sessionEvent.hpp"
#include "session/terminal.hpp"

namespace lookahead::session {

//! Waits on the terminal input and on posted render replies at the same time.
//! Raw mode is active only while blocked in waitNext.
class EventMultiplexer : public IEventSource {
public:
	explicit EventMultiplexer(TerminalHandle& terminal);
	~EventMultiplexer() override;

	EventMultiplexer(const EventMultiplexer&)            = delete;
	EventMultiplexer& operator=(const EventMultiplexer&) = delete;

	SessionEvent waitNext() override;
	void postReply(RenderReply reply) override;

private:
	bool pollOnce(int timeoutMs); //!< Wait up to timeoutMs in raw mode. True if terminal input was consumed.
	bool readInput();             //!< Feed available input bytes to the decoder. False once the input is closed.
	void drainWakePipe();

private:
	TerminalHandle& m_terminal;
	KeyDecoder m_decoder;
	bool m_inputClosed{false};

	SafeQueue<RenderReply> m_replies; //!< Replies posted by oracle threads.
	int m_wakeRead{-1};               //!< Self-pipe: readable whenever a reply was posted.
	int m_wakeWrite{-1};
};

} // namespace lookahead::session
