#pragma once

#include "core/IRenderOracle.hpp"
#include "session/keys.hpp"
#include "session/sessionEvent.hpp"
#include "session/terminalRenderer.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lookahead::gtest {

//! Render oracle that records requests and completes them when the test says so.
class FakeRenderOracle : public IRenderOracle {
public:
	struct Request {
		RenderTicket ticket;
		std::string board;
		RenderCallback callback;
	};

	void requestRender(const RenderTicket& ticket, const std::string& board, RenderCallback callback) override;

	void complete(std::size_t index, const std::string& text); //!< Reply to request index with text.
	void fail(std::size_t index, const std::string& error);    //!< Reply to request index with a failure.

	const std::vector<Request>& requests() const;

private:
	std::vector<Request> m_requests;
};

//! Event source playing a script. Posted replies are returned before the next scripted entry.
//! An exhausted script reports closed input.
class FakeEventSource : public session::IEventSource {
public:
	using Action = std::function<void()>;

	FakeEventSource& type(std::string_view characters);
	FakeEventSource& press(session::KeyCode code);
	FakeEventSource& reply(RenderReply reply);
	FakeEventSource& then(Action action); //!< Run action when the script reaches it.

	session::SessionEvent waitNext() override;
	void postReply(RenderReply reply) override;

	std::size_t remaining() const;

private:
	std::deque<std::variant<session::SessionEvent, Action>> m_script;
	std::deque<RenderReply> m_posted;
};

//! Interprets the escape sequences written by TerminalRenderer.
class VirtualScreen {
public:
	explicit VirtualScreen(std::ostringstream& out);

	std::string row(session::Line line);  //!< Visible text of a row without trailing blanks.
	session::Line cursorLine();
	unsigned cursorColumn();
	std::size_t bytesWritten();

private:
	void sync(); //!< Interpret everything written since the last call.
	void put(char c);

private:
	std::ostringstream& m_out;
	std::size_t m_consumed{};

	std::map<session::Line, std::string> m_rows;
	session::Line m_line{1u};
	unsigned m_column{1u};
	session::Line m_savedLine{1u};
	unsigned m_savedColumn{1u};
};

} // namespace lookahead::gtest
