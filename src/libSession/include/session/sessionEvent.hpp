#pragma once

#include "core/IRenderOracle.hpp"
#include "session/keys.hpp"

#include <variant>

namespace lookahead::session {

struct KeyEvent {
	Key key;
};
struct RenderReplyEvent {
	RenderReply reply;
};
struct InputClosedEvent {};

using SessionEvent = std::variant<KeyEvent, RenderReplyEvent, InputClosedEvent>;

//! The two event sources of a session: keystrokes and render replies.
class IEventSource {
public:
	virtual ~IEventSource() = default;

	//! Blocks until a keystroke or a render reply is available and returns whichever came first.
	virtual SessionEvent waitNext() = 0;
	//! Hand over a render reply. Thread safe.
	virtual void postReply(RenderReply reply) = 0;
};

} // namespace lookahead::session
