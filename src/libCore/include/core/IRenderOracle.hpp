#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace lookahead {

//! Identifies one render request. The serial is unique per requesting coordinator.
struct RenderTicket {
	std::uint64_t serial{};
	std::string requestedFor; //!< Typed prefix at the time the request was issued.
};

struct RenderReply {
	RenderTicket ticket;
	std::optional<std::string> text; //!< Rendered board. Empty if the request failed.
	std::string error{};             //!< Failure description if text is empty.
};

using RenderCallback = std::function<void(RenderReply)>;

//! Asynchronous board rendering.
//! Replies of overlapping requests may arrive in any order and on any thread.
class IRenderOracle {
public:
	virtual ~IRenderOracle() = default;

	//! Start rendering the board. The callback is invoked exactly once, unless the oracle is destroyed first.
	virtual void requestRender(const RenderTicket& ticket, const std::string& board, RenderCallback callback) = 0;
};

} // namespace lookahead
