#pragma once

#include "core/IRenderOracle.hpp"
#include "core/types.hpp"
#include "session/session.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lookahead::session {

//! A render request that should be issued for the typed prefix.
struct PendingRequest {
	RenderTicket ticket;
	std::string board; //!< Resulting state of the matching move.
};

using RenderedPreview = ReadyPreview;

//! Decides when a preview is requested and whether a reply is still relevant.
//! Superseded requests are never cancelled. Their replies are recognized and dropped in onReply.
class PreviewCoordinator {
public:
	//! Replies are handed to deliver, on whatever thread the oracle completes them.
	PreviewCoordinator(IRenderOracle& oracle, RenderCallback deliver);

	//! A request only if the prefix exactly equals the id of a legal move.
	std::optional<PendingRequest> maybeRequestPreview(const std::string& prefix, const std::vector<MoveOption>& legalMoves);
	//! Send the request to the oracle.
	void issue(const PendingRequest& request);

	//! The preview to show, or nothing if the reply belongs to a superseded request.
	//! Throws OracleError if the live request failed.
	std::optional<RenderedPreview> onReply(const PendingPreview& pending, const RenderReply& reply, const std::string& typedPrefix) const;

private:
	IRenderOracle& m_oracle;
	RenderCallback m_deliver;
	std::uint64_t m_nextSerial{1u};
};

} // namespace lookahead::session
