#pragma once

#include "core/IRenderOracle.hpp"
#include "session/previewCoordinator.hpp"
#include "session/session.hpp"
#include "session/sessionEvent.hpp"
#include "session/terminalRenderer.hpp"

#include <optional>

namespace lookahead::session {

//! Runs the move selection of one round: keystrokes edit the typed prefix while
//! previews of exactly matching moves are requested and painted below the query line.
class SessionController {
public:
	SessionController(TerminalRenderer& renderer, IRenderOracle& oracle, IEventSource& events);

	//! Blocks until the user commits a legal move or quits.
	//! Throws std::invalid_argument for a session without legal moves, TerminalError and OracleError on fatal failures.
	Outcome runRound(Session& session);

private:
	void beginRound(Session& session);

	std::optional<Outcome> handleKey(Session& session, const Key& key);
	void handleReply(Session& session, const RenderReply& reply);

	void onPrefixChanged(Session& session);
	void showPreview(Session& session, RenderedPreview preview);
	void discardPreview(Session& session);
	void clearMessage(Session& session);
	void reportInvalidSelection(Session& session);

	void drawMoveList(const Session& session);
	void drawQueryLine(const Session& session);

private:
	TerminalRenderer& m_renderer;
	IEventSource& m_events;
	PreviewCoordinator m_coordinator;
};

} // namespace lookahead::session
