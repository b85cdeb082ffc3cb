#include "session/session.hpp"

namespace lookahead::session {

Session makeSession(const GameState& state, std::vector<MoveOption> legalMoves, Line moveListLine) {
	Session session{
	        .boardState    = state.board,
	        .currentPlayer = state.player,
	        .legalMoves    = std::move(legalMoves),
	        .moveListLine  = moveListLine,
	};
	session.previewRegion.startLine = session.previewLine();
	return session;
}

} // namespace lookahead::session
