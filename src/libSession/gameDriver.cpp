#include "session/gameDriver.hpp"

#include "Logging.hpp"

#include <format>

namespace lookahead::session {

std::string resultLine(const GameEnd& end) {
	if (end.winners.empty()) {
		return "Draw.";
	}
	return std::format("{} wins!", end.winners);
}

GameDriver::GameDriver(IGameService& service, SessionController& controller, TerminalRenderer& renderer)
    : m_service{service}, m_controller{controller}, m_renderer{renderer} {
}

GameResult GameDriver::play() {
	m_renderer.clearScreen();
	m_boardLines = 0u;

	auto state = m_service.fetchInitialState();
	Logger().Log(Logging::LogLevel::Info, std::format("[Driver] New game '{}', player {} starts.", state.board, state.player));

	while (true) {
		const Line moveListLine = static_cast<Line>(drawBoard(state)) + 1u;

		auto moves = m_service.listMoves(state.board);
		if (moves.empty()) {
			Logger().Log(Logging::LogLevel::Info, std::format("[Driver] No moves left in '{}'.", state.board));
			return finish(GameResult{.finalState = state}, moveListLine);
		}

		auto session       = makeSession(state, std::move(moves), moveListLine);
		const auto outcome = m_controller.runRound(session);

		// Move list, query line and message belong to the finished round.
		m_renderer.clearLines(session.moveListLine, 2u);
		if (session.messageLine) {
			m_renderer.clearLines(*session.messageLine, 1u);
		}

		if (std::holds_alternative<Quit>(outcome)) {
			Logger().Log(Logging::LogLevel::Info, "[Driver] Game left by the user.");
			return finish(GameResult{.finalState = state, .quit = true}, moveListLine);
		}

		const auto& move = std::get<Committed>(outcome).move;
		state            = GameState{.board = move.resultingState, .player = move.resultingPlayer};

		if (move.end) {
			const Line resultRow = static_cast<Line>(drawBoard(state)) + 1u;
			m_renderer.writeLine(resultRow, resultLine(*move.end));
			Logger().Log(Logging::LogLevel::Info, std::format("[Driver] Game over: {}", resultLine(*move.end)));
			return finish(GameResult{.finalState = state, .end = move.end}, resultRow + 1u);
		}
	}
}

std::size_t GameDriver::drawBoard(const GameState& state) {
	const auto text = m_service.render(state.board);
	m_renderer.repaint(1u, m_boardLines, text);
	m_boardLines = lineCount(text);
	return m_boardLines;
}

GameResult GameDriver::finish(GameResult result, Line lastLine) {
	m_renderer.moveTo(lastLine);
	return result;
}

} // namespace lookahead::session
