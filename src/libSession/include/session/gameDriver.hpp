#pragma once

#include "core/IGameService.hpp"
#include "core/types.hpp"
#include "session/sessionController.hpp"
#include "session/terminalRenderer.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace lookahead::session {

struct GameResult {
	GameState finalState;
	std::optional<GameEnd> end; //!< Set if a committed move ended the game.
	bool quit{false};           //!< The user left before the game ended.
};

//! "X wins!" or "Draw."
std::string resultLine(const GameEnd& end);

//! Plays rounds until the user quits or the game ends.
//! The board is drawn from line 1, the move list and query line below it.
class GameDriver {
public:
	GameDriver(IGameService& service, SessionController& controller, TerminalRenderer& renderer);

	GameResult play();

private:
	std::size_t drawBoard(const GameState& state); //!< Repaints the board and returns its height.
	GameResult finish(GameResult result, Line lastLine);

private:
	IGameService& m_service;
	SessionController& m_controller;
	TerminalRenderer& m_renderer;

	std::size_t m_boardLines{}; //!< Height of the board currently on screen.
};

} // namespace lookahead::session
