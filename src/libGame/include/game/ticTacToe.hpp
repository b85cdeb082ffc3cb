#pragma once

#include "game/IRuleEngine.hpp"

#include <array>
#include <optional>

namespace lookahead::game {

//! Tic-tac-toe. The board is serialized as 9 characters ('-', 'X' or 'O') in row major order.
//! Moves are identified by the cell number 1..9.
class TicTacToe : public IRuleEngine {
public:
	using Cells = std::array<char, 9>;

	static constexpr Player FIRST_PLAYER  = 'X';
	static constexpr Player SECOND_PLAYER = 'O';
	static constexpr char EMPTY           = '-';

	std::string_view name() const override;
	GameState initialState() const override;
	std::optional<GameState> parseState(std::string_view board) const override;
	std::vector<MoveOption> moves(const GameState& state) const override;
	std::string renderToText(const GameState& state) const override;

	//! Player with three in a row, if any.
	static std::optional<Player> winner(const Cells& cells);
};

} // namespace lookahead::game
