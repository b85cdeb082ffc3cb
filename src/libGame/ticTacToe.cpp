#include "game/ticTacToe.hpp"

#include <algorithm>
#include <format>

namespace lookahead::game {

namespace {

constexpr std::array<std::array<std::size_t, 3>, 8> LINES{{
        {0, 1, 2},
        {3, 4, 5},
        {6, 7, 8},
        {0, 3, 6},
        {1, 4, 7},
        {2, 5, 8},
        {0, 4, 8},
        {2, 4, 6},
}};

Player opponent(Player player) {
	return player == TicTacToe::FIRST_PLAYER ? TicTacToe::SECOND_PLAYER : TicTacToe::FIRST_PLAYER;
}

std::optional<TicTacToe::Cells> toCells(std::string_view board) {
	if (board.size() != 9u) {
		return std::nullopt;
	}
	TicTacToe::Cells cells{};
	std::copy(board.begin(), board.end(), cells.begin());
	return cells;
}

bool spaceAvailable(const TicTacToe::Cells& cells) {
	return std::ranges::find(cells, TicTacToe::EMPTY) != cells.end();
}

//! Three character wide cell content.
std::string pad(char cell) {
	return std::format(" {} ", cell == TicTacToe::EMPTY ? ' ' : cell);
}

} // namespace

std::string_view TicTacToe::name() const {
	return "TicTacToe";
}

GameState TicTacToe::initialState() const {
	return GameState{.board = std::string(9u, EMPTY), .player = FIRST_PLAYER};
}

std::optional<GameState> TicTacToe::parseState(std::string_view board) const {
	const auto cells = toCells(board);
	if (!cells) {
		return std::nullopt;
	}

	int numFirst  = 0;
	int numSecond = 0;
	for (const auto cell: *cells) {
		if (cell == FIRST_PLAYER) {
			++numFirst;
		} else if (cell == SECOND_PLAYER) {
			++numSecond;
		} else if (cell != EMPTY) {
			// Also rejects lower case pieces.
			return std::nullopt;
		}
	}

	switch (numFirst - numSecond) {
	case 0:
		return GameState{.board = std::string{board}, .player = FIRST_PLAYER};
	case 1:
		return GameState{.board = std::string{board}, .player = SECOND_PLAYER};
	default:
		return std::nullopt;
	}
}

std::vector<MoveOption> TicTacToe::moves(const GameState& state) const {
	const auto cells = toCells(state.board);
	if (!cells || winner(*cells) || !spaceAvailable(*cells)) {
		return {};
	}

	std::vector<MoveOption> result;
	for (std::size_t i = 0; i != cells->size(); ++i) {
		if ((*cells)[i] != EMPTY) {
			continue;
		}

		auto next = *cells;
		next[i]   = state.player;

		std::optional<GameEnd> end;
		if (winner(next) == state.player) {
			end = GameEnd{.winners = std::string(1u, state.player)};
		} else if (!spaceAvailable(next)) {
			end = GameEnd{};
		}

		result.push_back(MoveOption{
		        .id              = std::to_string(i + 1),
		        .resultingState  = std::string(next.begin(), next.end()),
		        .resultingPlayer = opponent(state.player),
		        .end             = end,
		});
	}
	return result;
}

std::string TicTacToe::renderToText(const GameState& state) const {
	const auto cells = toCells(state.board).value_or(Cells{EMPTY, EMPTY, EMPTY, EMPTY, EMPTY, EMPTY, EMPTY, EMPTY, EMPTY});

	static constexpr std::string_view SEPARATOR = "-----|-----|-----\n";

	std::string text;
	for (std::size_t row = 0; row != 3u; ++row) {
		if (row != 0) {
			text += SEPARATOR;
		}
		text += std::format(" {} | {} | {} \n", pad(cells[row * 3]), pad(cells[row * 3 + 1]), pad(cells[row * 3 + 2]));
	}
	return text;
}

std::optional<Player> TicTacToe::winner(const Cells& cells) {
	for (const auto& line: LINES) {
		const auto first = cells[line[0]];
		if (first != EMPTY && first == cells[line[1]] && first == cells[line[2]]) {
			return first;
		}
	}
	return std::nullopt;
}

} // namespace lookahead::game
