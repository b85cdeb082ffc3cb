#include "game/ticTacToe.hpp"

#include <gtest/gtest.h>

namespace lookahead::gtest {

using game::TicTacToe;

TEST(TicTacToe, InitialState) {
	const TicTacToe engine{};
	const auto state = engine.initialState();

	EXPECT_EQ(state.board, "---------");
	EXPECT_EQ(state.player, 'X');
	EXPECT_EQ(engine.moves(state).size(), 9u);
}

TEST(TicTacToe, PlayerFollowsPieceCount) {
	const TicTacToe engine{};

	EXPECT_EQ(engine.parseState("---------")->player, 'X');
	EXPECT_EQ(engine.parseState("X--------")->player, 'O');
	EXPECT_EQ(engine.parseState("X---O----")->player, 'X');
}

TEST(TicTacToe, RejectsInvalidStates) {
	const TicTacToe engine{};

	EXPECT_FALSE(engine.parseState(""));
	EXPECT_FALSE(engine.parseState("--------"));
	EXPECT_FALSE(engine.parseState("----------"));
	EXPECT_FALSE(engine.parseState("O--------"));
	EXPECT_FALSE(engine.parseState("XX-------"));
	EXPECT_FALSE(engine.parseState("x--------"));
	EXPECT_FALSE(engine.parseState("X---?----"));
}

TEST(TicTacToe, MovesFillEmptyCells) {
	const TicTacToe engine{};
	const auto moves = engine.moves(*engine.parseState("X---O----"));

	ASSERT_EQ(moves.size(), 7u);
	EXPECT_EQ(moves.front().id, "2");
	EXPECT_EQ(moves.front().resultingState, "XX--O----");
	EXPECT_EQ(moves.front().resultingPlayer, 'O');
	EXPECT_FALSE(moves.front().end);
	EXPECT_EQ(moves.back().id, "9");

	EXPECT_FALSE(findMove(moves, "1"));
	EXPECT_FALSE(findMove(moves, "5"));
	EXPECT_TRUE(findMove(moves, "3"));
}

TEST(TicTacToe, WinningMoveEndsGame) {
	const TicTacToe engine{};
	const auto moves = engine.moves(*engine.parseState("XX-OO----"));

	const auto* win = findMove(moves, "3");
	ASSERT_TRUE(win);
	ASSERT_TRUE(win->end);
	EXPECT_EQ(win->end->winners, "X");

	EXPECT_FALSE(findMove(moves, "7")->end);
}

TEST(TicTacToe, LastCellWithoutLineIsDraw) {
	const TicTacToe engine{};
	const auto moves = engine.moves(*engine.parseState("XOXXOOOX-"));

	ASSERT_EQ(moves.size(), 1u);
	EXPECT_EQ(moves[0].id, "9");
	ASSERT_TRUE(moves[0].end);
	EXPECT_TRUE(moves[0].end->winners.empty());
}

TEST(TicTacToe, FinishedGameHasNoMoves) {
	const TicTacToe engine{};

	EXPECT_TRUE(engine.moves(*engine.parseState("XXXOO----")).empty());
	EXPECT_TRUE(engine.moves(*engine.parseState("XOXXOOOXX")).empty());
}

TEST(TicTacToe, RenderToText) {
	const TicTacToe engine{};

	EXPECT_EQ(engine.renderToText(*engine.parseState("X---O----")), "  X  |     |     \n"
	                                                                 "-----|-----|-----\n"
	                                                                 "     |  O  |     \n"
	                                                                 "-----|-----|-----\n"
	                                                                 "     |     |     \n");
}

TEST(TicTacToe, Winner) {
	const TicTacToe::Cells diagonal{'O', 'X', 'X', '-', 'O', 'X', '-', '-', 'O'};
	const TicTacToe::Cells column{'X', 'O', '-', 'X', 'O', '-', 'X', '-', '-'};
	const TicTacToe::Cells full{'X', 'O', 'X', 'X', 'O', 'O', 'O', 'X', 'X'};

	EXPECT_EQ(TicTacToe::winner(diagonal), 'O');
	EXPECT_EQ(TicTacToe::winner(column), 'X');
	EXPECT_FALSE(TicTacToe::winner(full));
}

} // namespace lookahead::gtest
