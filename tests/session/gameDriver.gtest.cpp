#include "fakes.hpp"
#include "game/localGameService.hpp"
#include "game/ticTacToe.hpp"
#include "session/gameDriver.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace lookahead::gtest {

using session::KeyCode;

//! Plays tic-tac-toe from the in-process rule engine. Previews go to the fake oracle and stay pending.
class GameDriverTest : public ::testing::Test {
protected:
	void play(std::initializer_list<const char*> ids) {
		for (const auto* id: ids) {
			events.type(id).press(KeyCode::Enter);
		}
	}

	std::ostringstream out;
	session::TerminalRenderer renderer{out};
	VirtualScreen screen{out};
	FakeRenderOracle oracle;
	FakeEventSource events;
	session::SessionController controller{renderer, oracle, events};

	game::TicTacToe engine;
	game::LocalGameService service{engine};
	session::GameDriver driver{service, controller, renderer};
};

TEST_F(GameDriverTest, QuitKeepsPosition) {
	events.then([&] {
		EXPECT_EQ(screen.row(1u), "     |     |");
		EXPECT_EQ(screen.row(2u), "-----|-----|-----");
		EXPECT_EQ(screen.row(6u), "X moves: 1 2 3 4 5 6 7 8 9");
		EXPECT_EQ(screen.row(7u), "?");
	});
	events.press(KeyCode::Quit);

	const auto result = driver.play();
	EXPECT_TRUE(result.quit);
	EXPECT_FALSE(result.end);
	EXPECT_EQ(result.finalState.board, "---------");
	EXPECT_EQ(screen.row(6u), "");
	EXPECT_EQ(screen.row(7u), "");
}

TEST_F(GameDriverTest, CommittedMoveStartsNextRound) {
	play({"5"});
	events.then([&] {
		EXPECT_EQ(screen.row(3u), "     |  X  |");
		EXPECT_EQ(screen.row(6u), "O moves: 1 2 3 4 6 7 8 9");
		EXPECT_EQ(screen.row(7u), "?");
	});
	events.press(KeyCode::Quit);

	const auto result = driver.play();
	EXPECT_TRUE(result.quit);
	EXPECT_EQ(result.finalState.board, "----X----");
	EXPECT_EQ(result.finalState.player, 'O');
}

TEST_F(GameDriverTest, InvalidSelectionMessageIsGoneNextRound) {
	events.type("0").press(KeyCode::Enter).press(KeyCode::Backspace);
	play({"1"});
	events.then([&] { EXPECT_EQ(screen.row(8u), ""); });
	events.press(KeyCode::Quit);

	driver.play();
}

TEST_F(GameDriverTest, PlaysUntilWin) {
	play({"1", "4", "2", "5", "3"});

	const auto result = driver.play();
	EXPECT_FALSE(result.quit);
	ASSERT_TRUE(result.end);
	EXPECT_EQ(result.end->winners, "X");
	EXPECT_EQ(result.finalState.board, "XXXOO----");

	EXPECT_EQ(screen.row(1u), "  X  |  X  |  X");
	EXPECT_EQ(screen.row(6u), "X wins!");
	EXPECT_EQ(screen.row(7u), "");
	EXPECT_EQ(events.remaining(), 0u);
}

TEST_F(GameDriverTest, PlaysUntilDraw) {
	play({"1", "2", "3", "5", "4", "6", "8", "7", "9"});

	const auto result = driver.play();
	ASSERT_TRUE(result.end);
	EXPECT_TRUE(result.end->winners.empty());
	EXPECT_EQ(result.finalState.board, "XOXXOOOXX");
	EXPECT_EQ(screen.row(6u), "Draw.");
}

TEST(GameDriver, StopsWithoutMoves) {
	//! Service for a position without legal moves.
	class FinishedGame : public IGameService {
	public:
		GameState fetchInitialState() override {
			return GameState{.board = "done", .player = 'X'};
		}
		std::vector<MoveOption> listMoves(const std::string&) override {
			return {};
		}
		std::string render(const std::string& board) override {
			return board + "\n";
		}
	};

	std::ostringstream out;
	session::TerminalRenderer renderer(out);
	VirtualScreen screen(out);
	FakeRenderOracle oracle;
	FakeEventSource events;
	session::SessionController controller(renderer, oracle, events);
	FinishedGame service;

	const auto result = session::GameDriver(service, controller, renderer).play();
	EXPECT_FALSE(result.quit);
	EXPECT_FALSE(result.end);
	EXPECT_EQ(screen.row(1u), "done");
}

TEST(GameDriver, ResultLine) {
	EXPECT_EQ(session::resultLine(GameEnd{.winners = "O"}), "O wins!");
	EXPECT_EQ(session::resultLine(GameEnd{}), "Draw.");
}

} // namespace lookahead::gtest
