#include "core/errors.hpp"
#include "game/ticTacToe.hpp"
#include "network/tcpClient.hpp"
#include "oracle/oracleClient.hpp"
#include "oracle/oracleServer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>

namespace lookahead::gtest {

using namespace std::chrono_literals;

//! Oracle server and client talking over loopback on a free port.
class OracleServiceTest : public ::testing::Test {
protected:
	void SetUp() override {
		m_server.start();
		m_client.emplace(oracle::Endpoint{.host = "127.0.0.1", .port = m_server.port()});
	}

	RenderReply renderAsync(const RenderTicket& ticket, const std::string& board) {
		auto promise = std::make_shared<std::promise<RenderReply>>();
		auto reply   = promise->get_future();
		m_client->requestRender(ticket, board, [promise](RenderReply r) { promise->set_value(std::move(r)); });

		if (reply.wait_for(5s) != std::future_status::ready) {
			ADD_FAILURE() << "No render reply within 5s";
			return RenderReply{.ticket = ticket, .text = std::nullopt, .error = "timeout"};
		}
		return reply.get();
	}

	game::TicTacToe m_engine;
	oracle::OracleServer m_server{m_engine, 0u};
	std::optional<oracle::OracleClient> m_client;
};

TEST_F(OracleServiceTest, NewGameAndMoves) {
	const auto state = m_client->fetchInitialState();
	EXPECT_EQ(state.board, "---------");
	EXPECT_EQ(state.player, 'X');

	const auto moves = m_client->listMoves(state.board);
	ASSERT_EQ(moves.size(), 9u);
	EXPECT_EQ(moves[0].id, "1");
	EXPECT_EQ(moves[0].resultingState, "X--------");
	EXPECT_EQ(moves[0].resultingPlayer, 'O');
}

TEST_F(OracleServiceTest, GameEndTravelsWithMove) {
	const auto moves = m_client->listMoves("XX-OO----");
	const auto* win  = findMove(moves, "3");
	ASSERT_TRUE(win);
	ASSERT_TRUE(win->end);
	EXPECT_EQ(win->end->winners, "X");
}

TEST_F(OracleServiceTest, BlockingRender) {
	EXPECT_EQ(m_client->render("X---O----"), m_engine.renderToText(*m_engine.parseState("X---O----")));
}

TEST_F(OracleServiceTest, InvalidStateIsOracleError) {
	EXPECT_THROW(m_client->listMoves("XXXXXXXXX"), OracleError);
	EXPECT_THROW(m_client->render("nonsense"), OracleError);
}

TEST_F(OracleServiceTest, AsyncRenderCarriesTicket) {
	const auto reply = renderAsync(RenderTicket{.serial = 4u, .requestedFor = "5"}, "----X----");
	EXPECT_EQ(reply.ticket.serial, 4u);
	EXPECT_EQ(reply.ticket.requestedFor, "5");
	ASSERT_TRUE(reply.text);
	EXPECT_EQ(*reply.text, m_engine.renderToText(*m_engine.parseState("----X----")));
}

TEST_F(OracleServiceTest, AsyncRenderOfInvalidStateFails) {
	const auto reply = renderAsync(RenderTicket{.serial = 1u, .requestedFor = "1"}, "--");
	EXPECT_FALSE(reply.text);
	EXPECT_NE(reply.error.find("invalid game state"), std::string::npos);
}

TEST_F(OracleServiceTest, UnknownCommand) {
	network::TcpClient raw;
	ASSERT_TRUE(raw.connect("127.0.0.1", m_server.port()));
	ASSERT_TRUE(raw.send("bogus"));
	EXPECT_EQ(raw.read(), "ERROR:unknown command");
}

TEST_F(OracleServiceTest, SelectPlaysFirstMove) {
	const auto response = m_server.handleRequest(oracle::SelectRequest{.board = "X---O----"});
	ASSERT_TRUE(std::holds_alternative<oracle::SelectResponse>(response));
	EXPECT_EQ(std::get<oracle::SelectResponse>(response).move.id, "2");

	const auto finished = m_server.handleRequest(oracle::SelectRequest{.board = "XXXOO----"});
	ASSERT_TRUE(std::holds_alternative<oracle::ErrorResponse>(finished));
	EXPECT_EQ(std::get<oracle::ErrorResponse>(finished).message, "game is over");
}

TEST(OracleClient, UnreachableOracle) {
	std::uint16_t port{};
	{
		game::TicTacToe engine;
		oracle::OracleServer server(engine, 0u);
		port = server.port();
	}

	oracle::OracleClient client(oracle::Endpoint{.host = "127.0.0.1", .port = port});
	EXPECT_THROW(client.fetchInitialState(), OracleError);

	std::promise<RenderReply> promise;
	auto reply = promise.get_future();
	client.requestRender(RenderTicket{.serial = 1u, .requestedFor = "1"}, "---------", [&promise](RenderReply r) { promise.set_value(std::move(r)); });
	ASSERT_EQ(reply.wait_for(5s), std::future_status::ready);
	EXPECT_FALSE(reply.get().text);
}

TEST(OracleServer, DelayedRendersCompleteOutOfOrder) {
	game::TicTacToe engine;
	oracle::OracleServer server(engine, 0u, 500ms);
	server.start();
	oracle::OracleClient client(oracle::Endpoint{.host = "127.0.0.1", .port = server.port()});

	// The list reply is not delayed, so it overtakes the render issued first.
	std::promise<RenderReply> promise;
	auto reply = promise.get_future();
	client.requestRender(RenderTicket{.serial = 1u, .requestedFor = "1"}, "---------", [&promise](RenderReply r) { promise.set_value(std::move(r)); });

	EXPECT_EQ(client.listMoves("---------").size(), 9u);
	EXPECT_EQ(reply.wait_for(0ms), std::future_status::timeout);

	ASSERT_EQ(reply.wait_for(5s), std::future_status::ready);
	EXPECT_TRUE(reply.get().text);
}

} // namespace lookahead::gtest
