#pragma once

#include "game/IRuleEngine.hpp"
#include "network/protocol.hpp"
#include "network/tcpServer.hpp"
#include "oracle/messages.hpp"

#include <chrono>
#include <cstdint>

namespace lookahead::oracle {

//! Serves a rule engine over TCP: one response per request, answered on the requesting connection.
class OracleServer {
public:
	OracleServer(const game::IRuleEngine& engine, std::uint16_t port = network::DEFAULT_PORT,
	             std::chrono::milliseconds renderDelay = std::chrono::milliseconds::zero());
	~OracleServer();

	void start(); //!< Start accepting requests.
	void stop();  //!< Stop the network listener.

	std::uint16_t port() const;

	//! Compute the response to a request. Invalid boards produce an ErrorResponse.
	OracleResponse handleRequest(const OracleRequest& request) const;

private:
	void onMessage(network::ConnectionId connectionId, const network::Message& message);

	OracleResponse handle(const NewGameRequest& request) const;
	OracleResponse handle(const ListMovesRequest& request) const;
	OracleResponse handle(const RenderRequest& request) const;
	OracleResponse handle(const SelectRequest& request) const;

private:
	const game::IRuleEngine& m_engine;
	const std::chrono::milliseconds m_renderDelay; //!< Simulated render latency.
	network::TcpServer m_network;
};

} // namespace lookahead::oracle
