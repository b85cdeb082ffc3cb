#include "oracle/oracleServer.hpp"

#include "Logging.hpp"

#include <format>

namespace lookahead::oracle {

OracleServer::OracleServer(const game::IRuleEngine& engine, std::uint16_t port, std::chrono::milliseconds renderDelay)
    : m_engine{engine}, m_renderDelay{renderDelay}, m_network{port} {
	m_network.connect(network::TcpServer::Callbacks{
	        .onConnect    = {},
	        .onMessage    = [this](network::ConnectionId connectionId, const network::Message& message) { onMessage(connectionId, message); },
	        .onDisconnect = {},
	});
}

OracleServer::~OracleServer() {
	stop();
}

void OracleServer::start() {
	m_network.start();
	Logger().Log(Logging::LogLevel::Info, std::format("[OracleServer] Serving {} on port {}.", m_engine.name(), m_network.port()));
}

void OracleServer::stop() {
	m_network.stop();
}

std::uint16_t OracleServer::port() const {
	return m_network.port();
}

void OracleServer::onMessage(network::ConnectionId connectionId, const network::Message& message) {
	auto logger = Logger();

	const auto request = fromRequestMessage(message);
	if (!request) {
		logger.Log(Logging::LogLevel::Warning, std::format("[OracleServer] Malformed request from connection {}: '{}'.", connectionId, message));
		m_network.send(connectionId, toMessage(ErrorResponse{.message = "unknown command"}));
		return;
	}

	logger.Log(Logging::LogLevel::Debug, std::format("[OracleServer] Request from connection {}: '{}'.", connectionId, message));

	const auto response = handleRequest(*request);
	if (std::holds_alternative<RenderRequest>(*request)) {
		m_network.sendAfter(connectionId, toMessage(response), m_renderDelay);
	} else {
		m_network.send(connectionId, toMessage(response));
	}
}

OracleResponse OracleServer::handleRequest(const OracleRequest& request) const {
	return std::visit([&](const auto& r) { return handle(r); }, request);
}

OracleResponse OracleServer::handle(const NewGameRequest&) const {
	return NewGameResponse{.state = m_engine.initialState()};
}

OracleResponse OracleServer::handle(const ListMovesRequest& request) const {
	const auto state = m_engine.parseState(request.board);
	if (!state) {
		return ErrorResponse{.message = std::format("invalid game state '{}'", request.board)};
	}
	return ListMovesResponse{.moves = m_engine.moves(*state)};
}

OracleResponse OracleServer::handle(const RenderRequest& request) const {
	const auto state = m_engine.parseState(request.board);
	if (!state) {
		return ErrorResponse{.message = std::format("invalid game state '{}'", request.board)};
	}
	return RenderResponse{.text = m_engine.renderToText(*state)};
}

OracleResponse OracleServer::handle(const SelectRequest& request) const {
	const auto state = m_engine.parseState(request.board);
	if (!state) {
		return ErrorResponse{.message = std::format("invalid game state '{}'", request.board)};
	}

	// No search strategy: the first listed move is played.
	const auto moves = m_engine.moves(*state);
	if (moves.empty()) {
		return ErrorResponse{.message = "game is over"};
	}
	return SelectResponse{.move = moves.front()};
}

} // namespace lookahead::oracle
