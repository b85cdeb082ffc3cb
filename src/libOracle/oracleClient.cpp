#include "oracle/oracleClient.hpp"

#include "Logging.hpp"
#include "core/errors.hpp"
#include "network/protocol.hpp"
#include "network/tcpClient.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <format>
#include <memory>

namespace lookahead::oracle {

namespace {

//! One asynchronous render round trip on its own connection.
class RenderExchange : public std::enable_shared_from_this<RenderExchange> {
public:
	RenderExchange(asio::io_context& ioContext, RenderTicket ticket, network::Message request, RenderCallback callback)
	    : m_resolver(ioContext), m_socket(ioContext), m_ticket(std::move(ticket)), m_request(std::move(request)),
	      m_callback(std::move(callback)) {
	}

	void start(const Endpoint& endpoint) {
		m_resolver.async_resolve(endpoint.host, std::to_string(endpoint.port),
		                         [self = shared_from_this()](asio::error_code ec, asio::ip::tcp::resolver::results_type endpoints) {
			                         if (ec) {
				                         self->fail(std::format("could not resolve oracle: {}", ec.message()));
				                         return;
			                         }
			                         asio::async_connect(self->m_socket, endpoints,
			                                             [self](asio::error_code ec1, const asio::ip::tcp::endpoint&) {
				                                             if (ec1) {
					                                             self->fail(std::format("could not connect to oracle: {}", ec1.message()));
					                                             return;
				                                             }
				                                             self->writeRequest();
			                                             });
		                         });
	}

private:
	void writeRequest() {
		m_outHeader.payload_size = network::to_network_u32(static_cast<std::uint32_t>(m_request.size()));

		std::array<asio::const_buffer, 2> buffers = {asio::buffer(&m_outHeader, sizeof(m_outHeader)),
		                                             asio::buffer(m_request.data(), m_request.size())};

		asio::async_write(m_socket, buffers, [self = shared_from_this()](asio::error_code ec, std::size_t) {
			if (ec) {
				self->fail(std::format("could not send render request: {}", ec.message()));
				return;
			}
			self->readHeader();
		});
	}

	void readHeader() {
		asio::async_read(m_socket, asio::buffer(&m_inHeader, sizeof(m_inHeader)), [self = shared_from_this()](asio::error_code ec, std::size_t) {
			if (ec) {
				self->fail(std::format("connection lost while rendering: {}", ec.message()));
				return;
			}

			const auto payloadSize = network::from_network_u32(self->m_inHeader.payload_size);
			if (payloadSize > network::MAX_PAYLOAD_BYTES) {
				self->fail(std::format("render reply too large ({} bytes)", payloadSize));
				return;
			}
			if (payloadSize == 0) {
				self->onPayload();
				return;
			}

			self->m_payload.assign(payloadSize, '\0');
			asio::async_read(self->m_socket, asio::buffer(self->m_payload.data(), self->m_payload.size()),
			                 [self](asio::error_code ec1, std::size_t) {
				                 if (ec1) {
					                 self->fail(std::format("connection lost while rendering: {}", ec1.message()));
					                 return;
				                 }
				                 self->onPayload();
			                 });
		});
	}

	void onPayload() {
		closeSocket();

		const auto response = fromResponseMessage(m_payload);
		if (!response) {
			fail("malformed render reply");
			return;
		}
		if (const auto* rendered = std::get_if<RenderResponse>(&*response)) {
			m_callback(RenderReply{.ticket = m_ticket, .text = rendered->text});
			return;
		}
		if (const auto* error = std::get_if<ErrorResponse>(&*response)) {
			fail(std::format("oracle error: {}", error->message));
			return;
		}
		fail("unexpected reply to render request");
	}

	void fail(const std::string& error) {
		closeSocket();
		m_callback(RenderReply{.ticket = m_ticket, .text = std::nullopt, .error = error});
	}

	void closeSocket() {
		asio::error_code ec;
		m_socket.shutdown(asio::socket_base::shutdown_both, ec);
		m_socket.close(ec);
	}

private:
	asio::ip::tcp::resolver m_resolver;
	asio::ip::tcp::socket m_socket;

	RenderTicket m_ticket;
	network::Message m_request;
	network::BasicMessageHeader m_outHeader{};
	network::BasicMessageHeader m_inHeader{};
	network::Message m_payload;
	RenderCallback m_callback;
};

} // namespace

OracleClient::OracleClient(Endpoint endpoint) : m_endpoint(std::move(endpoint)) {
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	m_ioThread = std::thread([this]() { m_ioContext.run(); });
}

OracleClient::~OracleClient() {
	// Exchanges still in flight are dropped without invoking their callbacks.
	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();

	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}
}

GameState OracleClient::fetchInitialState() {
	const auto response = ask(NewGameRequest{});
	if (const auto* fresh = std::get_if<NewGameResponse>(&response)) {
		return fresh->state;
	}
	throw OracleError("Unexpected reply to new game request.");
}

std::vector<MoveOption> OracleClient::listMoves(const std::string& board) {
	const auto response = ask(ListMovesRequest{.board = board});
	if (const auto* list = std::get_if<ListMovesResponse>(&response)) {
		return list->moves;
	}
	throw OracleError("Unexpected reply to list request.");
}

std::string OracleClient::render(const std::string& board) {
	const auto response = ask(RenderRequest{.board = board});
	if (const auto* rendered = std::get_if<RenderResponse>(&response)) {
		return rendered->text;
	}
	throw OracleError("Unexpected reply to render request.");
}

void OracleClient::requestRender(const RenderTicket& ticket, const std::string& board, RenderCallback callback) {
	Logger().Log(Logging::LogLevel::Debug, std::format("[OracleClient] Render request #{} for '{}'.", ticket.serial, board));

	auto exchange = std::make_shared<RenderExchange>(m_ioContext, ticket, toMessage(RenderRequest{.board = board}), std::move(callback));
	asio::post(m_ioContext, [exchange, endpoint = m_endpoint] { exchange->start(endpoint); });
}

OracleResponse OracleClient::ask(const OracleRequest& request) {
	const auto message = toMessage(request);

	network::TcpClient client;
	if (!client.connect(m_endpoint.host, m_endpoint.port)) {
		throw OracleError(std::format("Could not connect to oracle at {}:{}.", m_endpoint.host, m_endpoint.port));
	}
	if (!client.send(message)) {
		throw OracleError(std::format("Could not send request '{}'.", message));
	}

	const auto reply = client.read();
	client.disconnect();
	if (!reply) {
		throw OracleError(std::format("No reply to request '{}'.", message));
	}

	auto response = fromResponseMessage(*reply);
	if (!response) {
		Logger().Log(Logging::LogLevel::Error, std::format("[OracleClient] Malformed reply to '{}': '{}'", message, *reply));
		throw OracleError(std::format("Malformed reply to request '{}'.", message));
	}
	if (const auto* error = std::get_if<ErrorResponse>(&*response)) {
		throw OracleError(std::format("Oracle error: {}", error->message));
	}
	return std::move(*response);
}

} // namespace lookahead::oracle
