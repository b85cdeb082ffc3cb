#include "network/tcpClient.hpp"

#include "Logging.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <format>

namespace lookahead {
namespace network {

TcpClient::TcpClient() : m_resolver(m_ioContext), m_socket(m_ioContext) {
}

TcpClient::~TcpClient() {
	disconnect();
}

bool TcpClient::connect(const std::string& host, std::uint16_t port) {
	if (m_isConnected) {
		return false;
	}

	asio::error_code ec;
	const auto endpoints = m_resolver.resolve(host, std::to_string(port), ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpClient] Could not resolve '{}': {}", host, ec.message()));
		return false;
	}
	asio::connect(m_socket, endpoints, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpClient] Could not connect to '{}:{}': {}", host, port, ec.message()));
		return false;
	}

	m_isConnected = true;
	return true;
}

void TcpClient::disconnect() {
	if (!m_socket.is_open()) {
		m_isConnected = false;
		return;
	}

	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
	m_isConnected = false;
}

bool TcpClient::isConnected() const {
	return m_isConnected;
}

bool TcpClient::send(const Message& message) {
	if (!m_isConnected) {
		return false;
	}

	if (message.size() > MAX_PAYLOAD_BYTES) {
		return false;
	}

	BasicMessageHeader header{};
	header.payload_size = to_network_u32(static_cast<std::uint32_t>(message.size()));

	std::array<asio::const_buffer, 2> buffers = {asio::buffer(&header, sizeof(header)), asio::buffer(message.data(), message.size())};

	asio::error_code ec;
	asio::write(m_socket, buffers, ec);
	if (ec) {
		m_isConnected = false;
		return false;
	}
	return true;
}

std::optional<Message> TcpClient::read() {
	if (!m_isConnected) {
		return std::nullopt;
	}

	const auto header = read_header();
	if (!header) {
		return std::nullopt;
	}
	const auto payload_size = from_network_u32(header->payload_size);

	if (payload_size > MAX_PAYLOAD_BYTES) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpClient] Incoming payload too large ({} bytes).", payload_size));
		disconnect();
		return std::nullopt;
	}

	return read_payload(payload_size);
}

std::optional<BasicMessageHeader> TcpClient::read_header() {
	BasicMessageHeader header{};
	asio::error_code ec;
	asio::read(m_socket, asio::buffer(&header, sizeof(header)), ec);
	if (ec) {
		m_isConnected = false;
		return std::nullopt;
	}
	return header;
}

std::optional<Message> TcpClient::read_payload(std::uint32_t expected_bytes) {
	if (expected_bytes == 0) {
		return Message{};
	}

	Message payload(expected_bytes, '\0');
	asio::error_code ec;
	asio::read(m_socket, asio::buffer(payload.data(), payload.size()), ec);
	if (ec) {
		m_isConnected = false;
		return std::nullopt;
	}
	return payload;
}

} // namespace network
} // namespace lookahead
