#pragma once

#include "network/protocol.hpp"

#include <asio.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace lookahead {
namespace network {

//! Minimal synchronous TCP client exchanging length-prefixed frames.
//! All functions report failures through their return value and never throw.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	bool connect(const std::string& host, std::uint16_t port = DEFAULT_PORT);
	void disconnect();

	bool send(const Message& message);
	std::optional<Message> read(); //!< Blocks until a full frame arrived. Empty on failure.

	bool isConnected() const;

private:
	std::optional<BasicMessageHeader> read_header();
	std::optional<Message> read_payload(std::uint32_t expected_bytes);

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::resolver m_resolver;
	asio::ip::tcp::socket m_socket;

	bool m_isConnected{false};
};

} // namespace network
} // namespace lookahead
