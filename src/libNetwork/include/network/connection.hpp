#pragma once

#include "network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>

namespace lookahead::network {

//! Transportation primitive. Handles read/write from a single client connection.
//! All handlers run on the owning server's IO thread, serialized by the connection strand.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&, const Message&)> onMessage;
		std::function<void(Connection&)> onDisconnect;
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks);

	void start();                  //!< Start reading frames.
	void stop();                   //!< Close the socket. Does not signal onDisconnect.
	void send(const Message& msg); //!< Queue a frame for the client.

	ConnectionId connectionId() const; //!< Get the server assigned id of this connection.

private:
	void startRead();    //!< Prime async read and dispatch messages.
	void startWrite();   //!< Prime async write for new messages.
	void doDisconnect(); //!< Internal cleanup.

private:
	std::atomic<bool> m_running{false};           //!< Connection running.
	asio::ip::tcp::socket m_socket;               //!< Client socket.
	asio::strand<asio::any_io_executor> m_strand; //!< Serializes handlers of this connection.

	ConnectionId m_connectionId;
	Callbacks m_callbacks; //!< Used to signal to the parent.

	std::deque<Message> m_writeQueue;
	bool m_writeInProgress{false};
};

} // namespace lookahead::network
