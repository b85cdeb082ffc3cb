#pragma once

#include "network/connection.hpp"
#include "network/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace lookahead {
namespace network {

//! Connection manager that runs an async accept loop on a dedicated IO thread.
//! Callbacks are invoked on the IO thread.
class TcpServer {
public:
	struct Callbacks {
		std::function<void(ConnectionId)> onConnect;
		std::function<void(ConnectionId, const Message&)> onMessage;
		std::function<void(ConnectionId)> onDisconnect;
	};

	//! Binds the listening socket. Port 0 picks a free port, see port().
	TcpServer(std::uint16_t port = DEFAULT_PORT);
	~TcpServer();

	void start();                      //!< Start accepting clients.
	void connect(Callbacks callbacks); //!< Connect callback functions to get event signalling.
	void stop();                       //!< Disconnect clients and stop the server.

	std::uint16_t port() const; //!< Port the server is listening on.

	bool send(ConnectionId connectionId, Message msg); //!< Send message to the client with given connectionId.
	//! Send message once the delay elapsed, without blocking the IO thread in the meantime.
	void sendAfter(ConnectionId connectionId, Message msg, std::chrono::milliseconds delay);

private:
	void doAccept();                                                                //!< Start async accept loop.
	bool createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId); //!< Create and add new connection to map.

private:
	asio::io_context m_ioContext;
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;

	std::thread m_ioThread;             //!< IO context thread.
	std::atomic<bool> m_running{false}; //!< TCP Server running.
	ConnectionId m_nextConnectionId{1u};

	Callbacks m_callbacks; //!< Callback functions to signal events.

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections; //!< Active connections.
	std::mutex m_connectionsMutex;                                               //!< Handle concurrency.
};

} // namespace network
} // namespace lookahead
