#include "network/tcpServer.hpp"

#include "Logging.hpp"

#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>

#include <format>
#include <utility>

namespace lookahead::network {

TcpServer::TcpServer(std::uint16_t port) : m_ioContext(), m_acceptor(m_ioContext, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port)) {
}

TcpServer::~TcpServer() {
	stop();
}

void TcpServer::start() {
	if (m_running.exchange(true)) {
		return;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	m_ioThread = std::thread([this]() { m_ioContext.run(); });

	Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Listening on port {}.", port()));
}

void TcpServer::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

void TcpServer::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		connections.swap(m_connections);
	}
	for (auto& [id, conn]: connections) {
		conn->stop();
	}

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();

	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}

	Logger().Log(Logging::LogLevel::Info, "[TcpServer] Stopped.");
}

std::uint16_t TcpServer::port() const {
	asio::error_code ec;
	const auto endpoint = m_acceptor.local_endpoint(ec);
	return ec ? std::uint16_t{0} : endpoint.port();
}

bool TcpServer::send(ConnectionId connectionId, Message msg) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	if (m_connections.contains(connectionId)) {
		m_connections.at(connectionId)->send(msg);
		return true;
	}

	return false;
}

void TcpServer::sendAfter(ConnectionId connectionId, Message msg, std::chrono::milliseconds delay) {
	if (delay <= std::chrono::milliseconds::zero()) {
		send(connectionId, std::move(msg));
		return;
	}

	auto timer = std::make_shared<asio::steady_timer>(m_ioContext, delay);
	timer->async_wait([this, timer, connectionId, msg = std::move(msg)](asio::error_code ec) mutable {
		if (ec || !m_running) {
			return;
		}
		send(connectionId, std::move(msg));
	});
}

void TcpServer::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}
		if (!ec) {
			const auto connectionId = m_nextConnectionId++;
			bool created            = false;
			{
				std::lock_guard<std::mutex> lock(m_connectionsMutex);
				created = createConnection(std::move(socket), connectionId);
				if (created) {
					m_connections.at(connectionId)->start();
				}
			}
			if (created && m_callbacks.onConnect) {
				m_callbacks.onConnect(connectionId);
			}
		} else {
			Logger().Log(Logging::LogLevel::Warning, std::format("[TcpServer] Accept failed: {}", ec.message()));
		}

		if (m_running) {
			doAccept();
		}
	});
}

bool TcpServer::createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId) {
	if (m_connections.contains(connectionId)) {
		return false;
	}

	Connection::Callbacks callbacks;
	callbacks.onMessage = [this](Connection& connection, const Message& message) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(connection.connectionId(), message);
		}
	};
	callbacks.onDisconnect = [this](Connection& connection) {
		const auto index = connection.connectionId();
		{
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			m_connections.erase(index);
		}
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(index);
		}
	};

	const auto [it, inserted] = m_connections.try_emplace(connectionId, std::make_shared<Connection>(std::move(socket), connectionId, std::move(callbacks)));
	return inserted;
}

} // namespace lookahead::network
