#pragma once

#include "core/IGameService.hpp"
#include "core/IRenderOracle.hpp"
#include "oracle/endpoint.hpp"
#include "oracle/messages.hpp"

#include <asio.hpp>

#include <optional>
#include <thread>

namespace lookahead::oracle {

//! Game service and render oracle reached over TCP.
//! Every request uses its own connection, so overlapping renders complete independently and in any order.
class OracleClient : public IGameService, public IRenderOracle {
public:
	explicit OracleClient(Endpoint endpoint);
	~OracleClient() override;

	OracleClient(const OracleClient&)            = delete;
	OracleClient& operator=(const OracleClient&) = delete;

	GameState fetchInitialState() override;
	std::vector<MoveOption> listMoves(const std::string& board) override;
	std::string render(const std::string& board) override;

	//! Callback runs on the client's IO thread.
	void requestRender(const RenderTicket& ticket, const std::string& board, RenderCallback callback) override;

private:
	//! Blocking request/response round trip. Throws OracleError on transport failure or error responses.
	OracleResponse ask(const OracleRequest& request);

private:
	Endpoint m_endpoint;

	asio::io_context m_ioContext; //!< Drives the asynchronous render exchanges.
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;
	std::thread m_ioThread;
};

} // namespace lookahead::oracle
