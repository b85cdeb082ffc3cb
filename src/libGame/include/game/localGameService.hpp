#pragma once

#include "core/IGameService.hpp"
#include "core/IRenderOracle.hpp"
#include "core/SafeQueue.hpp"
#include "game/IRuleEngine.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace lookahead::game {

//! Game service backed by an in-process rule engine.
//! Render requests are answered on a worker thread, optionally after an artificial delay.
//! The delay counts from each request, so an earlier request never postpones a later one.
class LocalGameService : public IGameService, public IRenderOracle {
public:
	explicit LocalGameService(const IRuleEngine& engine, std::chrono::milliseconds renderDelay = std::chrono::milliseconds::zero());
	~LocalGameService() override;

	LocalGameService(const LocalGameService&)            = delete;
	LocalGameService& operator=(const LocalGameService&) = delete;

	GameState fetchInitialState() override;
	std::vector<MoveOption> listMoves(const std::string& board) override;
	std::string render(const std::string& board) override;

	void requestRender(const RenderTicket& ticket, const std::string& board, RenderCallback callback) override;

private:
	struct RenderJob {
		RenderTicket ticket;
		std::string board;
		RenderCallback callback;
		std::chrono::steady_clock::time_point due; //!< Request time plus the render delay.
	};

	GameState parseOrThrow(const std::string& board) const;
	void workerLoop(); //!< Worker thread: answer queued render jobs when they are due.

private:
	const IRuleEngine& m_engine;
	const std::chrono::milliseconds m_renderDelay;

	SafeQueue<RenderJob> m_jobs;
	std::atomic<bool> m_running{true};
	std::thread m_worker;
};

} // namespace lookahead::game
