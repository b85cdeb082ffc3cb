#include "game/localGameService.hpp"

#include "core/errors.hpp"

#include <format>

namespace lookahead::game {

LocalGameService::LocalGameService(const IRuleEngine& engine, std::chrono::milliseconds renderDelay)
    : m_engine{engine}, m_renderDelay{renderDelay}, m_worker([this] { workerLoop(); }) {
}

LocalGameService::~LocalGameService() {
	m_running = false;
	m_jobs.Release();
	if (m_worker.joinable()) {
		m_worker.join();
	}
}

GameState LocalGameService::fetchInitialState() {
	return m_engine.initialState();
}

std::vector<MoveOption> LocalGameService::listMoves(const std::string& board) {
	return m_engine.moves(parseOrThrow(board));
}

std::string LocalGameService::render(const std::string& board) {
	return m_engine.renderToText(parseOrThrow(board));
}

void LocalGameService::requestRender(const RenderTicket& ticket, const std::string& board, RenderCallback callback) {
	m_jobs.Push(RenderJob{.ticket   = ticket,
	                      .board    = board,
	                      .callback = std::move(callback),
	                      .due      = std::chrono::steady_clock::now() + m_renderDelay});
}

GameState LocalGameService::parseOrThrow(const std::string& board) const {
	auto state = m_engine.parseState(board);
	if (!state) {
		throw OracleError(std::format("{}: invalid game state '{}'", m_engine.name(), board));
	}
	return *state;
}

void LocalGameService::workerLoop() {
	while (m_running) {
		RenderJob job;
		try {
			job = m_jobs.Pop();
		} catch (const QueueReleasedError&) {
			break;
		}

		// Jobs are queued in request order and share one delay, so they also fall due in order.
		std::this_thread::sleep_until(job.due);
		if (!m_running) {
			break;
		}

		RenderReply reply{.ticket = job.ticket, .text = std::nullopt};
		if (const auto state = m_engine.parseState(job.board)) {
			reply.text = m_engine.renderToText(*state);
		} else {
			reply.error = std::format("{}: invalid game state '{}'", m_engine.name(), job.board);
		}
		job.callback(std::move(reply));
	}
}

} // namespace lookahead::game
