#include "session/sessionController.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace lookahead::session {

static constexpr char LOG_ROUND[]   = "[Session] Round started for player {} with {} moves.";
static constexpr char LOG_KEY[]     = "[Session] Key {} '{}', prefix is now '{}'.";
static constexpr char LOG_COMMIT[]  = "[Session] Player {} committed move '{}'.";
static constexpr char LOG_INVALID[] = "[Session] No move '{}' among the {} moves.";

//! Characters that can be part of a move id. Everything else is ignored.
static bool acceptsCharacter(const Session& session, char c) {
	if (c >= '0' && c <= '9') {
		return true;
	}
	return std::ranges::any_of(session.legalMoves, [c](const MoveOption& move) { return move.id.find(c) != std::string::npos; });
}

SessionController::SessionController(TerminalRenderer& renderer, IRenderOracle& oracle, IEventSource& events)
    : m_renderer{renderer}, m_events{events}, m_coordinator{oracle, [&events](RenderReply reply) { events.postReply(std::move(reply)); }} {
}

Outcome SessionController::runRound(Session& session) {
	if (session.legalMoves.empty()) {
		throw std::invalid_argument("A round needs at least one legal move.");
	}

	beginRound(session);

	while (true) {
		const auto event = m_events.waitNext();

		if (const auto* key = std::get_if<KeyEvent>(&event)) {
			if (auto outcome = handleKey(session, key->key)) {
				return *outcome;
			}
		} else if (const auto* reply = std::get_if<RenderReplyEvent>(&event)) {
			handleReply(session, reply->reply);
		} else {
			Logger().Log(Logging::LogLevel::Info, "[Session] Input closed, leaving the round.");
			discardPreview(session);
			return Quit{};
		}
	}
}

void SessionController::beginRound(Session& session) {
	Logger().Log(Logging::LogLevel::Info, std::format(LOG_ROUND, session.currentPlayer, session.legalMoves.size()));

	drawMoveList(session);
	drawQueryLine(session);
}

std::optional<Outcome> SessionController::handleKey(Session& session, const Key& key) {
	switch (key.code) {
	case KeyCode::Quit:
		Logger().Log(Logging::LogLevel::Info, "[Session] Quit requested.");
		discardPreview(session);
		return Quit{};

	case KeyCode::Enter:
		if (const auto* move = findMove(session.legalMoves, session.typedPrefix)) {
			Logger().Log(Logging::LogLevel::Info, std::format(LOG_COMMIT, session.currentPlayer, move->id));
			discardPreview(session);
			clearMessage(session);
			return Committed{.move = *move};
		}
		reportInvalidSelection(session);
		return std::nullopt;

	case KeyCode::Backspace:
		if (session.typedPrefix.empty()) {
			return std::nullopt;
		}
		session.typedPrefix.pop_back();
		Logger().Log(Logging::LogLevel::Debug, std::format(LOG_KEY, "backspace", "", session.typedPrefix));
		onPrefixChanged(session);
		return std::nullopt;

	case KeyCode::Character:
		if (!acceptsCharacter(session, key.character)) {
			return std::nullopt;
		}
		session.typedPrefix.push_back(key.character);
		Logger().Log(Logging::LogLevel::Debug, std::format(LOG_KEY, "character", key.character, session.typedPrefix));
		onPrefixChanged(session);
		return std::nullopt;

	case KeyCode::Ignored:
		return std::nullopt;
	}
	return std::nullopt;
}

void SessionController::handleReply(Session& session, const RenderReply& reply) {
	const auto* pending = session.preview ? std::get_if<PendingPreview>(&*session.preview) : nullptr;
	if (!pending) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Session] Dropped reply #{}, no preview is pending.", reply.ticket.serial));
		return;
	}

	if (auto preview = m_coordinator.onReply(*pending, reply, session.typedPrefix)) {
		showPreview(session, std::move(*preview));
	}
}

void SessionController::onPrefixChanged(Session& session) {
	discardPreview(session);
	drawQueryLine(session);

	if (const auto request = m_coordinator.maybeRequestPreview(session.typedPrefix, session.legalMoves)) {
		session.preview = PendingPreview{.ticket = request->ticket};
		m_coordinator.issue(*request);
	}
}

void SessionController::showPreview(Session& session, RenderedPreview preview) {
	auto& region = session.previewRegion;
	m_renderer.repaint(region.startLine, region.previousLineCount, preview.text);

	region.previousLineCount = preview.lineCount;
	session.maxPreviewLines  = std::max(session.maxPreviewLines, preview.lineCount);
	session.preview          = std::move(preview);
}

void SessionController::discardPreview(Session& session) {
	auto& region = session.previewRegion;
	m_renderer.clearLines(region.startLine, region.previousLineCount);

	region.previousLineCount = 0u;
	session.preview.reset();
}

void SessionController::clearMessage(Session& session) {
	if (session.messageLine) {
		m_renderer.clearLines(*session.messageLine, 1u);
		session.messageLine.reset();
	}
}

void SessionController::reportInvalidSelection(Session& session) {
	Logger().Log(Logging::LogLevel::Info, std::format(LOG_INVALID, session.typedPrefix, session.legalMoves.size()));

	// Below the tallest preview shown so far in this round.
	const Line line = session.queryLine() + static_cast<Line>(session.maxPreviewLines) + 1u;
	if (session.messageLine && *session.messageLine != line) {
		clearMessage(session);
	}

	drawMoveList(session);
	m_renderer.writeLine(line, std::format("You typed `{}`; but you need to select one of the {} moves listed above", session.typedPrefix,
	                                       session.legalMoves.size()));
	m_renderer.clearLines(line + 1u, 1u);
	session.messageLine = line;

	drawQueryLine(session);
}

void SessionController::drawMoveList(const Session& session) {
	std::string text = std::format("{} moves: ", session.currentPlayer);
	for (const auto& move: session.legalMoves) {
		text += move.id;
		text.push_back(' ');
	}
	m_renderer.writeLine(session.moveListLine, text);
}

void SessionController::drawQueryLine(const Session& session) {
	m_renderer.writeLine(session.queryLine(), std::format("{}{}", PROMPT, session.typedPrefix));
}

} // namespace lookahead::session
