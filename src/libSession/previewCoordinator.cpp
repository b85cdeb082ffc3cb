#include "session/previewCoordinator.hpp"

#include "Logging.hpp"
#include "core/errors.hpp"

#include <format>

namespace lookahead::session {

PreviewCoordinator::PreviewCoordinator(IRenderOracle& oracle, RenderCallback deliver) : m_oracle{oracle}, m_deliver{std::move(deliver)} {
}

std::optional<PendingRequest> PreviewCoordinator::maybeRequestPreview(const std::string& prefix, const std::vector<MoveOption>& legalMoves) {
	const auto* move = findMove(legalMoves, prefix);
	if (!move) {
		return std::nullopt;
	}

	return PendingRequest{
	        .ticket = RenderTicket{.serial = m_nextSerial++, .requestedFor = prefix},
	        .board  = move->resultingState,
	};
}

void PreviewCoordinator::issue(const PendingRequest& request) {
	Logger().Log(Logging::LogLevel::Info, std::format("[Preview] Requesting preview #{} of move '{}'.", request.ticket.serial, request.ticket.requestedFor));
	m_oracle.requestRender(request.ticket, request.board, m_deliver);
}

std::optional<RenderedPreview> PreviewCoordinator::onReply(const PendingPreview& pending, const RenderReply& reply, const std::string& typedPrefix) const {
	// The serial separates requests for the same prefix typed twice in one round.
	const bool live = reply.ticket.serial == pending.ticket.serial && pending.ticket.requestedFor == typedPrefix;
	if (!live) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Preview] Dropped stale reply #{} for '{}'.", reply.ticket.serial, reply.ticket.requestedFor));
		return std::nullopt;
	}

	if (!reply.text) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Preview] Rendering move '{}' failed: {}", typedPrefix, reply.error));
		throw OracleError(std::format("Rendering the preview of move '{}' failed: {}", typedPrefix, reply.error));
	}

	return RenderedPreview{
	        .text        = *reply.text,
	        .lineCount   = lineCount(*reply.text),
	        .renderedFor = reply.ticket.requestedFor,
	};
}

} // namespace lookahead::session
