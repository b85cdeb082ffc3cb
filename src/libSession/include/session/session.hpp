#pragma once

#include "core/IRenderOracle.hpp"
#include "core/types.hpp"
#include "session/terminalRenderer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lookahead::session {

inline constexpr std::string_view PROMPT = "? ";

//! A render request was issued and its reply is still outstanding.
struct PendingPreview {
	RenderTicket ticket;
};

//! A rendered preview. Only shown while renderedFor equals the typed prefix.
struct ReadyPreview {
	std::string text;
	std::size_t lineCount{};
	std::string renderedFor;
};

using PreviewState = std::variant<PendingPreview, ReadyPreview>;

//! Extent of a repainted region, needed to clear it on the next repaint.
struct RenderedRegion {
	Line startLine{};
	std::size_t previousLineCount{};
};

//! State of one move selection round. Only the SessionController mutates it.
struct Session {
	std::string boardState;
	Player currentPlayer{};
	std::vector<MoveOption> legalMoves; //!< Fixed for the round.
	std::string typedPrefix;
	std::optional<PreviewState> preview;

	Line moveListLine{1u};
	RenderedRegion previewRegion;
	std::size_t maxPreviewLines{}; //!< Tallest preview shown in this round.
	std::optional<Line> messageLine; //!< Line of the invalid selection message, if one is shown.

	Line queryLine() const {
		return moveListLine + 1u;
	}
	Line previewLine() const {
		return moveListLine + 2u;
	}
};

//! Start a round for the given position. The move list is drawn at moveListLine, the query line below it.
Session makeSession(const GameState& state, std::vector<MoveOption> legalMoves, Line moveListLine);

struct Committed {
	MoveOption move;
};
struct Quit {};

using Outcome = std::variant<Committed, Quit>;

} // namespace lookahead::session
