#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lookahead::game {

//! Rules of one turn-based game, operating on serialized states.
class IRuleEngine {
public:
	virtual ~IRuleEngine() = default;

	virtual std::string_view name() const = 0;

	//! State a fresh game starts from.
	virtual GameState initialState() const = 0;

	//! Validate a serialized board and derive the player to move. Empty if the board is invalid.
	virtual std::optional<GameState> parseState(std::string_view board) const = 0;

	//! Moves available from the state, in display order. Empty once the game is over.
	virtual std::vector<MoveOption> moves(const GameState& state) const = 0;

	//! Human readable depiction of the board. Every line is terminated by '\n'.
	virtual std::string renderToText(const GameState& state) const = 0;
};

} // namespace lookahead::game
