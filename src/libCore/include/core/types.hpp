#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lookahead {

//! Players are identified by a single character, e.g. 'X' and 'O'.
using Player = char;

//! Marks a move that ends the game.
struct GameEnd {
	std::string winners; //!< Winning players. Empty for a draw.
};

//! Serialized game state together with the player to move.
struct GameState {
	std::string board;
	Player player{};
};

//! One legal move of a position, as listed by the rule engine.
struct MoveOption {
	std::string id;                //!< Identifier typed by the user. Unique within one move list.
	std::string resultingState;    //!< Serialized state after the move.
	Player resultingPlayer{};      //!< Player to move after the move.
	std::optional<GameEnd> end{};  //!< Set if the move ends the game.
};

//! Returns the move with the given id or nullptr.
inline const MoveOption* findMove(const std::vector<MoveOption>& moves, std::string_view id) {
	for (const auto& move: moves) {
		if (move.id == id) {
			return &move;
		}
	}
	return nullptr;
}

} // namespace lookahead
