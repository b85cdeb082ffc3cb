#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace lookahead {

//! Blocking access to the rule engine. Implementations throw OracleError on failure.
class IGameService {
public:
	virtual ~IGameService() = default;

	virtual GameState fetchInitialState()                                = 0;
	virtual std::vector<MoveOption> listMoves(const std::string& board) = 0;
	virtual std::string render(const std::string& board)                = 0;
};

} // namespace lookahead
