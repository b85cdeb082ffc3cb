#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lookahead::oracle {

// Requests (client -> oracle). The command character mirrors the service path, e.g. "r/XO-------".
struct NewGameRequest {};
struct ListMovesRequest {
	std::string board;
};
struct RenderRequest {
	std::string board;
};
struct SelectRequest {
	std::string board;
};

// Responses (oracle -> client)
struct NewGameResponse {
	GameState state;
};
struct ListMovesResponse {
	std::vector<MoveOption> moves;
};
struct RenderResponse {
	std::string text;
};
struct SelectResponse {
	MoveOption move; //!< Move the oracle would play.
};
struct ErrorResponse {
	std::string message;
};

using OracleRequest  = std::variant<NewGameRequest, ListMovesRequest, RenderRequest, SelectRequest>;
using OracleResponse = std::variant<NewGameResponse, ListMovesResponse, RenderResponse, SelectResponse, ErrorResponse>;

std::string toMessage(const OracleRequest& request);
std::string toMessage(const OracleResponse& response);

// Parse messages into typed values. Returns empty on invalid input.
std::optional<OracleRequest> fromRequestMessage(const std::string& message);
std::optional<OracleResponse> fromResponseMessage(const std::string& message);

} // namespace lookahead::oracle
