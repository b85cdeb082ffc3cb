#include "oracle/messages.hpp"

#include <format>
#include <string_view>

namespace lookahead::oracle {

static constexpr char CMD_NEW    = 'n';
static constexpr char CMD_LIST   = 'l';
static constexpr char CMD_RENDER = 'r';
static constexpr char CMD_SELECT = 's';

static constexpr std::string_view RESP_NEW    = "NEW:";
static constexpr std::string_view RESP_LIST   = "LIST:";
static constexpr std::string_view RESP_TEXT   = "TEXT:\n";
static constexpr std::string_view RESP_SELECT = "SELECT:\n";
static constexpr std::string_view RESP_ERROR  = "ERROR:";

static constexpr char END_NONE = '-';
static constexpr char END_GAME = '=';

static std::string withBoard(char command, const std::string& board) {
	return std::format("{}/{}", command, board);
}

static std::string toMessage(const NewGameRequest&) {
	return withBoard(CMD_NEW, {});
}
static std::string toMessage(const ListMovesRequest& r) {
	return withBoard(CMD_LIST, r.board);
}
static std::string toMessage(const RenderRequest& r) {
	return withBoard(CMD_RENDER, r.board);
}
static std::string toMessage(const SelectRequest& r) {
	return withBoard(CMD_SELECT, r.board);
}

//! "<id>,<state>,<player>,<end>"
static std::string encodeMove(const MoveOption& move) {
	std::string end(1u, END_NONE);
	if (move.end) {
		end = std::format("{}{}", END_GAME, move.end->winners);
	}
	return std::format("{},{},{},{}", move.id, move.resultingState, move.resultingPlayer, end);
}

static std::optional<MoveOption> decodeMove(std::string_view line) {
	std::vector<std::string_view> fields;
	std::size_t start = 0;
	while (fields.size() != 3u) {
		const auto comma = line.find(',', start);
		if (comma == std::string_view::npos) {
			return std::nullopt;
		}
		fields.push_back(line.substr(start, comma - start));
		start = comma + 1;
	}
	const auto end = line.substr(start);

	if (fields[0].empty() || fields[1].empty() || fields[2].size() != 1u || end.empty()) {
		return std::nullopt;
	}

	MoveOption move{.id = std::string{fields[0]}, .resultingState = std::string{fields[1]}, .resultingPlayer = fields[2].front()};
	if (end.front() == END_GAME) {
		move.end = GameEnd{.winners = std::string{end.substr(1)}};
	} else if (end != std::string_view(&END_NONE, 1u)) {
		return std::nullopt;
	}
	return move;
}

static std::string toMessage(const NewGameResponse& r) {
	return std::format("{}{},{}", RESP_NEW, r.state.board, r.state.player);
}
static std::string toMessage(const ListMovesResponse& r) {
	std::string message{RESP_LIST};
	for (const auto& move: r.moves) {
		message.push_back('\n');
		message += encodeMove(move);
	}
	return message;
}
static std::string toMessage(const RenderResponse& r) {
	return std::format("{}{}", RESP_TEXT, r.text);
}
static std::string toMessage(const SelectResponse& r) {
	return std::format("{}{}", RESP_SELECT, encodeMove(r.move));
}
static std::string toMessage(const ErrorResponse& r) {
	return std::format("{}{}", RESP_ERROR, r.message);
}

std::string toMessage(const OracleRequest& request) {
	return std::visit([&](auto&& r) { return toMessage(r); }, request);
}

std::string toMessage(const OracleResponse& response) {
	return std::visit([&](auto&& r) { return toMessage(r); }, response);
}

std::optional<OracleRequest> fromRequestMessage(const std::string& message) {
	// Expect "<command>/<board>"
	if (message.size() < 2u || message[1] != '/') {
		return {};
	}

	const auto board = message.substr(2);
	switch (message[0]) {
	case CMD_NEW:
		return NewGameRequest{};
	case CMD_LIST:
		return ListMovesRequest{.board = board};
	case CMD_RENDER:
		return RenderRequest{.board = board};
	case CMD_SELECT:
		return SelectRequest{.board = board};
	default:
		return {};
	}
}

std::optional<OracleResponse> fromResponseMessage(const std::string& message) {
	const std::string_view view{message};

	if (view.starts_with(RESP_TEXT)) {
		return RenderResponse{.text = std::string{view.substr(RESP_TEXT.size())}};
	}

	if (view.starts_with(RESP_LIST)) {
		ListMovesResponse response;
		auto rest = view.substr(RESP_LIST.size());
		while (!rest.empty()) {
			if (rest.front() != '\n') {
				return {};
			}
			rest.remove_prefix(1);
			const auto lineEnd = rest.find('\n');
			const auto move    = decodeMove(rest.substr(0, lineEnd));
			if (!move || findMove(response.moves, move->id)) {
				return {};
			}
			response.moves.push_back(*move);
			rest = lineEnd == std::string_view::npos ? std::string_view{} : rest.substr(lineEnd);
		}
		return response;
	}

	if (view.starts_with(RESP_SELECT)) {
		const auto move = decodeMove(view.substr(RESP_SELECT.size()));
		if (!move) {
			return {};
		}
		return SelectResponse{.move = *move};
	}

	if (view.starts_with(RESP_NEW)) {
		// Expect "NEW:<board>,<player>"
		const auto payload = view.substr(RESP_NEW.size());
		const auto comma   = payload.rfind(',');
		if (comma == std::string_view::npos || comma == 0 || payload.size() - comma != 2u) {
			return {};
		}
		return NewGameResponse{.state = GameState{.board = std::string{payload.substr(0, comma)}, .player = payload.back()}};
	}

	if (view.starts_with(RESP_ERROR)) {
		return ErrorResponse{.message = std::string{view.substr(RESP_ERROR.size())}};
	}

	// Invalid
	return {};
}

} // namespace lookahead::oracle
