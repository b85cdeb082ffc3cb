#include "Logging.hpp"
#include "core/errors.hpp"
#include "game/localGameService.hpp"
#include "game/ticTacToe.hpp"
#include "oracle/endpoint.hpp"
#include "oracle/oracleClient.hpp"
#include "session/eventMultiplexer.hpp"
#include "session/gameDriver.hpp"
#include "session/sessionController.hpp"
#include "session/terminal.hpp"
#include "session/terminalRenderer.hpp"

#include <unistd.h>

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace lookahead;

static constexpr char USAGE[] = "Usage: lookahead [--local [--render-delay-ms N]] [host[:port]]\n"
                                "  --local                Play against the built-in rule engine instead of an oracle service.\n"
                                "  --render-delay-ms N    With --local, answer every preview after N milliseconds.\n"
                                "  host[:port]            Oracle service address. Defaults to $LOOKAHEAD_ORACLE, then 127.0.0.1.\n"
                                "Type the id of a move and press Enter to play it. Press 'q' to quit.\n";

struct Options {
	bool help{false};
	bool local{false};
	std::chrono::milliseconds renderDelay{0};
	std::optional<std::string> address;
};

static std::optional<unsigned> parseNumber(std::string_view text) {
	unsigned value{};
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || ptr != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

static std::optional<Options> parseOptions(int argc, char** argv) {
	Options options;
	for (int i = 1; i < argc; ++i) {
		const std::string_view arg{argv[i]};
		if (arg == "-h" || arg == "--help") {
			options.help = true;
		} else if (arg == "--local") {
			options.local = true;
		} else if (arg == "--render-delay-ms") {
			const auto delay = i + 1 < argc ? parseNumber(argv[++i]) : std::nullopt;
			if (!delay) {
				return std::nullopt;
			}
			options.renderDelay = std::chrono::milliseconds(*delay);
		} else if (arg.starts_with('-') || options.address) {
			return std::nullopt;
		} else {
			options.address = std::string{arg};
		}
	}

	if (options.renderDelay.count() > 0 && !options.local) {
		return std::nullopt;
	}

	if (!options.address) {
		if (const char* env = std::getenv("LOOKAHEAD_ORACLE")) {
			options.address = std::string{env};
		}
	}
	return options;
}

static int play(IGameService& service, IRenderOracle& oracle, session::TerminalRenderer& renderer, session::EventMultiplexer& events) {
	session::SessionController controller(renderer, oracle, events);
	session::GameDriver driver(service, controller, renderer);

	const auto result = driver.play();
	std::cout << std::endl;

	app::Logger().Log(Logging::LogLevel::Info, std::format("[Client] Finished on '{}'.", result.finalState.board));
	return EXIT_SUCCESS;
}

int main(int argc, char** argv) {
	const auto options = parseOptions(argc, argv);
	if (!options) {
		std::cerr << USAGE;
		return EXIT_FAILURE;
	}
	if (options->help) {
		std::cout << USAGE;
		return EXIT_SUCCESS;
	}

	try {
		// Declared before the services so that their reply threads are gone before the event source.
		session::TerminalHandle terminal(STDIN_FILENO, std::cout);
		session::TerminalRenderer renderer(terminal.output());
		session::EventMultiplexer events(terminal);

		if (options->local) {
			game::TicTacToe engine;
			game::LocalGameService service(engine, options->renderDelay);
			return play(service, service, renderer, events);
		}

		const auto endpoint = oracle::parseEndpoint(options->address.value_or(""));
		if (!endpoint) {
			std::cerr << std::format("Invalid oracle address '{}'.\n", options->address.value_or(""));
			return EXIT_FAILURE;
		}

		app::Logger().Log(Logging::LogLevel::Info, std::format("[Client] Using oracle at {}:{}.", endpoint->host, endpoint->port));
		oracle::OracleClient client(*endpoint);
		return play(client, client, renderer, events);
	} catch (const TerminalError& e) {
		app::Logger().Log(Logging::LogLevel::Error, std::format("[Client] Terminal failure: {}", e.what()));
		std::cerr << std::format("\nTerminal error: {}\n", e.what());
	} catch (const OracleError& e) {
		app::Logger().Log(Logging::LogLevel::Error, std::format("[Client] Oracle failure: {}", e.what()));
		std::cerr << std::format("\nOracle error: {}\n", e.what());
	}
	return EXIT_FAILURE;
}
