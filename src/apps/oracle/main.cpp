#include "Logging.hpp"
#include "game/ticTacToe.hpp"
#include "network/protocol.hpp"
#include "oracle/oracleServer.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace lookahead;

static constexpr char USAGE[] = "Usage: lookahead-oracle [port] [--render-delay-ms N]\n"
                                "  port                  Port to listen on. Defaults to 12345.\n"
                                "  --render-delay-ms N   Delay every render reply by N milliseconds.\n"
                                "Type 'quit' or 'exit' to stop the service.\n";

struct Options {
	std::uint16_t port{network::DEFAULT_PORT};
	std::chrono::milliseconds renderDelay{0};
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
	bool portSet = false;

	for (int i = 1; i < argc; ++i) {
		const std::string_view arg{argv[i]};
		if (arg == "--render-delay-ms") {
			if (i + 1 == argc) {
				return std::nullopt;
			}
			const auto delay = parseNumber(argv[++i]);
			if (!delay) {
				return std::nullopt;
			}
			options.renderDelay = std::chrono::milliseconds(*delay);
			continue;
		}

		const auto port = parseNumber(arg);
		if (portSet || !port || *port == 0u || *port > 65535u) {
			return std::nullopt;
		}
		options.port = static_cast<std::uint16_t>(*port);
		portSet      = true;
	}
	return options;
}

int main(int argc, char** argv) {
	const auto options = parseOptions(argc, argv);
	if (!options) {
		std::cerr << USAGE;
		return EXIT_FAILURE;
	}

	game::TicTacToe engine;
	std::optional<oracle::OracleServer> server;
	try {
		server.emplace(engine, options->port, options->renderDelay);
	} catch (const std::exception& e) {
		app::Logger().Log(Logging::LogLevel::Error, std::format("[Oracle] Cannot listen on port {}: {}", options->port, e.what()));
		std::cerr << std::format("Cannot listen on port {}: {}\n", options->port, e.what());
		return EXIT_FAILURE;
	}

	server->start();
	app::Logger().Log(Logging::LogLevel::Info, std::format("[Oracle] Serving {} on port {}.", engine.name(), server->port()));

	// Keep the service alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
	}

	server->stop();
	app::Logger().Log(Logging::LogLevel::Info, "[Oracle] Stopped.");
	return EXIT_SUCCESS;
}
