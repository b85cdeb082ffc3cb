#include "oracle/endpoint.hpp"

#include "network/protocol.hpp"

#include <charconv>

namespace lookahead::oracle {

static constexpr std::string_view DEFAULT_HOST = "127.0.0.1";

std::optional<Endpoint> parseEndpoint(std::string_view text) {
	Endpoint endpoint{.host = std::string{DEFAULT_HOST}, .port = network::DEFAULT_PORT};

	const auto colon = text.rfind(':');
	const auto host  = text.substr(0, colon);
	if (!host.empty()) {
		endpoint.host = std::string{host};
	}

	if (colon != std::string_view::npos) {
		const auto portText = text.substr(colon + 1);
		unsigned port{};
		const auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
		if (ec != std::errc{} || ptr != portText.data() + portText.size() || port == 0u || port > 65535u) {
			return std::nullopt;
		}
		endpoint.port = static_cast<std::uint16_t>(port);
	}

	return endpoint;
}

} // namespace lookahead::oracle
