#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lookahead::oracle {

//! Address of a render oracle service.
struct Endpoint {
	std::string host;
	std::uint16_t port{};
};

//! Parses "host", "host:port" or ":port". Missing parts fall back to 127.0.0.1 and the default port.
std::optional<Endpoint> parseEndpoint(std::string_view text);

} // namespace lookahead::oracle
