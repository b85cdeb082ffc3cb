#pragma once

#include <stdexcept>
#include <string>

namespace lookahead {

//! The game service or render oracle failed or answered with unusable data.
class OracleError : public std::runtime_error {
public:
	explicit OracleError(const std::string& message) : std::runtime_error(message) {
	}
};

//! The terminal could not be configured, read or written.
class TerminalError : public std::runtime_error {
public:
	explicit TerminalError(const std::string& message) : std::runtime_error(message) {
	}
};

} // namespace lookahead
