#pragma once

#include "Logger/Logger.hpp"

namespace lookahead::session {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace lookahead::session
