#pragma once

#include "Logger/Logger.hpp"

namespace lookahead::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace lookahead::network
