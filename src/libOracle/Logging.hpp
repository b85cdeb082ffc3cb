#pragma once

#include "Logger/Logger.hpp"

namespace lookahead::oracle {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace lookahead::oracle
