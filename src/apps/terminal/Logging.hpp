#pragma once

#include "Logger/Logger.hpp"

namespace reversi::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace reversi::app
