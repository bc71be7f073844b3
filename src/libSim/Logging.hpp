#pragma once

#include "Logger/Logger.hpp"

namespace shutbox::sim {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace shutbox::sim
