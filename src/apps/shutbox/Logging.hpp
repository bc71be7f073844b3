#pragma once

#include "Logger/Logger.hpp"

namespace shutbox::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace shutbox::app
