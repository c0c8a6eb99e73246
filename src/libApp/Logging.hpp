#pragma once

#include "Logger/Logger.hpp"

namespace minigam::app {

//! Logger of the game engine. Sets up the outputs on first use.
//! \note Callers prefix entries with their component, e.g. "[TurnController] ...".
Logging::Logger Logger();

} // namespace minigam::app
