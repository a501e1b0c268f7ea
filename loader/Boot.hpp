#pragma once

#include "loader/Orchestrator.hpp"

namespace loader {

// Process start: promotes the viewpoint rig found in the bootstrap segment
// to the permanent container, then loads and activates the main menu level.
// The bootstrap segment must already be loaded.
Signal Boot(Orchestrator &orchestrator, const LevelRegistry &registry);

} // namespace loader
