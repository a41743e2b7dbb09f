#pragma once

#include <algorithm>
#include <raylib.h>

#include "../core/Errors.hpp"
#include "../physics/Simulation.hpp"

namespace gravsim {

// One frame of integration: clamps the frame time to max_dt and steps if running.
// A rejected step pauses the simulation instead of propagating. Returns true if
// the simulation advanced.
inline bool advance_frame(Simulation& sim, const double frame_dt, const double max_dt) {
    if (!sim.is_running()) return false;
    const double dt = std::min(frame_dt, max_dt);
    try {
        sim.step(dt);
    } catch (const SimulationError& e) {
        TraceLog(LOG_WARNING, "Simulation paused: %s", e.what());
        sim.set_running(false);
        return false;
    }
    return true;
}

}  // namespace gravsim
