// src/core/Config.hpp
#pragma once

#include "Constants.hpp"

// Viewer policy stored in flecs as a singleton component. Physical parameters
// (G, integrator, running) live on the Simulation itself.
struct Config {
    // Time
    float max_frame_dt = gravsim::constants::max_frame_dt;  // frame dt is clamped to this before stepping

    // Visuals
    bool ui_visible = true;
    bool draw_trails = true;
    int trail_max = gravsim::constants::default_trail_max;

    // Index into gravsim::solution_names; 0 = none selected
    int solution = 0;

    // UI/runtime
    double last_step_ms = 0.0;
};
