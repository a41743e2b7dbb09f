#pragma once

#include <raylib-cpp.hpp>
#include <vector>

#include "../core/Vec3.hpp"
#include "../physics/Simulation.hpp"

// The simulation is a flecs singleton; bodies stay in its index-ordered list
// instead of being entities, since index is identity.
struct SimulationState {
    gravsim::Simulation sim;
};

// Trail history per body index
struct Trails {
    std::vector<std::vector<raylib::Vector2>> points;
};

// Projection onto the xy orbital plane.
inline raylib::Vector2 fvec2(const gravsim::DVec3& v) {
    return raylib::Vector2{static_cast<float>(v.x), static_cast<float>(v.y)};
}
