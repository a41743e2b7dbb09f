#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <raylib.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../physics/Simulation.hpp"
#include "Constants.hpp"
#include "Errors.hpp"

namespace gravsim {

struct BodySnapshot {
    double mass = 1.0;
    DVec3 position{};
    DVec3 velocity{};
};

struct Scenario {
    std::string name;
    std::string description;
    std::vector<BodySnapshot> bodies;
    double g = constants::default_g;
    Integrator integrator = default_integrator;
};

// Known periodic three-body solutions offered by the viewer.
enum class Solution : std::uint8_t { None = 0, Euler = 1, Lagrange = 2, FigureEight = 3 };

inline constexpr std::array<std::string_view, 4> solution_names{"", "Euler", "Lagrange", "Figure-8"};

// Central body at rest with two partners on opposite sides; v^2 = G/r * 5/4.
inline Scenario euler_collinear(const double g, const double r = constants::default_orbit_radius) {
    const double v = std::sqrt(g / r * 5.0 / 4.0);
    Scenario s{};
    s.name = "Euler";
    s.description = "Collinear rigid rotation about a central body";
    s.g = g;
    s.bodies = {
        {1.0, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}},
        {1.0, {r, 0.0, 0.0}, {0.0, v, 0.0}},
        {1.0, {-r, 0.0, 0.0}, {0.0, -v, 0.0}},
    };
    return s;
}

// Equilateral triangle inscribed in a circle of radius r; v^2 = G/r * 1/sqrt(3).
inline Scenario lagrange_triangle(const double g, const double r = constants::default_orbit_radius) {
    const double v = std::sqrt(g / r / std::numbers::sqrt3);
    Scenario s{};
    s.name = "Lagrange";
    s.description = "Equilateral triangle rotating about its center";
    s.g = g;
    for (int k = 0; k < 3; ++k) {
        const double angle = 2.0 * std::numbers::pi * static_cast<double>(k) / 3.0;
        const double c = std::cos(angle);
        const double sn = std::sin(angle);
        s.bodies.push_back({1.0, {r * c, r * sn, 0.0}, {-v * sn, v * c, 0.0}});
    }
    return s;
}

// Chenciner-Montgomery choreography. The G = 1 velocities scale with sqrt(G).
inline Scenario figure_eight(const double g) {
    const double k = std::sqrt(g);
    const DVec3 p{constants::figure8_x, constants::figure8_y, 0.0};
    const DVec3 v3 = DVec3{constants::figure8_vx, constants::figure8_vy, 0.0} * k;
    Scenario s{};
    s.name = "Figure-8";
    s.description = "Three equal masses chasing each other along a figure eight";
    s.g = g;
    s.bodies = {
        {1.0, p, v3 * -0.5},
        {1.0, -p, v3 * -0.5},
        {1.0, {0.0, 0.0, 0.0}, v3},
    };
    return s;
}

inline Scenario make_solution(const Solution solution, const double g) {
    switch (solution) {
        case Solution::Euler: return euler_collinear(g);
        case Solution::Lagrange: return lagrange_triangle(g);
        case Solution::FigureEight: return figure_eight(g);
        case Solution::None: break;
    }
    throw InvalidArgument("make_solution: no preset for solution #" + std::to_string(static_cast<int>(solution)));
}

inline Scenario default_scenario() { return euler_collinear(constants::default_g); }

inline Scenario snapshot_from_simulation(const Simulation& sim, const std::string& name, const std::string& desc) {
    Scenario s{};
    s.name = name;
    s.description = desc;
    s.g = sim.gravitational_constant();
    s.integrator = sim.integrator();
    for (const Body& b : sim.bodies()) s.bodies.push_back(BodySnapshot{b.mass, b.state.position, b.state.velocity});
    return s;
}

// Replaces bodies, G and integrator, and resets time. The running flag is kept.
// Either the whole scenario is applied or sim is left untouched.
inline void apply_scenario(Simulation& sim, const Scenario& s) {
    Simulation next(s.g);
    next.set_integrator(s.integrator);
    for (const BodySnapshot& b : s.bodies) next.add_body(b.mass, b.position, b.velocity);
    next.set_running(sim.is_running());
    sim = std::move(next);
    TraceLog(LOG_INFO, "gravsim: applied scenario '%s' (%zu bodies, G=%.2f)", s.name.c_str(), s.bodies.size(), s.g);
}

}  // namespace gravsim
