#pragma once

#include <cmath>

#include "../core/Errors.hpp"
#include "../physics/Simulation.hpp"

namespace gravsim {

struct Diagnostics {
    double kinetic = 0.0;
    double potential = 0.0;
    double energy = 0.0;
    DVec3 momentum{};
    double angular_momentum = 0.0;
    DVec3 com{};
    double total_mass = 0.0;
    bool ok = true;
};

// Snapshot of the conserved quantities. `ok` is false when the system is
// singular or any quantity is non-finite; an empty system is ok with zeros.
inline Diagnostics compute_diagnostics(const Simulation& sim) {
    Diagnostics out{};
    if (sim.empty()) return out;

    for (const Body& b : sim.bodies()) out.total_mass += b.mass;
    out.kinetic = sim.kinetic_energy();
    out.momentum = sim.linear_momentum();
    out.angular_momentum = sim.angular_momentum();
    out.com = sim.center_of_mass();
    try {
        out.potential = sim.potential_energy();
    } catch (const SingularConfiguration&) {
        out.ok = false;
        return out;
    }
    out.energy = out.kinetic + out.potential;

    out.ok = std::isfinite(out.kinetic) && std::isfinite(out.potential) && std::isfinite(out.energy) &&
        is_finite(out.momentum) && std::isfinite(out.angular_momentum) && is_finite(out.com) &&
        std::isfinite(out.total_mass);
    return out;
}

}  // namespace gravsim
