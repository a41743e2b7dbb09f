#include <algorithm>
#include <cassert>
#include <cmath>
#include <raylib.h>

#include "../src/physics/Simulation.hpp"
#include "../src/systems/Diagnostics.hpp"

namespace {

constexpr double kG = 1.0;
constexpr double kMass = 1.0;
constexpr double kRadius = 1.0;
constexpr double kDt = 1e-3;
constexpr int kSteps = 10000;

// Equal masses at separation 2r orbiting their common center: v^2 = G m / (4 r).
gravsim::Simulation make_circular_pair() {
    gravsim::Simulation sim(kG);
    const double v = std::sqrt(kG * kMass / (4.0 * kRadius));
    sim.add_body(kMass, {kRadius, 0.0, 0.0}, {0.0, v, 0.0});
    sim.add_body(kMass, {-kRadius, 0.0, 0.0}, {0.0, -v, 0.0});
    return sim;
}

struct RunResult {
    double max_radius_drift = 0.0;
    double final_radius_drift = 0.0;
    double max_energy_drift = 0.0;
    bool radius_non_decreasing = true;
    gravsim::Diagnostics start{};
    gravsim::Diagnostics end{};
};

RunResult run(const gravsim::Integrator integrator) {
    gravsim::Simulation sim = make_circular_pair();
    sim.set_integrator(integrator);

    RunResult out;
    out.start = gravsim::compute_diagnostics(sim);
    double prev = kRadius;
    for (int i = 0; i < kSteps; ++i) {
        sim.step(kDt);
        const double r = gravsim::length(sim.body(0).state.position);
        out.max_radius_drift = std::max(out.max_radius_drift, std::abs(r - kRadius));
        if (r < prev - 1e-12) out.radius_non_decreasing = false;
        prev = r;
        const double e = sim.total_energy();
        out.max_energy_drift =
            std::max(out.max_energy_drift, std::abs(e - out.start.energy) / std::abs(out.start.energy));
    }
    out.final_radius_drift = std::abs(prev - kRadius);
    out.end = gravsim::compute_diagnostics(sim);
    return out;
}

}  // namespace

int main() {
    SetTraceLogLevel(LOG_WARNING);

    const RunResult euler = run(gravsim::Integrator::Euler);
    const RunResult si = run(gravsim::Integrator::SemiImplicitEuler);

    assert(euler.start.ok && euler.end.ok && si.end.ok);

    // Both stay near the circle at small dt
    assert(euler.max_radius_drift < 1e-2);
    assert(si.max_radius_drift < 1e-3);

    // Forward Euler spirals outward, and faster than semi-implicit Euler
    assert(euler.radius_non_decreasing);
    assert(euler.final_radius_drift > 1e-3);
    assert(euler.final_radius_drift > si.max_radius_drift);

    // Energy: bounded drift, tighter for semi-implicit Euler
    assert(euler.max_energy_drift < 1e-2);
    assert(si.max_energy_drift < 1e-4);
    assert(si.max_energy_drift < euler.max_energy_drift);

    // Momentum of an isolated pair stays at zero
    for (const RunResult* r : {&euler, &si}) {
        const double pxDiff = std::abs(r->end.momentum.x - r->start.momentum.x);
        const double pyDiff = std::abs(r->end.momentum.y - r->start.momentum.y);
        assert(pxDiff < 1e-6);
        assert(pyDiff < 1e-6);
    }
    return 0;
}
