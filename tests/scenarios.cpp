#include <cassert>
#include <cmath>
#include <raylib.h>
#include <vector>

#include "../src/core/Errors.hpp"
#include "../src/core/Scenario.hpp"
#include "../src/physics/Simulation.hpp"

using gravsim::DVec3;
using gravsim::Scenario;
using gravsim::Simulation;

namespace {

bool near(const DVec3& a, const DVec3& b, const double tol) { return gravsim::length(a - b) <= tol; }

Simulation load(const Scenario& s) {
    Simulation sim;
    gravsim::apply_scenario(sim, s);
    return sim;
}

// Every body of a rigidly rotating preset needs centripetal acceleration v^2/r toward the origin.
void check_circular(const Simulation& sim, const double tol) {
    for (std::size_t i = 0; i < sim.size(); ++i) {
        const gravsim::BodyState& s = sim.body(i).state;
        const double r = gravsim::length(s.position);
        if (r == 0.0) {
            assert(gravsim::length(sim.compute_acceleration(i)) < tol);
            continue;
        }
        const double v2 = gravsim::length2(s.velocity);
        const DVec3 expected = s.position * (-v2 / (r * r));
        assert(near(sim.compute_acceleration(i), expected, tol));
        // Velocity is tangential
        assert(std::abs(gravsim::dot(s.position, s.velocity)) < tol);
    }
}

void test_default_scene() {
    const Scenario s = gravsim::default_scenario();
    assert(s.g == gravsim::constants::default_g);
    assert(s.bodies.size() == 3);
    for (const gravsim::BodySnapshot& b : s.bodies) assert(b.mass == 1.0);
    assert((s.bodies[0].position == DVec3{}) && (s.bodies[0].velocity == DVec3{}));
    assert((s.bodies[1].position == DVec3{1.0, 0.0, 0.0}));
    assert((s.bodies[2].position == DVec3{-1.0, 0.0, 0.0}));
    assert(near(s.bodies[1].velocity, DVec3{0.0, 1.0, 0.0}, 1e-15));
    assert(near(s.bodies[2].velocity, DVec3{0.0, -1.0, 0.0}, 1e-15));
}

void test_presets_are_circular() {
    check_circular(load(gravsim::euler_collinear(0.8)), 1e-12);
    check_circular(load(gravsim::euler_collinear(1.3, 2.0)), 1e-12);
    check_circular(load(gravsim::lagrange_triangle(0.8)), 1e-12);
    check_circular(load(gravsim::lagrange_triangle(2.0, 0.5)), 1e-12);

    const Simulation lagrange = load(gravsim::lagrange_triangle(0.8));
    assert(gravsim::length(lagrange.linear_momentum()) < 1e-12);
    assert(gravsim::length(lagrange.center_of_mass()) < 1e-12);
}

void test_figure_eight() {
    const Simulation sim = load(gravsim::figure_eight(1.0));
    assert(gravsim::length(sim.linear_momentum()) < 1e-15);
    assert(gravsim::length(sim.center_of_mass()) < 1e-15);

    // Velocities scale with sqrt(G)
    const Scenario slow = gravsim::figure_eight(1.0);
    const Scenario fast = gravsim::figure_eight(4.0);
    for (std::size_t i = 0; i < 3; ++i) {
        assert((fast.bodies[i].position == slow.bodies[i].position));
        assert(near(fast.bodies[i].velocity, slow.bodies[i].velocity * 2.0, 1e-15));
    }

    // Returns to its start after one period (T ~ 6.3259 at G = 1)
    Simulation run = load(gravsim::figure_eight(1.0));
    run.set_integrator(gravsim::Integrator::RungeKutta4);
    const std::vector<gravsim::Body> start = run.bodies();
    for (int i = 0; i < 6326; ++i) run.step(1e-3);
    for (std::size_t i = 0; i < 3; ++i) {
        assert(near(run.body(i).state.position, start[i].state.position, 5e-3));
    }
}

void test_make_solution() {
    assert(gravsim::solution_names.size() == 4);
    assert(gravsim::make_solution(gravsim::Solution::Euler, 0.8).name == "Euler");
    assert(gravsim::make_solution(gravsim::Solution::Lagrange, 0.8).name == "Lagrange");
    assert(gravsim::make_solution(gravsim::Solution::FigureEight, 0.8).name == "Figure-8");
    bool threw = false;
    try {
        static_cast<void>(gravsim::make_solution(gravsim::Solution::None, 0.8));
    } catch (const gravsim::InvalidArgument&) {
        threw = true;
    }
    assert(threw);
}

void test_snapshot_and_apply() {
    Simulation sim(1.1);
    sim.set_integrator(gravsim::Integrator::ModifiedEuler);
    sim.add_body(2.0, {0.3, 0.0, 0.0}, {0.0, 0.4, 0.0});
    sim.add_body(1.0, {-0.6, 0.0, 0.0}, {0.0, -0.8, 0.0});
    sim.step(0.01);

    const Scenario saved = gravsim::snapshot_from_simulation(sim, "pair", "two bodies");
    assert(saved.name == "pair" && saved.description == "two bodies");
    assert(saved.g == 1.1);
    assert(saved.integrator == gravsim::Integrator::ModifiedEuler);
    assert(saved.bodies.size() == 2);

    // Applying resets time but keeps the running flag
    Simulation target;
    target.set_running(false);
    target.step(0.5);
    gravsim::apply_scenario(target, saved);
    assert(target.time() == 0.0);
    assert(!target.is_running());
    assert(target.gravitational_constant() == 1.1);
    assert(target.integrator() == gravsim::Integrator::ModifiedEuler);
    assert(target.bodies() == sim.bodies());

    // A bad scenario is rejected without touching the simulation
    Scenario broken = saved;
    broken.bodies.push_back({0.0, {5.0, 0.0, 0.0}, {}});
    const std::vector<gravsim::Body> before = target.bodies();
    bool threw = false;
    try {
        gravsim::apply_scenario(target, broken);
    } catch (const gravsim::InvalidArgument&) {
        threw = true;
    }
    assert(threw);
    assert(target.bodies() == before);
}

}  // namespace

int main() {
    SetTraceLogLevel(LOG_WARNING);

    test_default_scene();
    test_presets_are_circular();
    test_figure_eight();
    test_make_solution();
    test_snapshot_and_apply();
    return 0;
}
