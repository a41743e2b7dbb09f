#pragma once

#include <algorithm>
#include <cstddef>
#include <flecs.h>
#include <raylib-cpp.hpp>

#include "../components/Components.hpp"
#include "../core/Config.hpp"
#include "../core/Errors.hpp"
#include "../core/Scenario.hpp"
#include "Diagnostics.hpp"
#include "FrameStep.hpp"

namespace gravsim {

class Physics {
public:
    static void register_systems(const flecs::world& w) {
        // Integration: once per frame using the clamped it.delta_time
        w.system<>().kind(flecs::OnUpdate).iter([&](const flecs::iter& it) {
            const Config* cfg = w.get<Config>();
            auto* state = w.get_mut<SimulationState>();
            if (!cfg || !state) return;
            advance_frame(state->sim, static_cast<double>(it.delta_time()), static_cast<double>(cfg->max_frame_dt));
        });

        // Diagnostics: pause when conserved quantities stop being finite
        w.system<>().kind(flecs::OnUpdate).iter([&](flecs::iter&) {
            auto* state = w.get_mut<SimulationState>();
            if (!state || !state->sim.is_running()) return;
            const Diagnostics d = compute_diagnostics(state->sim);
            w.set<Diagnostics>(d);
            if (!d.ok) {
                TraceLog(LOG_WARNING, "Simulation paused: non-finite diagnostics at t=%.3f", state->sim.time());
                state->sim.set_running(false);
            }
        });

        // Trails update after integration
        w.system<>().kind(flecs::OnUpdate).iter([&](flecs::iter&) {
            const Config* cfg = w.get<Config>();
            const auto* state = w.get<SimulationState>();
            auto* trails = w.get_mut<Trails>();
            if (!cfg || !state || !trails || !state->sim.is_running()) return;
            update_trails(*cfg, state->sim, *trails);
        });
    }

    // Loads a preset (or the default scene for Solution::None) at the current G.
    static void apply_solution(const flecs::world& w, const Solution solution) {
        auto* state = w.get_mut<SimulationState>();
        if (!state) return;
        const double g = state->sim.gravitational_constant();
        Scenario s = (solution == Solution::None) ? default_scenario() : make_solution(solution, g);
        s.g = g;
        s.integrator = state->sim.integrator();
        apply_scenario(state->sim, s);
        if (auto* trails = w.get_mut<Trails>()) trails->points.clear();
        w.set<Diagnostics>(compute_diagnostics(state->sim));
    }

    static void zero_net_momentum(const flecs::world& w) {
        auto* state = w.get_mut<SimulationState>();
        // An empty scene has nothing to recenter; the button is a no-op there.
        if (!state || state->sim.empty()) return;
        state->sim.zero_net_momentum();
    }

private:
    static void update_trails(const Config& cfg, const Simulation& sim, Trails& trails) {
        const std::size_t n = sim.size();
        trails.points.resize(n);
        if (!cfg.draw_trails) return;
        const auto maxLen = static_cast<std::size_t>(std::max(0, cfg.trail_max));
        for (std::size_t i = 0; i < n; ++i) {
            auto& pts = trails.points[i];
            pts.push_back(fvec2(sim.bodies()[i].state.position));
            if (pts.size() > maxLen) pts.erase(pts.begin(), pts.begin() + static_cast<std::ptrdiff_t>(pts.size() - maxLen));
        }
    }
};

}  // namespace gravsim
