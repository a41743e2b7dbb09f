#pragma once

#include <algorithm>
#include <cstddef>
#include <flecs.h>
#include <raylib-cpp.hpp>
#include <vector>

#include "../components/Components.hpp"
#include "../core/Colors.hpp"
#include "../core/Config.hpp"
#include "../core/Constants.hpp"

namespace gravsim::systems {

class WorldRenderer {
public:
    static void render_scene(const flecs::world& w, const Config& cfg, raylib::Camera2D& cam) {
        const auto* state = w.get<SimulationState>();
        if (!state) return;
        const Simulation& sim = state->sim;

        cam.BeginMode();

        if (cfg.draw_trails) {
            if (const auto* trails = w.get<Trails>()) {
                const std::size_t n = std::min(trails->points.size(), sim.size());
                for (std::size_t i = 0; i < n; ++i) draw_trail(trails->points[i], body_color(i));
            }
        }

        for (std::size_t i = 0; i < sim.size(); ++i) {
            const Body& b = sim.bodies()[i];
            DrawCircleV(fvec2(b.state.position), pixel_radius(b.mass) / cam.zoom, body_color(i));
        }

        EndMode2D();
    }

    // Screen radius in pixels; saturates for heavy bodies.
    static float pixel_radius(const double mass) {
        return static_cast<float>((constants::radius_mass_slope * mass + constants::radius_offset) /
                                  (mass + constants::radius_mass_bias));
    }

private:
    static void draw_trail(const std::vector<raylib::Vector2>& pts, const raylib::Color& tint) {
        for (std::size_t k = 1; k < pts.size(); ++k) {
            Color c = tint;
            const double denom = std::max(1.0, static_cast<double>(pts.size()));
            c.a = static_cast<unsigned char>(std::clamp(
                constants::trail_alpha_min + static_cast<int>(constants::trail_alpha_range * static_cast<double>(k) / denom),
                constants::trail_alpha_min, constants::trail_alpha_max));
            DrawLineV(pts[k - 1], pts[k], c);
        }
    }
};

}  // namespace gravsim::systems
