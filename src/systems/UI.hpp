#pragma once

#include <cstddef>
#include <flecs.h>
#include <imgui.h>
#include <raylib-cpp.hpp>
#include <rlImGui.h>
#include <string>

#include "../components/Components.hpp"
#include "../core/Config.hpp"
#include "../core/Constants.hpp"
#include "../core/Errors.hpp"
#include "../core/Scenario.hpp"
#include "Camera.hpp"
#include "Diagnostics.hpp"
#include "Physics.hpp"

namespace gravsim {

class UI {
public:
    static void begin() { rlImGuiBegin(); }
    static void end() { rlImGuiEnd(); }

    static void draw(const flecs::world& w) {
        auto* cfg = w.get_mut<Config>();
        auto* state = w.get_mut<SimulationState>();
        if (!cfg || !state || !cfg->ui_visible) return;

        draw_controls_panel(w, *cfg, state->sim);
        draw_diagnostics_panel(w, state->sim);
    }

private:
    static void draw_controls_panel(const flecs::world& w, Config& cfg, Simulation& sim) {
        ImGui::SetNextWindowPos(ImVec2(5, 5), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(260, 0), ImGuiCond_FirstUseEver);
        ImGui::Begin("Simulation");

        const std::string current{integrator_name(sim.integrator())};
        if (ImGui::BeginCombo("Algorithm", current.c_str())) {
            for (const Integrator candidate : all_integrators) {
                const std::string label{integrator_name(candidate)};
                if (ImGui::Selectable(label.c_str(), candidate == sim.integrator())) sim.set_integrator(candidate);
            }
            ImGui::EndCombo();
        }

        const std::string solution{solution_names[static_cast<std::size_t>(cfg.solution)]};
        if (ImGui::BeginCombo("Solution", solution.c_str())) {
            for (std::size_t k = 0; k < solution_names.size(); ++k) {
                const std::string label{solution_names[k]};
                if (ImGui::Selectable(label.empty() ? " " : label.c_str(), static_cast<int>(k) == cfg.solution)) {
                    cfg.solution = static_cast<int>(k);
                    Physics::apply_solution(w, static_cast<Solution>(k));
                    Camera::reset_view(w);
                }
            }
            ImGui::EndCombo();
        }

        auto g = static_cast<float>(sim.gravitational_constant());
        if (ImGui::SliderFloat("G", &g, constants::g_min, constants::g_max, "G = %.2f", ImGuiSliderFlags_AlwaysClamp)) {
            try {
                sim.set_gravitational_constant(static_cast<double>(g));
            } catch (const SimulationError& e) {
                TraceLog(LOG_WARNING, "G unchanged: %s", e.what());
            }
        }

        ImGui::SliderFloat("Max dt", &cfg.max_frame_dt, constants::max_frame_dt_min, constants::max_frame_dt_max,
                           "%.3f", ImGuiSliderFlags_AlwaysClamp);
        ImGui::Checkbox("Trails", &cfg.draw_trails);
        ImGui::SameLine();
        ImGui::SliderInt("Length", &cfg.trail_max, 0, constants::trail_length_max);

        if (ImGui::Button(sim.is_running() ? "Pause" : "Play")) sim.toggle_running();
        ImGui::SameLine();
        if (ImGui::Button("Zero Net Momentum")) Physics::zero_net_momentum(w);
        ImGui::SameLine();
        if (ImGui::Button("Reset")) {
            Physics::apply_solution(w, static_cast<Solution>(cfg.solution));
            Camera::reset_view(w);
        }
        ImGui::Text("Frame: %.3f ms", cfg.last_step_ms);
        ImGui::End();
    }

    static void draw_diagnostics_panel(const flecs::world& w, const Simulation& sim) {
        ImGui::SetNextWindowPos(ImVec2(5, 230), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(260, 0), ImGuiCond_FirstUseEver);
        ImGui::Begin("Diagnostics");
        const auto* d = w.get<Diagnostics>();
        ImGui::Text("t = %.3f  bodies = %zu", sim.time(), sim.size());
        if (d) {
            ImGui::Text("E = %.6f (K %.4f, U %.4f)", d->energy, d->kinetic, d->potential);
            ImGui::Text("P = (%.2e, %.2e, %.2e)", d->momentum.x, d->momentum.y, d->momentum.z);
            ImGui::Text("Lz = %.6f", d->angular_momentum);
            ImGui::Text("COM = (%.4f, %.4f, %.4f)", d->com.x, d->com.y, d->com.z);
            if (!d->ok) ImGui::TextColored(ImVec4(1, 0.3F, 0.3F, 1), "Non-finite state, paused");
        }
        ImGui::End();
    }
};

}  // namespace gravsim
