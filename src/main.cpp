#include <exception>
#include <flecs.h>
#include <imgui.h>
#include <raylib-cpp.hpp>
#include <raylib.h>
#include <rlImGui.h>

#include "components/Components.hpp"
#include "core/Config.hpp"
#include "core/Constants.hpp"
#include "core/Scenario.hpp"
#include "systems/Camera.hpp"
#include "systems/Diagnostics.hpp"
#include "systems/Physics.hpp"
#include "systems/UI.hpp"
#include "systems/WorldRenderer.hpp"

class Application {
public:
    Application() {
        SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_WINDOW_HIGHDPI | FLAG_MSAA_4X_HINT);
        InitWindow(gravsim::constants::window_width, gravsim::constants::window_height, "Three-Body Gravity");
        SetTargetFPS(gravsim::constants::target_fps);
        // Escape toggles the UI instead of closing the window
        SetExitKey(KEY_NULL);
        rlImGuiSetup(true);

        initialize_world();
    }

    ~Application() {
        rlImGuiShutdown();
        CloseWindow();
    }

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    void run() {
        while (!WindowShouldClose()) {
            update();
            render();
        }
    }

private:
    flecs::world world_;

    void initialize_world() const {
        // Initialize singleton components
        world_.set<Config>({});
        world_.set<SimulationState>({});
        world_.set<Trails>({});

        auto* state = world_.get_mut<SimulationState>();
        gravsim::apply_scenario(state->sim, gravsim::default_scenario());
        world_.set<gravsim::Diagnostics>(gravsim::compute_diagnostics(state->sim));

        // Register all systems
        gravsim::Camera::register_systems(world_);
        gravsim::Physics::register_systems(world_);
    }

    void update() const {
        const double frameStart = GetTime();

        auto* cfg = world_.get_mut<Config>();
        auto* state = world_.get_mut<SimulationState>();
        if (cfg == nullptr || state == nullptr) {
            return;
        }

        // UI first (this sets up ImGui state)
        gravsim::UI::begin();
        gravsim::UI::draw(world_);

        const ImGuiIO& imguiIO = ImGui::GetIO();
        if (!imguiIO.WantCaptureKeyboard) {
            if (IsKeyPressed(KEY_ESCAPE)) cfg->ui_visible = !cfg->ui_visible;
            if (IsKeyPressed(KEY_SPACE)) state->sim.toggle_running();
        }
        if (!imguiIO.WantCaptureMouse) {
            if (const float wheel = GetMouseWheelMove(); wheel != 0.0F) {
                gravsim::Camera::zoom_at_mouse(world_, wheel);
            }
        }

        // Physics clamps the frame time and skips the step while paused
        [[maybe_unused]] auto progress = world_.progress(GetFrameTime());

        // Track frame timing
        constexpr double kMsPerSec = 1000.0;
        cfg->last_step_ms = (GetTime() - frameStart) * kMsPerSec;
    }

    void render() {
        BeginDrawing();
        ClearBackground(gravsim::constants::background);

        raylib::Camera2D* camera = gravsim::Camera::get(world_);
        const auto* cfg = world_.get<Config>();
        if (camera != nullptr && cfg != nullptr) {
            gravsim::systems::WorldRenderer::render_scene(world_, *cfg, *camera);
        }

        // End UI frame and drawing (UI was started in update)
        gravsim::UI::end();
        EndDrawing();
    }
};

auto main() -> int {
    try {
        Application app;
        app.run();
        return 0;
    } catch (const std::exception& e) {
        TraceLog(LOG_ERROR, "Exception: %s", e.what());
        return 1;
    }
}
