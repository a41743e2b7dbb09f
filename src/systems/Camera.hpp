#pragma once

#include <algorithm>
#include <flecs.h>
#include <raylib-cpp.hpp>
#include <raymath.h>

#include "../components/Components.hpp"
#include "../core/Constants.hpp"

namespace gravsim {

// Wraps the view camera as a singleton component. World units map to pixels
// so that view_height_units fill the window height, times a wheel zoom factor.
class Camera {
public:
    struct CameraComponent {
        raylib::Camera2D camera;
        float zoom_factor = 1.0F;
        CameraComponent() { init(camera, zoom_factor); }
    };

    static void init(raylib::Camera2D& cam, const float zoomFactor) {
        constexpr float kHalf = 0.5F;
        cam.offset = {static_cast<float>(GetScreenWidth()) * kHalf, static_cast<float>(GetScreenHeight()) * kHalf};
        cam.target = {0.0F, 0.0F};
        cam.rotation = 0.0F;
        cam.zoom = base_zoom() * zoomFactor;
    }

    static void register_systems(const flecs::world& world) {
        world.set<CameraComponent>({});

        // Keep the origin centered and the scale tied to the window height
        world.system<>().kind(flecs::PreUpdate).iter([&](flecs::iter&) {
            if (!IsWindowResized()) return;
            if (auto* c = world.get_mut<CameraComponent>()) {
                c->camera.offset = {static_cast<float>(GetScreenWidth()) * 0.5F,
                                    static_cast<float>(GetScreenHeight()) * 0.5F};
                c->camera.zoom = base_zoom() * c->zoom_factor;
            }
        });
    }

    static raylib::Camera2D* get(const flecs::world& world) {
        if (auto* c = world.get_mut<CameraComponent>()) return &c->camera;
        return nullptr;
    }

    static void zoom_at_mouse(const flecs::world& world, const float wheel) {
        auto* c = world.get_mut<CameraComponent>();
        if (!c || wheel == 0.0F) return;
        raylib::Camera2D& cam = c->camera;
        const raylib::Vector2 mouse = GetMousePosition();
        const raylib::Vector2 worldBefore = GetScreenToWorld2D(mouse, cam);
        c->zoom_factor = std::clamp(c->zoom_factor * (1.0F + wheel * constants::zoom_wheel_scale),
                                    constants::min_zoom_factor, constants::max_zoom_factor);
        cam.zoom = base_zoom() * c->zoom_factor;
        const raylib::Vector2 worldAfter = GetScreenToWorld2D(mouse, cam);
        cam.target = Vector2Add(cam.target, Vector2Subtract(worldBefore, worldAfter));
    }

    static void reset_view(const flecs::world& world) {
        if (auto* c = world.get_mut<CameraComponent>()) {
            c->zoom_factor = 1.0F;
            init(c->camera, c->zoom_factor);
        }
    }

private:
    static float base_zoom() {
        return static_cast<float>(static_cast<double>(GetScreenHeight()) / constants::view_height_units);
    }
};

}  // namespace gravsim
