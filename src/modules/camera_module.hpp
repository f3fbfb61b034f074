#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../math_util.hpp"
#include "../pipeline.hpp"
#include "../systems/look.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// CameraModule
//
// Creates the MainCamera world resource (the pitch collaborator), adds
// LookSystem to the Logic phase and registers "Camera" debug rows.
//
// install() must run before the scene is loaded: the controller hook checks
// for MainCamera when the player spawns.
// ---------------------------------------------------------------------------

struct CameraModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(MainCamera{});
        pipeline.add_logic([](ecs::World& w, float dt) { LookSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Camera", "Pitch", [&world]() {
                auto* cam = world.try_resource<MainCamera>();
                if (!cam) return std::string("-");
                // Raw value first; the wrapped angle is what the view shows.
                char b[48];
                std::snprintf(b, sizeof(b), "%.1f deg (%.1f)", cam->pitch_degrees,
                              fpc::math::wrap_degrees(cam->pitch_degrees));
                return std::string(b);
            });
            panel->watch("Camera", "Eye", [&world]() {
                auto* cam = world.try_resource<MainCamera>();
                if (!cam) return std::string("-");
                char b[48];
                std::snprintf(b, sizeof(b), "%.2f, %.2f, %.2f",
                              cam->position.x, cam->position.y, cam->position.z);
                return std::string(b);
            });
            panel->watch("Camera", "Forward", [&world]() {
                auto* cam = world.try_resource<MainCamera>();
                if (!cam) return std::string("-");
                char b[48];
                std::snprintf(b, sizeof(b), "%.2f, %.2f, %.2f",
                              cam->view_forward.x, cam->view_forward.y, cam->view_forward.z);
                return std::string(b);
            });
        }
    }
};
