#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../input_state.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// Creates the DebugPanel resource with the "Engine" rows and adds the F3
// overlay to the Render phase. Install right after EventBusModule: every
// later module adds its own rows through world.try_resource<DebugPanel>().
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        DebugPanel panel;

        panel.watch("Engine", "FPS", []() {
            return std::to_string(GetFPS());
        });
        panel.watch("Engine", "Frame / Step", [&world]() {
            auto* sim = world.try_resource<SimulationSettings>();
            char b[32];
            std::snprintf(b, sizeof(b), "%d ms / %d ms", (int)(GetFrameTime() * 1000),
                          sim ? (int)(sim->fixed_dt * 1000) : 0);
            return std::string(b);
        });
        panel.watch("Engine", "Entities", [&world]() {
            return std::to_string(world.count());
        });
        panel.watch("Engine", "Event Queues", [&world]() {
            auto* reg = world.try_resource<EventRegistry>();
            return reg ? std::to_string(reg->queue_count()) : std::string("-");
        });
        panel.watch("Engine", "Gamepads", [&world]() {
            auto* rec = world.try_resource<InputRecord>();
            return rec ? std::to_string(rec->gamepads.size()) : std::string("0");
        });
        panel.watch("Engine", "Cursor", []() {
            return IsCursorHidden() ? std::string("Locked") : std::string("Free (Tab)");
        });

        world.set_resource(std::move(panel));
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); });
    }
};
