#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// EventBusModule
//
// Install first. Creates the EventRegistry that the input and player modules
// register their queues with, and clears every queue at the top of each
// frame.
//
// ButtonEvents therefore live for exactly one variable frame. The fixed
// tick never reads them; anything it needs (the jump request) is latched in
// MovementState by the Logic phase.
// ---------------------------------------------------------------------------

struct EventBusModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(EventRegistry{});
        pipeline.add_pre_update([](ecs::World& w, float) {
            if (auto* reg = w.try_resource<EventRegistry>()) reg->flush_all();
        });
    }
};
