#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include "../systems/player_input.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Registers the ButtonEvent queue and adds InputGatherSystem and
// PlayerInputSystem to the Pre-Update phase. InputGather must precede
// PlayerInput (it writes the InputRecord that PlayerInput reads). Install
// after EventBusModule so both run after the per-frame flush.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.resource<EventRegistry>().register_queue<ButtonEvent>(world);

        pipeline.add_pre_update([](ecs::World& w, float) { InputGatherSystem::Update(w); });
        pipeline.add_pre_update([](ecs::World& w, float dt) { PlayerInputSystem::Update(w, dt); });
    }
};
