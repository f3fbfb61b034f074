#pragma once
#include <ecs/ecs.hpp>
#include "../events.hpp"
#include "../input_state.hpp"

// Whether each action was down at the end of the previous frame. World
// resource, created by PlayerInputSystem on first use.
struct ButtonHoldState {
    bool held[kButtonCount] = {false};
};

// Translates the InputRecord into the player's axis samples (PlayerInput) and
// button edges (Events<ButtonEvent>). Pre-Update phase, after InputGather.
class PlayerInputSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Collapses every binding of an action into one level and sends an edge
    // when that level changes. A press and release inside one frame (down
    // never observed) still sends both edges.
    static void emit_button_edges(const InputRecord& record,
                                  ButtonHoldState& hold,
                                  Events<ButtonEvent>& out);
};
