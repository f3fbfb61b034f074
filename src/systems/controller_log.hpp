#pragma once
#include <ecs/ecs.hpp>

// Running totals shown by the debug overlay.
struct ControllerStats {
    int state_changes        = 0;
    int primary_interacts    = 0;
    int secondary_interacts  = 0;
};

// Consumes MoveStateChangedEvent / InteractionEvent, logs them and updates
// ControllerStats. Must run after MoveStateSystem and InteractionSystem.
class ControllerLogSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Zeroes the totals. Called when the scene is reloaded.
    static void reset(ecs::World& world);
};
