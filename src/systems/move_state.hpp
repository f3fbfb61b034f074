#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"
#include "../events.hpp"
#include <functional>

// Owns the movement state machine: crouch / sprint / walk transitions and the
// jump latch. Consumes ButtonEvents in the Logic phase, after input.
class MoveStateSystem {
public:
    // Lazily evaluated so the physics probe only runs when a transition
    // actually depends on it.
    using GroundCheck = std::function<bool()>;

    // Attaches MovementState to every controlled entity and reports missing
    // collaborators once.
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);

    // Downward probe from the body centre. False when the entity has no body
    // or there is no physics context.
    static bool is_grounded(ecs::World& world, ecs::Entity e);

    // Pure functions below (no Jolt). Exposed for unit testing.

    static float speed_multiplier(MoveState state);

    // Toggle + press:   state = (state == desired) ? Running : desired
    // Hold:             state = pressed ? desired : Running
    // Toggle + release: no change
    static MoveState next_state(MoveState current, bool pressed,
                                InputMode mode, MoveState desired);

    // Applies one edge of a crouch / sprint / walk / jump button. Entering
    // Crouching requires is_grounded(); leaving it does not.
    // Returns true when MoveState changed.
    static bool apply_button(const ButtonEvent& ev,
                             const PlayerControllerConfig& cfg,
                             MovementState& movement,
                             const GroundCheck& is_grounded);

    static const char* to_string(MoveState state);
    static const char* to_string(InputMode mode);
};
