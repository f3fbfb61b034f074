#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"

// Forwards player motion to the Jolt body on every fixed tick: a direct
// position delta for walking, a one-off upward impulse for a latched jump.
// Runs in the Physics phase, before PhysicsSystem steps the simulation.
class PlayerMotorSystem {
public:
    static void Update(ecs::World& world, float fixed_dt);

    // Pure displacement for one tick, no Jolt dependency. Exposed for unit testing.
    // forward / right: unit basis of the body's current orientation.
    // The speed multiplier is looked up from `state` on every call.
    static ecs::Vec3 compute_displacement(const ecs::Vec3& forward,
                                          const ecs::Vec3& right,
                                          const ecs::Vec2& move_input,
                                          float base_speed,
                                          MoveState state,
                                          float fixed_dt);
};
