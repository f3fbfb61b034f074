#pragma once
#include <ecs/ecs.hpp>

// Owns Jolt body lifetime (RigidBodyConfig -> RigidBodyHandle) and the fixed
// simulation step. Dynamic bodies are synced back to LocalTransform /
// WorldTransform after every step.
class PhysicsSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};
