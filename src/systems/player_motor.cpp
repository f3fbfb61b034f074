#include "player_motor.hpp"
#include "move_state.hpp"
#include "../math_util.hpp"
#include "../physics_handles.hpp"
#include "../physics_context.hpp"
#include <memory>

using namespace ecs;
using namespace fpc::math;

ecs::Vec3 PlayerMotorSystem::compute_displacement(const ecs::Vec3& forward,
                                                  const ecs::Vec3& right,
                                                  const ecs::Vec2& move_input,
                                                  float base_speed,
                                                  MoveState state,
                                                  float fixed_dt) {
    ecs::Vec3 direction = add(scale(forward, move_input.y), scale(right, move_input.x));
    direction = normalized_or_zero(direction);

    float speed = base_speed * MoveStateSystem::speed_multiplier(state);
    return scale(direction, speed * fixed_dt);
}

void PlayerMotorSystem::Update(World& world, float fixed_dt) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    JPH::BodyInterface& bi = (*ctx_ptr)->GetBodyInterface();

    world.each<PlayerTag, PlayerInput, PlayerControllerConfig, MovementState, RigidBodyHandle>(
        [&](Entity, PlayerTag&, PlayerInput& input, PlayerControllerConfig& cfg,
            MovementState& movement, RigidBodyHandle& h) {
            // --- Movement (kinematic-style: position delta, not velocity) ---
            JPH::RVec3 pos;
            JPH::Quat  rot;
            bi.GetPositionAndRotation(h.id, pos, rot);

            JPH::Vec3 fwd, right;
            MathBridge::MoveBasis(rot, fwd, right);

            ecs::Vec3 delta = compute_displacement(MathBridge::FromJolt(fwd),
                                                   MathBridge::FromJolt(right),
                                                   input.move_input, cfg.move_speed,
                                                   movement.state, fixed_dt);
            if (delta.x != 0.0f || delta.y != 0.0f || delta.z != 0.0f) {
                bi.SetPosition(h.id, pos + MathBridge::ToJolt(delta), JPH::EActivation::Activate);
            }

            // --- Jump (the only force-based motion) ---
            if (movement.jump_requested) {
                bi.AddImpulse(h.id, JPH::Vec3(0.0f, cfg.jump_force, 0.0f));
                movement.jump_requested = false;
            }
        });
}
