#include "look.hpp"
#include "../physics_handles.hpp"
#include "../physics_context.hpp"
#include <ecs/modules/transform.hpp>
#include <memory>

using namespace ecs;

LookSystem::LookDelta LookSystem::compute_look(const ecs::Vec2& look_input, float sensitivity) {
    return {look_input.x * sensitivity, look_input.y * sensitivity};
}

void LookSystem::reset_view(World& world) {
    if (auto* cam = world.try_resource<MainCamera>()) *cam = MainCamera{};
}

void LookSystem::Update(World& world, float /*dt*/) {
    auto* cam = world.try_resource<MainCamera>();
    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    PhysicsContext* ctx = (ctx_ptr && *ctx_ptr) ? ctx_ptr->get() : nullptr;

    world.each<PlayerTag, PlayerInput, PlayerControllerConfig>(
        [&](Entity e, PlayerTag&, PlayerInput& input, PlayerControllerConfig& cfg) {
            const LookDelta d = compute_look(input.look_input, cfg.look_sensitivity);

            // --- Body pose (yaw goes to the body itself) ---
            JPH::RVec3 body_pos = JPH::RVec3::sZero();
            JPH::Quat  body_rot = JPH::Quat::sIdentity();

            auto* h = world.try_get<RigidBodyHandle>(e);
            if (ctx && h) {
                JPH::BodyInterface& bi = ctx->GetBodyInterface();
                bi.GetPositionAndRotation(h->id, body_pos, body_rot);

                if (d.yaw_degrees != 0.0f) {
                    // Negative about +Y so that positive yaw turns right
                    JPH::Quat yaw = JPH::Quat::sRotation(JPH::Vec3::sAxisY(),
                                                         -JPH::DegreesToRadians(d.yaw_degrees));
                    body_rot = (yaw * body_rot).Normalized();
                    bi.SetRotation(h->id, body_rot, JPH::EActivation::Activate);
                }
            } else if (auto* lt = world.try_get<LocalTransform>(e)) {
                body_pos = MathBridge::ToJolt(lt->position);
                body_rot = MathBridge::ToJolt(lt->rotation);
            }

            // --- Camera (pitch only, never clamped) ---
            if (!cam) return;
            cam->rotate_pitch(d.pitch_degrees);

            JPH::Quat pitch = JPH::Quat::sRotation(JPH::Vec3::sAxisX(),
                                                   -JPH::DegreesToRadians(cam->pitch_degrees));
            JPH::Quat view  = body_rot * pitch;

            JPH::Vec3 fwd = view * JPH::Vec3::sAxisZ();
            JPH::Vec3 up  = view * JPH::Vec3::sAxisY();

            cam->position     = MathBridge::FromJolt(body_pos + JPH::Vec3(0.0f, cfg.eye_height, 0.0f));
            cam->view_forward = MathBridge::FromJolt(fwd);
            cam->view_up      = MathBridge::FromJolt(up);
            cam->view_right   = MathBridge::FromJolt(fwd.Cross(up));
        });
}
