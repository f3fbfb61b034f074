#include "physics.hpp"
#include "../components.hpp"
#include "../physics_handles.hpp"
#include "../physics_context.hpp"
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <ecs/modules/transform.hpp>
#include <ecs/integration/glm.hpp>
#include <raylib.h>
#include <memory>

using namespace ecs;

namespace {

// Box when no collider component is present.
JPH::RefConst<JPH::Shape> make_shape(World& w, Entity e) {
    if (auto* c = w.try_get<CapsuleCollider>(e)) return new JPH::CapsuleShape(c->half_height, c->radius);
    if (auto* s = w.try_get<SphereCollider>(e))  return new JPH::SphereShape(s->radius);
    if (auto* b = w.try_get<BoxCollider>(e))     return new JPH::BoxShape(MathBridge::ToJolt(b->half_extents));
    return new JPH::BoxShape(JPH::Vec3::sReplicate(0.5f));
}

JPH::EMotionType motion_type(BodyType type) {
    switch (type) {
        case BodyType::Static:    return JPH::EMotionType::Static;
        case BodyType::Kinematic: return JPH::EMotionType::Kinematic;
        case BodyType::Dynamic:   break;
    }
    return JPH::EMotionType::Dynamic;
}

JPH::BodyCreationSettings body_settings(const RigidBodyConfig& cfg,
                                        JPH::RefConst<JPH::Shape> shape,
                                        const LocalTransform* pose) {
    const JPH::RVec3 pos = pose ? JPH::RVec3(MathBridge::ToJolt(pose->position)) : JPH::RVec3::sZero();
    const JPH::Quat  rot = pose ? MathBridge::ToJolt(pose->rotation) : JPH::Quat::sIdentity();
    const JPH::ObjectLayer layer = (cfg.type == BodyType::Static) ? Layers::NON_MOVING : Layers::MOVING;

    JPH::BodyCreationSettings settings(shape, pos, rot, motion_type(cfg.type), layer);
    settings.mFriction    = cfg.friction;
    settings.mRestitution = cfg.restitution;
    settings.mIsSensor    = cfg.sensor;

    if (cfg.type == BodyType::Dynamic) {
        settings.mOverrideMassProperties       = JPH::EOverrideMassProperties::CalculateInertia;
        settings.mMassPropertiesOverride.mMass = cfg.mass;
    }
    // The player is turned by LookSystem alone; contacts must never tip it over.
    if (cfg.lock_rotation) {
        settings.mAllowedDOFs = JPH::EAllowedDOFs::TranslationX
                              | JPH::EAllowedDOFs::TranslationY
                              | JPH::EAllowedDOFs::TranslationZ;
    }
    return settings;
}

} // namespace

void PhysicsSystem::Register(World& world) {
    world.on_add<RigidBodyConfig>([](World& w, Entity e, RigidBodyConfig& cfg) {
        if (w.has<RigidBodyHandle>(e)) return;
        auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
        if (!ctx_ptr || !*ctx_ptr) return;

        JPH::BodyInterface& bi = (*ctx_ptr)->GetBodyInterface();
        JPH::Body* body = bi.CreateBody(body_settings(cfg, make_shape(w, e), w.try_get<LocalTransform>(e)));
        if (!body) {
            TraceLog(LOG_WARNING, "PHYSICS: Body limit reached, entity left without a body");
            return;
        }
        bi.AddBody(body->GetID(), JPH::EActivation::Activate);
        w.add(e, RigidBodyHandle{body->GetID()});
    });

    world.on_remove<RigidBodyHandle>([](World& w, Entity, RigidBodyHandle& h) {
        auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
        if (!ctx_ptr || !*ctx_ptr) return;
        JPH::BodyInterface& bi = (*ctx_ptr)->GetBodyInterface();
        bi.RemoveBody(h.id);
        bi.DestroyBody(h.id);
    });
}

void PhysicsSystem::Update(World& world, float dt) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    auto& ctx = **ctx_ptr;

    ctx.physics_system->Update(dt, 1, ctx.temp_allocator, ctx.job_system);

    JPH::BodyInterface& bi = ctx.GetBodyInterface();

    // Static and kinematic bodies are driven by the ECS, not the other way round.
    world.each<RigidBodyHandle, WorldTransform, RigidBodyConfig>(
        [&](Entity e, RigidBodyHandle& h, WorldTransform& wt, RigidBodyConfig& cfg) {
            if (cfg.type != BodyType::Dynamic) return;

            JPH::RVec3 body_pos;
            JPH::Quat  body_rot;
            bi.GetPositionAndRotation(h.id, body_pos, body_rot);
            const ecs::Vec3 position = MathBridge::FromJolt(body_pos);
            const ecs::Quat rotation = MathBridge::FromJolt(body_rot);

            // Bodies are scene roots, so local and world pose coincide.
            ecs::Vec3 scale = {1, 1, 1};
            if (auto* lt = world.try_get<LocalTransform>(e)) {
                lt->position = position;
                lt->rotation = rotation;
                scale = lt->scale;
            }
            wt.matrix = mat4_compose(position, rotation, scale);
        });
}
