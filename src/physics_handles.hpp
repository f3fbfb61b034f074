#pragma once
#include <Jolt/Jolt.h>
#include <Jolt/Physics/Body/BodyID.h>
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// MathBridge: Jolt <-> ECS conversions for the controller systems.
// Lives outside components.hpp so the headless test target never sees Jolt.
// ---------------------------------------------------------------------------
namespace MathBridge {
    inline JPH::Vec3 ToJolt(const ecs::Vec3& v) { return {v.x, v.y, v.z}; }
    inline JPH::Quat ToJolt(const ecs::Quat& q) { return {q.x, q.y, q.z, q.w}; }

    inline ecs::Vec3 FromJolt(const JPH::Vec3& v) { return {v.GetX(), v.GetY(), v.GetZ()}; }
    inline ecs::Quat FromJolt(const JPH::Quat& q) { return {q.GetX(), q.GetY(), q.GetZ(), q.GetW()}; }
#ifdef JPH_DOUBLE_PRECISION
    inline ecs::Vec3 FromJolt(const JPH::RVec3& v) {
        return {static_cast<float>(v.GetX()), static_cast<float>(v.GetY()), static_cast<float>(v.GetZ())};
    }
#endif

    // Movement basis of a body: forward is local +Z, right is forward x world
    // up (so -X at identity). Degenerate axes are left unnormalized.
    inline void MoveBasis(const JPH::Quat& rotation, JPH::Vec3& forward, JPH::Vec3& right) {
        forward = rotation * JPH::Vec3::sAxisZ();
        right   = forward.Cross(JPH::Vec3::sAxisY());
        if (forward.LengthSq() > 0.001f) forward = forward.Normalized();
        if (right.LengthSq()   > 0.001f) right   = right.Normalized();
    }
}

// Added by PhysicsSystem's RigidBodyConfig hook. The player motor, look and
// ground probe all address the body through this id.

struct RigidBodyHandle {
    JPH::BodyID id;
};
