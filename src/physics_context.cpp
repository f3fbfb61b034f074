#include "physics_context.hpp"
#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/Body/BodyFilter.h>
#include <Jolt/Physics/Collision/RayCast.h>
#include <Jolt/Physics/Collision/CastResult.h>
#include <raylib.h>
#include <algorithm>
#include <thread>

// ---------------------------------------------------------------------------
// Layer interfaces
// ---------------------------------------------------------------------------

BPLayerInterfaceImpl::BPLayerInterfaceImpl() {
    mObjectToBroadPhase[Layers::NON_MOVING] = BroadPhaseLayers::NON_MOVING;
    mObjectToBroadPhase[Layers::MOVING] = BroadPhaseLayers::MOVING;
}

JPH::uint BPLayerInterfaceImpl::GetNumBroadPhaseLayers() const {
    return BroadPhaseLayers::NUM_LAYERS;
}

JPH::BroadPhaseLayer BPLayerInterfaceImpl::GetBroadPhaseLayer(JPH::ObjectLayer inLayer) const {
    JPH_ASSERT(inLayer < Layers::NUM_LAYERS);
    return mObjectToBroadPhase[inLayer];
}

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
const char* BPLayerInterfaceImpl::GetBroadPhaseLayerName(JPH::BroadPhaseLayer inLayer) const {
    switch ((JPH::BroadPhaseLayer::Type)inLayer) {
        case (JPH::BroadPhaseLayer::Type)BroadPhaseLayers::NON_MOVING: return "NON_MOVING";
        case (JPH::BroadPhaseLayer::Type)BroadPhaseLayers::MOVING: return "MOVING";
        default: JPH_ASSERT(false); return "INVALID";
    }
}
#endif

// Two layers only: the static world never tests against itself, anything
// that moves tests against everything. Broad-phase layers mirror the object
// layers one to one.
static bool layers_collide(JPH::ObjectLayer a, bool b_moving) {
    return a == Layers::MOVING || b_moving;
}

bool ObjectVsBroadPhaseLayerFilterImpl::ShouldCollide(JPH::ObjectLayer inLayer1,
                                                      JPH::BroadPhaseLayer inLayer2) const {
    return layers_collide(inLayer1, inLayer2 == BroadPhaseLayers::MOVING);
}

bool ObjectLayerPairFilterImpl::ShouldCollide(JPH::ObjectLayer inObject1,
                                              JPH::ObjectLayer inObject2) const {
    return layers_collide(inObject1, inObject2 == Layers::MOVING);
}

// ---------------------------------------------------------------------------
// PhysicsContext
// ---------------------------------------------------------------------------

void PhysicsContext::InitJoltAllocator() {
    JPH::RegisterDefaultAllocator();
}

PhysicsContext::PhysicsContext() {
    JPH::Factory::sInstance = new JPH::Factory();
    JPH::RegisterTypes();

    constexpr JPH::uint kMaxBodies = 1024;
    constexpr JPH::uint kMaxBodyPairs = 1024;
    constexpr JPH::uint kMaxContacts = 1024;

    temp_allocator = new JPH::TempAllocatorImpl(10 * 1024 * 1024);

    // One worker is left for the main thread, which drives the game loop.
    int workers = std::max(1, static_cast<int>(std::thread::hardware_concurrency()) - 1);
    job_system = new JPH::JobSystemThreadPool(JPH::cMaxPhysicsJobs, JPH::cMaxPhysicsBarriers, workers);

    physics_system = new JPH::PhysicsSystem();
    physics_system->Init(kMaxBodies, 0, kMaxBodyPairs, kMaxContacts, broad_phase_layer_interface,
                         object_vs_broadphase_layer_filter, object_layer_pair_filter);

    TraceLog(LOG_INFO, "PHYSICS: Jolt initialised (%d worker threads)", workers);
}

PhysicsContext::~PhysicsContext() {
    delete physics_system;
    delete job_system;
    delete temp_allocator;
    if (JPH::Factory::sInstance) {
        JPH::UnregisterTypes();
        delete JPH::Factory::sInstance;
        JPH::Factory::sInstance = nullptr;
    }
}

bool PhysicsContext::CastDown(const JPH::RVec3& origin, float max_distance, JPH::BodyID ignore) const {
    JPH::RRayCast ray{origin, JPH::Vec3(0.0f, -max_distance, 0.0f)};
    JPH::RayCastResult result;

    // The caster lives on the MOVING layer, so everything it could stand on
    // passes these filters.
    JPH::DefaultBroadPhaseLayerFilter bp_filter(object_vs_broadphase_layer_filter, Layers::MOVING);
    JPH::DefaultObjectLayerFilter obj_filter(object_layer_pair_filter, Layers::MOVING);
    JPH::IgnoreSingleBodyFilter body_filter(ignore);

    return physics_system->GetNarrowPhaseQuery().CastRay(ray, result, bp_filter, obj_filter, body_filter);
}
