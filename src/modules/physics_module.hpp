#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../physics_context.hpp"
#include "../physics_handles.hpp"
#include "../pipeline.hpp"
#include "../systems/move_state.hpp"
#include "../systems/physics.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform_propagation.hpp>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// PhysicsModule
//
// Owns the Jolt world: creates the PhysicsContext resource, installs the
// RigidBodyConfig hooks and adds the step plus transform propagation to the
// Physics phase.
//
// Install before loading a scene (bodies are created by on_add hooks) and
// after PlayerModule::install_motor, so the motor's position deltas and jump
// impulses land before the step.
// ---------------------------------------------------------------------------

struct PhysicsModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        PhysicsContext::InitJoltAllocator();
        world.set_resource(std::make_shared<PhysicsContext>());
        PhysicsSystem::Register(world);

        pipeline.add_physics([](ecs::World& w, float dt) {
            PhysicsSystem::Update(w, dt);
            ecs::propagate_transforms(w);
        });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Physics", "Bodies", [&world]() {
                std::size_t n = 0;
                world.each<RigidBodyHandle>([&](ecs::Entity, RigidBodyHandle&) { ++n; });
                return std::to_string(n);
            });
            panel->watch("Physics", "Grounded", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, PlayerControllerConfig>([&](ecs::Entity e, PlayerTag&, PlayerControllerConfig&) {
                    r = MoveStateSystem::is_grounded(world, e) ? "yes" : "no";
                });
                return r;
            });
        }
    }
};
