#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../systems/controller_log.hpp"
#include "../systems/interaction.hpp"
#include "../systems/move_state.hpp"
#include "../systems/player_motor.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// PlayerModule
//
// Registers the controller's lifecycle hook and event queues, wires the
// button-driven systems into the Logic phase and adds "Player" debug rows.
//
// install_motor() adds PlayerMotorSystem to the Physics phase and must be
// called BEFORE PhysicsModule::install, so displacement and jump impulses
// reach Jolt before the step that integrates them.
//
// Ordering summary:
//   PlayerModule::install        → logic: MoveState, Interaction
//   CameraModule::install        → logic: Look
//   PlayerModule::install_log    → logic: ControllerLog (last)
//   PlayerModule::install_motor  → physics: PlayerMotor
//   PhysicsModule::install       → physics: Jolt step
// ---------------------------------------------------------------------------

struct PlayerModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        MoveStateSystem::Register(world);

        world.resource<EventRegistry>().register_queue<MoveStateChangedEvent>(world);
        world.resource<EventRegistry>().register_queue<InteractionEvent>(world);

        pipeline.add_logic([](ecs::World& w, float dt) { MoveStateSystem::Update(w, dt); });
        pipeline.add_logic([](ecs::World& w, float dt) { InteractionSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Player", "Move State", [&world]() {
                std::string r = "-";
                world.each<MovementState>([&](ecs::Entity, MovementState& m) {
                    r = MoveStateSystem::to_string(m.state);
                });
                return r;
            });
            panel->watch("Player", "Speed", [&world]() {
                std::string r = "-";
                world.each<MovementState, PlayerControllerConfig>(
                    [&](ecs::Entity, MovementState& m, PlayerControllerConfig& cfg) {
                        char b[32];
                        std::snprintf(b, sizeof(b), "%.2f u/s (x%.2f)",
                                      cfg.move_speed * MoveStateSystem::speed_multiplier(m.state),
                                      MoveStateSystem::speed_multiplier(m.state));
                        r = b;
                    });
                return r;
            });
            panel->watch("Player", "Latches", [&world]() {
                std::string r = "-";
                world.each<MovementState>([&](ecs::Entity, MovementState& m) {
                    r = std::string("C:") + (m.latches.crouch ? "1" : "0") +
                        " S:" + (m.latches.sprint ? "1" : "0") +
                        " W:" + (m.latches.walk ? "1" : "0");
                });
                return r;
            });
            panel->watch("Player", "Move Input", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, PlayerInput>([&](ecs::Entity, PlayerTag&, PlayerInput& in) {
                    char b[32];
                    std::snprintf(b, sizeof(b), "%.2f, %.2f", in.move_input.x, in.move_input.y);
                    r = b;
                });
                return r;
            });
        }
    }

    // ControllerLogSystem consumes the events emitted by every other Logic
    // step, so it must be the last Logic-phase install.
    static void install_log(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(ControllerStats{});
        pipeline.add_logic([](ecs::World& w, float dt) { ControllerLogSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Player", "State Changes", [&world]() {
                auto* s = world.try_resource<ControllerStats>();
                return s ? std::to_string(s->state_changes) : std::string("-");
            });
            panel->watch("Player", "Interactions", [&world]() {
                auto* s = world.try_resource<ControllerStats>();
                if (!s) return std::string("-");
                return std::to_string(s->primary_interacts) + " / " + std::to_string(s->secondary_interacts);
            });
        }
    }

    static void install_motor(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_physics([](ecs::World& w, float dt) { PlayerMotorSystem::Update(w, dt); });
    }
};
