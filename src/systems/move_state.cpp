#include "move_state.hpp"
#include "../components.hpp"
#include "../physics_handles.hpp"
#include "../physics_context.hpp"
#include <raylib.h>
#include <memory>

using namespace ecs;

float MoveStateSystem::speed_multiplier(MoveState state) {
    switch (state) {
        case MoveState::Sprinting: return 2.0f;
        case MoveState::Walking:   return 0.5f;
        case MoveState::Crouching: return 0.33f;
        case MoveState::Crawling:  return 0.2f;
        case MoveState::Running:
        case MoveState::Idle:
        default:                   return 1.0f;
    }
}

MoveState MoveStateSystem::next_state(MoveState current, bool pressed,
                                      InputMode mode, MoveState desired) {
    if (mode == InputMode::Toggle) {
        if (!pressed) return current;
        return (current == desired) ? MoveState::Running : desired;
    }
    return pressed ? desired : MoveState::Running;
}

static bool* latch_for(ActionLatches& latches, Button button) {
    switch (button) {
        case Button::Crouch: return &latches.crouch;
        case Button::Sprint: return &latches.sprint;
        case Button::Walk:   return &latches.walk;
        default:             return nullptr;
    }
}

bool MoveStateSystem::apply_button(const ButtonEvent& ev,
                                   const PlayerControllerConfig& cfg,
                                   MovementState& movement,
                                   const GroundCheck& is_grounded) {
    InputMode mode;
    MoveState desired;
    switch (ev.button) {
        case Button::Crouch: mode = cfg.crouch_mode; desired = MoveState::Crouching; break;
        case Button::Sprint: mode = cfg.sprint_mode; desired = MoveState::Sprinting; break;
        case Button::Walk:   mode = cfg.walk_mode;   desired = MoveState::Walking;   break;
        case Button::Jump:
            // A release clears a request the fixed tick has not consumed yet.
            movement.jump_requested = ev.pressed && is_grounded && is_grounded();
            return false;
        default:
            return false;
    }

    const MoveState before = movement.state;
    const MoveState after  = next_state(before, ev.pressed, mode, desired);

    // Airborne crouch-down requests are dropped entirely, latch included.
    if (desired == MoveState::Crouching && after == MoveState::Crouching &&
        before != MoveState::Crouching) {
        if (!is_grounded || !is_grounded()) return false;
    }

    if (mode == InputMode::Toggle && ev.pressed) {
        if (bool* latch = latch_for(movement.latches, ev.button)) *latch = !*latch;
    }

    movement.state = after;
    return after != before;
}

const char* MoveStateSystem::to_string(MoveState state) {
    switch (state) {
        case MoveState::Sprinting: return "Sprinting";
        case MoveState::Running:   return "Running";
        case MoveState::Walking:   return "Walking";
        case MoveState::Crouching: return "Crouching";
        case MoveState::Crawling:  return "Crawling";
        case MoveState::Idle:      return "Idle";
    }
    return "?";
}

const char* MoveStateSystem::to_string(InputMode mode) {
    return (mode == InputMode::Toggle) ? "Toggle" : "Hold";
}

// ---------------------------------------------------------------------------
// ECS glue
// ---------------------------------------------------------------------------

void MoveStateSystem::Register(World& world) {
    world.on_add<PlayerControllerConfig>(
        [](World& w, Entity e, PlayerControllerConfig& cfg) {
            if (!w.has<MovementState>(e)) w.add(e, MovementState{});

            TraceLog(LOG_INFO, "PLAYER: Controller attached (crouch=%s sprint=%s walk=%s)",
                     to_string(cfg.crouch_mode), to_string(cfg.sprint_mode), to_string(cfg.walk_mode));

            // Configuration errors are reported here once; ticks just skip
            // whatever they cannot reach.
            auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
            if (!ctx_ptr || !*ctx_ptr) {
                TraceLog(LOG_WARNING, "PLAYER: No physics context; movement, jump and ground checks are disabled");
            } else if (!w.has<RigidBodyHandle>(e)) {
                TraceLog(LOG_WARNING, "PLAYER: Controlled entity has no rigid body; movement, jump and ground checks are disabled");
            }
            if (!w.try_resource<MainCamera>()) {
                TraceLog(LOG_WARNING, "PLAYER: No MainCamera resource; pitch input is ignored");
            }
        });
}

bool MoveStateSystem::is_grounded(World& world, Entity e) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    if (!ctx_ptr || !*ctx_ptr) return false;
    auto* handle = world.try_get<RigidBodyHandle>(e);
    auto* cfg    = world.try_get<PlayerControllerConfig>(e);
    if (!handle || !cfg) return false;

    auto& ctx = **ctx_ptr;
    JPH::RVec3 origin = ctx.GetBodyInterface().GetPosition(handle->id);
    return ctx.CastDown(origin, cfg->ground_probe_length, handle->id);
}

void MoveStateSystem::Update(World& world, float /*dt*/) {
    const auto* buttons = world.try_resource<Events<ButtonEvent>>();
    if (!buttons || buttons->empty()) return;
    auto* changes = world.try_resource<Events<MoveStateChangedEvent>>();

    world.each<PlayerTag, PlayerControllerConfig, MovementState>(
        [&](Entity e, PlayerTag&, PlayerControllerConfig& cfg, MovementState& movement) {
            GroundCheck grounded = [&world, e]() { return is_grounded(world, e); };

            for (const auto& ev : buttons->read()) {
                MoveState before = movement.state;
                if (apply_button(ev, cfg, movement, grounded) && changes) {
                    changes->send({e, before, movement.state});
                }
            }
        });
}
