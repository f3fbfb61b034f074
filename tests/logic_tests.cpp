#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/math_util.hpp"
#include "../src/input_state.hpp"
#include "../src/systems/controller_log.hpp"
#include "../src/systems/interaction.hpp"
#include "../src/systems/look.hpp"
#include "../src/systems/move_state.hpp"
#include "../src/systems/player_input.hpp"
#include "../src/systems/player_motor.hpp"
#include "../src/events.hpp"
#include "../src/scene.hpp"
#include "../src/debug_panel.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <string>
#include <vector>

// Everything here runs headless: pure halves of the systems, plus system
// Updates driven through a World that has no PhysicsContext (so the player is
// never grounded) and an InputRecord filled by hand instead of polled.

using namespace fpc::math;
using Catch::Matchers::WithinAbs;

static const MoveStateSystem::GroundCheck GROUNDED = []() { return true; };
static const MoveStateSystem::GroundCheck AIRBORNE = []() { return false; };

// ---------------------------------------------------------------------------
// Math helpers
// ---------------------------------------------------------------------------

TEST_CASE("wrap_degrees", "[math]") {
    SECTION("Inside range") {
        CHECK_THAT(wrap_degrees(45.0f),  WithinAbs(45.0f, 1e-4f));
        CHECK_THAT(wrap_degrees(-90.0f), WithinAbs(-90.0f, 1e-4f));
        CHECK_THAT(wrap_degrees(180.0f), WithinAbs(180.0f, 1e-4f));
    }

    SECTION("Outside range") {
        CHECK_THAT(wrap_degrees(270.0f),  WithinAbs(-90.0f, 1e-4f));
        CHECK_THAT(wrap_degrees(-270.0f), WithinAbs(90.0f, 1e-4f));
        CHECK_THAT(wrap_degrees(720.0f),  WithinAbs(0.0f, 1e-4f));
        CHECK_THAT(wrap_degrees(-180.0f), WithinAbs(180.0f, 1e-4f));
    }
}

TEST_CASE("clamp_unit keeps stick input inside the unit disc", "[math]") {
    ecs::Vec2 inside = clamp_unit({0.3f, 0.4f});
    CHECK_THAT(inside.x, WithinAbs(0.3f, 1e-5f));
    CHECK_THAT(inside.y, WithinAbs(0.4f, 1e-5f));

    ecs::Vec2 corner = clamp_unit({1.0f, 1.0f});
    CHECK_THAT(corner.x, WithinAbs(0.70710678f, 1e-5f));
    CHECK_THAT(corner.y, WithinAbs(0.70710678f, 1e-5f));
}

TEST_CASE("apply_deadzone", "[math]") {
    CHECK(apply_deadzone(0.1f, 0.15f)  == 0.0f);
    CHECK(apply_deadzone(-0.1f, 0.15f) == 0.0f);
    CHECK(apply_deadzone(0.5f, 0.15f)  == 0.5f);
    CHECK(apply_deadzone(-0.5f, 0.15f) == -0.5f);
}

TEST_CASE("normalized_or_zero leaves the zero vector alone", "[math]") {
    ecs::Vec3 z = normalized_or_zero({0, 0, 0});
    CHECK(z.x == 0.0f);
    CHECK(z.y == 0.0f);
    CHECK(z.z == 0.0f);

    ecs::Vec3 n = normalized_or_zero({3, 0, 4});
    CHECK_THAT(length(n), WithinAbs(1.0f, 1e-5f));
    CHECK_THAT(n.x, WithinAbs(0.6f, 1e-5f));
}

// ---------------------------------------------------------------------------
// MoveStateSystem — speed multipliers and the transition rule
// ---------------------------------------------------------------------------

TEST_CASE("speed_multiplier per state", "[move_state]") {
    CHECK(MoveStateSystem::speed_multiplier(MoveState::Sprinting) == 2.0f);
    CHECK(MoveStateSystem::speed_multiplier(MoveState::Running)   == 1.0f);
    CHECK(MoveStateSystem::speed_multiplier(MoveState::Walking)   == 0.5f);
    CHECK(MoveStateSystem::speed_multiplier(MoveState::Crouching) == 0.33f);
    CHECK(MoveStateSystem::speed_multiplier(MoveState::Crawling)  == 0.2f);
    CHECK(MoveStateSystem::speed_multiplier(MoveState::Idle)      == 1.0f);
}

TEST_CASE("next_state — Toggle press flips between desired and Running", "[move_state]") {
    MoveState s = MoveState::Running;
    s = MoveStateSystem::next_state(s, true, InputMode::Toggle, MoveState::Crouching);
    CHECK(s == MoveState::Crouching);
    s = MoveStateSystem::next_state(s, true, InputMode::Toggle, MoveState::Crouching);
    CHECK(s == MoveState::Running);
}

TEST_CASE("next_state — Toggle release never changes state", "[move_state]") {
    CHECK(MoveStateSystem::next_state(MoveState::Crouching, false, InputMode::Toggle, MoveState::Crouching)
          == MoveState::Crouching);
    CHECK(MoveStateSystem::next_state(MoveState::Sprinting, false, InputMode::Toggle, MoveState::Crouching)
          == MoveState::Sprinting);
}

TEST_CASE("next_state — Hold follows the button", "[move_state]") {
    CHECK(MoveStateSystem::next_state(MoveState::Running, true, InputMode::Hold, MoveState::Sprinting)
          == MoveState::Sprinting);
    CHECK(MoveStateSystem::next_state(MoveState::Sprinting, false, InputMode::Hold, MoveState::Sprinting)
          == MoveState::Running);
}

TEST_CASE("next_state — Hold release resets even a state owned by another action", "[move_state]") {
    // Releasing walk while crouched still drops back to Running.
    CHECK(MoveStateSystem::next_state(MoveState::Crouching, false, InputMode::Hold, MoveState::Walking)
          == MoveState::Running);
}

// ---------------------------------------------------------------------------
// MoveStateSystem::apply_button
// ---------------------------------------------------------------------------

TEST_CASE("apply_button — sprint Hold press and release", "[move_state]") {
    PlayerControllerConfig cfg;   // sprint defaults to Hold
    MovementState movement;

    CHECK(MoveStateSystem::apply_button({Button::Sprint, true}, cfg, movement, GROUNDED));
    CHECK(movement.state == MoveState::Sprinting);
    CHECK_FALSE(movement.latches.sprint);

    CHECK(MoveStateSystem::apply_button({Button::Sprint, false}, cfg, movement, GROUNDED));
    CHECK(movement.state == MoveState::Running);
}

TEST_CASE("apply_button — last writer wins between actions", "[move_state]") {
    PlayerControllerConfig cfg;
    MovementState movement;

    MoveStateSystem::apply_button({Button::Sprint, true}, cfg, movement, GROUNDED);
    MoveStateSystem::apply_button({Button::Walk,   true}, cfg, movement, GROUNDED);
    CHECK(movement.state == MoveState::Walking);

    // Sprint is still held, but its release resets whatever is current.
    MoveStateSystem::apply_button({Button::Sprint, false}, cfg, movement, GROUNDED);
    CHECK(movement.state == MoveState::Running);
}

TEST_CASE("apply_button — crouch Toggle while grounded", "[move_state]") {
    PlayerControllerConfig cfg;   // crouch defaults to Toggle
    MovementState movement;

    CHECK(MoveStateSystem::apply_button({Button::Crouch, true}, cfg, movement, GROUNDED));
    CHECK(movement.state == MoveState::Crouching);
    CHECK(movement.latches.crouch);

    CHECK_FALSE(MoveStateSystem::apply_button({Button::Crouch, false}, cfg, movement, GROUNDED));
    CHECK(movement.state == MoveState::Crouching);
    CHECK(movement.latches.crouch);

    CHECK(MoveStateSystem::apply_button({Button::Crouch, true}, cfg, movement, GROUNDED));
    CHECK(movement.state == MoveState::Running);
    CHECK_FALSE(movement.latches.crouch);
}

TEST_CASE("apply_button — airborne crouch entry is dropped", "[move_state]") {
    PlayerControllerConfig cfg;
    MovementState movement;

    CHECK_FALSE(MoveStateSystem::apply_button({Button::Crouch, true}, cfg, movement, AIRBORNE));
    CHECK(movement.state == MoveState::Running);
    CHECK_FALSE(movement.latches.crouch);
}

TEST_CASE("apply_button — crouch can be left while airborne", "[move_state]") {
    PlayerControllerConfig cfg;
    MovementState movement;
    MoveStateSystem::apply_button({Button::Crouch, true}, cfg, movement, GROUNDED);
    REQUIRE(movement.state == MoveState::Crouching);

    CHECK(MoveStateSystem::apply_button({Button::Crouch, true}, cfg, movement, AIRBORNE));
    CHECK(movement.state == MoveState::Running);
    CHECK_FALSE(movement.latches.crouch);
}

TEST_CASE("apply_button — ground check only runs for crouch entry and jump", "[move_state]") {
    PlayerControllerConfig cfg;
    MovementState movement;
    int probes = 0;
    MoveStateSystem::GroundCheck counting = [&probes]() { ++probes; return true; };

    MoveStateSystem::apply_button({Button::Sprint, true},  cfg, movement, counting);
    MoveStateSystem::apply_button({Button::Sprint, false}, cfg, movement, counting);
    CHECK(probes == 0);

    MoveStateSystem::apply_button({Button::Crouch, true}, cfg, movement, counting);
    CHECK(probes == 1);
}

TEST_CASE("apply_button — Toggle sprint flips its latch on every press", "[move_state]") {
    PlayerControllerConfig cfg;
    cfg.sprint_mode = InputMode::Toggle;
    MovementState movement;

    MoveStateSystem::apply_button({Button::Sprint, true}, cfg, movement, GROUNDED);
    CHECK(movement.state == MoveState::Sprinting);
    CHECK(movement.latches.sprint);

    // Walk (Hold) takes over; the sprint latch is left as it was.
    MoveStateSystem::apply_button({Button::Walk, true}, cfg, movement, GROUNDED);
    CHECK(movement.state == MoveState::Walking);
    CHECK(movement.latches.sprint);

    // Next sprint press enters Sprinting again and flips the latch back.
    MoveStateSystem::apply_button({Button::Sprint, true}, cfg, movement, GROUNDED);
    CHECK(movement.state == MoveState::Sprinting);
    CHECK_FALSE(movement.latches.sprint);
}

TEST_CASE("apply_button — jump is requested only when grounded", "[move_state]") {
    PlayerControllerConfig cfg;
    MovementState movement;

    CHECK_FALSE(MoveStateSystem::apply_button({Button::Jump, true}, cfg, movement, AIRBORNE));
    CHECK_FALSE(movement.jump_requested);

    CHECK_FALSE(MoveStateSystem::apply_button({Button::Jump, true}, cfg, movement, GROUNDED));
    CHECK(movement.jump_requested);
    CHECK(movement.state == MoveState::Running);
}

TEST_CASE("apply_button — jump release clears an unconsumed request", "[move_state]") {
    PlayerControllerConfig cfg;
    MovementState movement;
    MoveStateSystem::apply_button({Button::Jump, true}, cfg, movement, GROUNDED);
    REQUIRE(movement.jump_requested);

    MoveStateSystem::apply_button({Button::Jump, false}, cfg, movement, GROUNDED);
    CHECK_FALSE(movement.jump_requested);
}

TEST_CASE("apply_button — interact buttons leave movement untouched", "[move_state]") {
    PlayerControllerConfig cfg;
    MovementState movement;
    CHECK_FALSE(MoveStateSystem::apply_button({Button::Interact, true}, cfg, movement, GROUNDED));
    CHECK_FALSE(MoveStateSystem::apply_button({Button::InteractSecondary, true}, cfg, movement, GROUNDED));
    CHECK(movement.state == MoveState::Running);
    CHECK_FALSE(movement.jump_requested);
}

// ---------------------------------------------------------------------------
// Interaction gate
// ---------------------------------------------------------------------------

TEST_CASE("evaluate_gate — one failing check blocks the action but all run", "[interaction]") {
    std::vector<int> calls;
    int fired = 0;
    std::vector<InteractionGate::Precondition> checks = {
        [&]() { calls.push_back(0); return true;  },
        [&]() { calls.push_back(1); return false; },
        [&]() { calls.push_back(2); return true;  },
    };

    CHECK_FALSE(evaluate_gate(true, checks, [&]() { ++fired; }));
    CHECK(fired == 0);
    CHECK(calls == std::vector<int>{0, 1, 2});
}

TEST_CASE("evaluate_gate — all passing invokes the action once", "[interaction]") {
    int fired = 0;
    std::vector<InteractionGate::Precondition> checks = {
        []() { return true; }, []() { return true; }, []() { return true; },
    };

    CHECK(evaluate_gate(true, checks, [&]() { ++fired; }));
    CHECK(fired == 1);
}

TEST_CASE("evaluate_gate — no preconditions passes", "[interaction]") {
    int fired = 0;
    CHECK(evaluate_gate(true, {}, [&]() { ++fired; }));
    CHECK(fired == 1);
}

TEST_CASE("evaluate_gate — release never fires or runs checks", "[interaction]") {
    int fired = 0;
    int checked = 0;
    std::vector<InteractionGate::Precondition> checks = {
        [&]() { ++checked; return true; },
    };

    for (int i = 0; i < 5; ++i) {
        CHECK_FALSE(evaluate_gate(false, checks, [&]() { ++fired; }));
    }
    CHECK(fired == 0);
    CHECK(checked == 0);
}

TEST_CASE("InteractionGate — missing action is not an error", "[interaction]") {
    InteractionGate gate;
    gate.add_precondition([]() { return true; });
    CHECK_FALSE(gate.has_action());
    CHECK(gate.evaluate(true));
}

TEST_CASE("InteractionGate — clear drops checks and action", "[interaction]") {
    int fired = 0;
    InteractionGate gate;
    gate.add_precondition([]() { return false; });
    gate.set_action([&]() { ++fired; });
    REQUIRE(gate.precondition_count() == 1);

    gate.clear();
    CHECK(gate.precondition_count() == 0);
    CHECK_FALSE(gate.has_action());
    CHECK(gate.evaluate(true));
    CHECK(fired == 0);
}

TEST_CASE("Interactions — primary and secondary gates are independent", "[interaction]") {
    int primary = 0;
    int secondary = 0;
    Interactions gates;
    gates.primary.add_precondition([]() { return false; });
    gates.primary.set_action([&]() { ++primary; });
    gates.secondary.set_action([&]() { ++secondary; });

    CHECK_FALSE(gates.primary.evaluate(true));
    CHECK(gates.secondary.evaluate(true));
    CHECK(primary == 0);
    CHECK(secondary == 1);
}

// ---------------------------------------------------------------------------
// PlayerMotorSystem::compute_displacement
// ---------------------------------------------------------------------------

static const ecs::Vec3 FORWARD = {0, 0, 1};
static const ecs::Vec3 RIGHT   = {-1, 0, 0};

TEST_CASE("compute_displacement — full forward while running", "[motor]") {
    ecs::Vec3 d = PlayerMotorSystem::compute_displacement(FORWARD, RIGHT, {0, 1}, 5.0f,
                                                          MoveState::Running, 0.02f);
    CHECK_THAT(d.x, WithinAbs(0.0f, 1e-6f));
    CHECK_THAT(d.y, WithinAbs(0.0f, 1e-6f));
    CHECK_THAT(d.z, WithinAbs(0.1f, 1e-6f));
}

TEST_CASE("compute_displacement — sprinting doubles the step", "[motor]") {
    ecs::Vec3 d = PlayerMotorSystem::compute_displacement(FORWARD, RIGHT, {0, 1}, 5.0f,
                                                          MoveState::Sprinting, 0.02f);
    CHECK_THAT(d.z, WithinAbs(0.2f, 1e-6f));
}

TEST_CASE("compute_displacement — strafe uses the right vector", "[motor]") {
    ecs::Vec3 d = PlayerMotorSystem::compute_displacement(FORWARD, RIGHT, {1, 0}, 5.0f,
                                                          MoveState::Walking, 0.02f);
    CHECK_THAT(d.x, WithinAbs(-0.05f, 1e-6f));
    CHECK_THAT(d.z, WithinAbs(0.0f, 1e-6f));
}

TEST_CASE("compute_displacement — zero input is zero displacement", "[motor]") {
    ecs::Vec3 d = PlayerMotorSystem::compute_displacement(FORWARD, RIGHT, {0, 0}, 5.0f,
                                                          MoveState::Sprinting, 0.02f);
    CHECK(d.x == 0.0f);
    CHECK(d.y == 0.0f);
    CHECK(d.z == 0.0f);
}

TEST_CASE("compute_displacement — diagonal is normalized", "[motor]") {
    ecs::Vec3 d = PlayerMotorSystem::compute_displacement(FORWARD, RIGHT, {1, 1}, 5.0f,
                                                          MoveState::Running, 0.02f);
    CHECK_THAT(length(d), WithinAbs(0.1f, 1e-6f));
}

// ---------------------------------------------------------------------------
// LookSystem::compute_look and MainCamera
// ---------------------------------------------------------------------------

TEST_CASE("compute_look — scales both axes by sensitivity", "[look]") {
    LookSystem::LookDelta d = LookSystem::compute_look({10.0f, -4.0f}, 0.1f);
    CHECK_THAT(d.yaw_degrees,   WithinAbs(1.0f, 1e-6f));
    CHECK_THAT(d.pitch_degrees, WithinAbs(-0.4f, 1e-6f));
}

TEST_CASE("MainCamera — pitch accumulates past a full turn", "[look]") {
    MainCamera cam;
    for (int i = 0; i < 15; ++i) cam.rotate_pitch(30.0f);
    CHECK_THAT(cam.pitch_degrees, WithinAbs(450.0f, 1e-4f));
    CHECK_THAT(wrap_degrees(cam.pitch_degrees), WithinAbs(90.0f, 1e-4f));
}

TEST_CASE("LookSystem::reset_view — levels the camera", "[look]") {
    ecs::World world;
    world.set_resource(MainCamera{});
    world.resource<MainCamera>().rotate_pitch(450.0f);
    world.resource<MainCamera>().view_forward = {0, 1, 0};

    LookSystem::reset_view(world);

    const auto& cam = world.resource<MainCamera>();
    CHECK(cam.pitch_degrees == 0.0f);
    CHECK(cam.view_forward.z == 1.0f);
}

TEST_CASE("ControllerLogSystem::reset — zeroes the totals", "[controller_log]") {
    ecs::World world;
    world.set_resource(ControllerStats{3, 2, 1});

    ControllerLogSystem::reset(world);

    const auto& stats = world.resource<ControllerStats>();
    CHECK(stats.state_changes == 0);
    CHECK(stats.primary_interacts == 0);
    CHECK(stats.secondary_interacts == 0);
}

// ---------------------------------------------------------------------------
// PlayerInputSystem — one edge per action across all bindings
// ---------------------------------------------------------------------------

static std::vector<ButtonEvent> edges_for(const InputRecord& record, ButtonHoldState& hold) {
    Events<ButtonEvent> out;
    PlayerInputSystem::emit_button_edges(record, hold, out);
    return out.read();
}

static bool same(const std::vector<ButtonEvent>& got, const std::vector<ButtonEvent>& want) {
    if (got.size() != want.size()) return false;
    for (std::size_t i = 0; i < got.size(); ++i) {
        if (got[i].button != want[i].button || got[i].pressed != want[i].pressed) return false;
    }
    return true;
}

TEST_CASE("emit_button_edges — second key of a held action sends nothing", "[input]") {
    ButtonHoldState hold;
    InputRecord frame;

    frame.keys_down[KEY_C] = true;
    frame.keys_pressed[KEY_C] = true;
    CHECK(same(edges_for(frame, hold), {{Button::Crouch, true}}));

    // Ctrl joins while C is still down
    frame.keys_pressed[KEY_C] = false;
    frame.keys_down[KEY_LEFT_CONTROL] = true;
    frame.keys_pressed[KEY_LEFT_CONTROL] = true;
    CHECK(edges_for(frame, hold).empty());

    // C lets go; Ctrl keeps the action down
    frame.keys_pressed[KEY_LEFT_CONTROL] = false;
    frame.keys_down[KEY_C] = false;
    CHECK(edges_for(frame, hold).empty());

    // Last binding up
    frame.keys_down[KEY_LEFT_CONTROL] = false;
    CHECK(same(edges_for(frame, hold), {{Button::Crouch, false}}));
}

TEST_CASE("emit_button_edges — keyboard and gamepad share one action", "[input]") {
    ButtonHoldState hold;
    InputRecord frame;
    GamepadState pad;
    frame.gamepads.push_back(pad);

    frame.keys_down[KEY_LEFT_SHIFT] = true;
    CHECK(same(edges_for(frame, hold), {{Button::Sprint, true}}));

    frame.gamepads[0].buttons[GAMEPAD_BUTTON_LEFT_THUMB] = true;
    frame.keys_down[KEY_LEFT_SHIFT] = false;
    CHECK(edges_for(frame, hold).empty());

    frame.gamepads[0].buttons[GAMEPAD_BUTTON_LEFT_THUMB] = false;
    CHECK(same(edges_for(frame, hold), {{Button::Sprint, false}}));
}

TEST_CASE("emit_button_edges — tap inside one frame sends press then release", "[input]") {
    ButtonHoldState hold;
    InputRecord frame;
    frame.mouse_buttons_pressed[MOUSE_BUTTON_LEFT] = true;   // never seen down

    CHECK(same(edges_for(frame, hold), {{Button::Interact, true}, {Button::Interact, false}}));
    CHECK_FALSE(hold.held[static_cast<std::size_t>(Button::Interact)]);
}

TEST_CASE("emit_button_edges — edges follow Button order", "[input]") {
    ButtonHoldState hold;
    InputRecord frame;
    frame.keys_down[KEY_LEFT_ALT] = true;
    frame.keys_down[KEY_SPACE] = true;

    CHECK(same(edges_for(frame, hold), {{Button::Jump, true}, {Button::Walk, true}}));
}

TEST_CASE("PlayerInputSystem::Update — held Hold crouch survives a binding swap", "[input]") {
    ecs::World world;
    world.set_resource(InputRecord{});
    world.set_resource(Events<ButtonEvent>{});
    auto e = world.create();
    world.add(e, PlayerTag{});
    world.add(e, PlayerInput{});

    PlayerControllerConfig cfg;
    cfg.crouch_mode = InputMode::Hold;
    MovementState movement;
    movement.state = MoveState::Crouching;   // entered on an earlier frame

    auto frame = [&](bool c, bool ctrl) {
        auto& rec = world.resource<InputRecord>();
        rec.keys_down[KEY_C] = c;
        rec.keys_down[KEY_LEFT_CONTROL] = ctrl;
        auto& q = world.resource<Events<ButtonEvent>>();
        q.clear();
        PlayerInputSystem::Update(world, 0.016f);
        for (const auto& ev : q.read()) MoveStateSystem::apply_button(ev, cfg, movement, GROUNDED);
    };

    frame(true, false);
    frame(true, true);
    frame(false, true);
    CHECK(movement.state == MoveState::Crouching);

    frame(false, false);
    CHECK(movement.state == MoveState::Running);
}

TEST_CASE("PlayerInputSystem::Update — axis samples from the record", "[input]") {
    ecs::World world;
    world.set_resource(InputRecord{});
    auto e = world.create();
    world.add(e, PlayerTag{});
    world.add(e, PlayerInput{});

    auto& rec = world.resource<InputRecord>();
    rec.keys_down[KEY_W] = true;
    rec.keys_down[KEY_D] = true;
    rec.mouse_delta = {4.0f, 2.0f};

    PlayerInputSystem::Update(world, 0.016f);

    const auto* in = world.try_get<PlayerInput>(e);
    REQUIRE(in != nullptr);
    CHECK_THAT(in->move_input.x, WithinAbs(0.70710678f, 1e-5f));
    CHECK_THAT(in->move_input.y, WithinAbs(0.70710678f, 1e-5f));
    CHECK(in->look_input.x == 4.0f);
    CHECK(in->look_input.y == -2.0f);
}

TEST_CASE("PlayerInputSystem::Update — right stick turns at a rate, not per frame", "[input]") {
    ecs::World world;
    world.set_resource(InputRecord{});
    auto e = world.create();
    world.add(e, PlayerTag{});
    world.add(e, PlayerInput{});

    GamepadState pad;
    pad.axes[GAMEPAD_AXIS_RIGHT_X] = 1.0f;
    world.resource<InputRecord>().gamepads.push_back(pad);

    // One 20 ms frame and two 10 ms frames cover the same turn
    PlayerInputSystem::Update(world, 0.02f);
    const float long_frame = world.try_get<PlayerInput>(e)->look_input.x;
    PlayerInputSystem::Update(world, 0.01f);
    const float short_frame = world.try_get<PlayerInput>(e)->look_input.x;

    CHECK(long_frame > 0.0f);
    CHECK_THAT(short_frame * 2.0f, WithinAbs(long_frame, 1e-4f));
}

// ---------------------------------------------------------------------------
// MoveStateSystem::Update and InteractionSystem::Update
// ---------------------------------------------------------------------------

struct ControllerWorld {
    ecs::World  world;
    ecs::Entity player;

    ControllerWorld() : player(world.create()) {
        world.set_resource(Events<ButtonEvent>{});
        world.set_resource(Events<MoveStateChangedEvent>{});
        world.set_resource(Events<InteractionEvent>{});
        world.add(player, PlayerTag{});
        world.add(player, PlayerControllerConfig{});
        world.add(player, MovementState{});
        world.add(player, Interactions{});
    }

    void press(Button b, bool pressed) {
        world.resource<Events<ButtonEvent>>().send({b, pressed});
    }

    void next_frame() {
        world.resource<Events<ButtonEvent>>().clear();
        world.resource<Events<MoveStateChangedEvent>>().clear();
        world.resource<Events<InteractionEvent>>().clear();
    }

    MovementState& movement() { return *world.try_get<MovementState>(player); }
    Interactions&  gates()    { return *world.try_get<Interactions>(player); }
};

TEST_CASE("MoveStateSystem::Update — Hold sprint emits matching changes", "[move_state]") {
    ControllerWorld cw;

    cw.press(Button::Sprint, true);
    MoveStateSystem::Update(cw.world, 0.016f);
    {
        const auto& changes = cw.world.resource<Events<MoveStateChangedEvent>>().read();
        REQUIRE(changes.size() == 1);
        CHECK(cw.world.has<PlayerTag>(changes[0].entity));
        CHECK(changes[0].from == MoveState::Running);
        CHECK(changes[0].to   == MoveState::Sprinting);
    }

    cw.next_frame();
    cw.press(Button::Sprint, false);
    MoveStateSystem::Update(cw.world, 0.016f);
    {
        const auto& changes = cw.world.resource<Events<MoveStateChangedEvent>>().read();
        REQUIRE(changes.size() == 1);
        CHECK(changes[0].from == MoveState::Sprinting);
        CHECK(changes[0].to   == MoveState::Running);
    }
    CHECK(cw.movement().state == MoveState::Running);
}

TEST_CASE("MoveStateSystem::Update — without physics the player cannot crouch or jump", "[move_state]") {
    ControllerWorld cw;

    cw.press(Button::Crouch, true);
    cw.press(Button::Jump, true);
    MoveStateSystem::Update(cw.world, 0.016f);

    CHECK(cw.movement().state == MoveState::Running);
    CHECK_FALSE(cw.movement().latches.crouch);
    CHECK_FALSE(cw.movement().jump_requested);
    CHECK(cw.world.resource<Events<MoveStateChangedEvent>>().empty());
}

TEST_CASE("MoveStateSystem::is_grounded — false without a physics context", "[move_state]") {
    ControllerWorld cw;
    CHECK_FALSE(MoveStateSystem::is_grounded(cw.world, cw.player));
}

TEST_CASE("InteractionSystem::Update — Interact reaches only the primary gate", "[interaction]") {
    ControllerWorld cw;
    int primary = 0, secondary = 0;
    cw.gates().primary.set_action([&]() { ++primary; });
    cw.gates().secondary.set_action([&]() { ++secondary; });

    cw.press(Button::Interact, true);
    cw.press(Button::Interact, false);
    InteractionSystem::Update(cw.world, 0.016f);

    CHECK(primary == 1);
    CHECK(secondary == 0);
    const auto& fired = cw.world.resource<Events<InteractionEvent>>().read();
    REQUIRE(fired.size() == 1);
    CHECK(cw.world.has<PlayerTag>(fired[0].entity));
    CHECK(fired[0].slot == InteractionSlot::Primary);
}

TEST_CASE("InteractionSystem::Update — InteractSecondary reaches only the secondary gate", "[interaction]") {
    ControllerWorld cw;
    int primary = 0, secondary = 0;
    cw.gates().primary.set_action([&]() { ++primary; });
    cw.gates().secondary.set_action([&]() { ++secondary; });

    cw.press(Button::InteractSecondary, true);
    InteractionSystem::Update(cw.world, 0.016f);

    CHECK(primary == 0);
    CHECK(secondary == 1);
    const auto& fired = cw.world.resource<Events<InteractionEvent>>().read();
    REQUIRE(fired.size() == 1);
    CHECK(fired[0].slot == InteractionSlot::Secondary);
}

TEST_CASE("InteractionSystem::Update — a closed gate emits nothing", "[interaction]") {
    ControllerWorld cw;
    int checks = 0, fired_actions = 0;
    cw.gates().primary.add_precondition([&]() { ++checks; return false; });
    cw.gates().primary.add_precondition([&]() { ++checks; return true; });
    cw.gates().primary.set_action([&]() { ++fired_actions; });

    cw.press(Button::Interact, true);
    cw.press(Button::Jump, true);
    InteractionSystem::Update(cw.world, 0.016f);

    CHECK(checks == 2);
    CHECK(fired_actions == 0);
    CHECK(cw.world.resource<Events<InteractionEvent>>().empty());
}

// ---------------------------------------------------------------------------
// Events<T>
// ---------------------------------------------------------------------------

struct TestEvent { int value; };

TEST_CASE("Events — send and read in order", "[events]") {
    Events<TestEvent> queue;
    CHECK(queue.empty());

    for (int i = 0; i < 5; ++i) queue.send({i});

    const auto& v = queue.read();
    REQUIRE(v.size() == 5);
    for (int i = 0; i < 5; ++i) CHECK(v[i].value == i);
}

TEST_CASE("EventRegistry — flush_all clears every registered queue", "[events]") {
    ecs::World world;
    world.set_resource(EventRegistry{});
    auto& registry = world.resource<EventRegistry>();
    registry.register_queue<ButtonEvent>(world);
    registry.register_queue<MoveStateChangedEvent>(world);
    CHECK(registry.queue_count() == 2);

    world.resource<Events<ButtonEvent>>().send({Button::Jump, true});
    world.resource<Events<MoveStateChangedEvent>>().send({world.create(), MoveState::Running, MoveState::Walking});

    registry.flush_all();
    CHECK(world.resource<Events<ButtonEvent>>().empty());
    CHECK(world.resource<Events<MoveStateChangedEvent>>().empty());
}

// ---------------------------------------------------------------------------
// SceneLoader
// ---------------------------------------------------------------------------

static const char* CONTROLLER_SCENE = R"({
  "simulation": { "fixed_dt": 0.01 },
  "entities": [
    {
      "transform": { "position": [1.0, 2.0, 3.0], "rotation": [0,0,0,1], "scale": [4.0, 5.0, 6.0] },
      "box_collider": { "half_extents": [2.0, 2.5, 3.0] },
      "rigid_body": { "type": "Static" },
      "tags": ["World"]
    },
    {
      "transform": { "position": [0.0, 5.0, 0.0] },
      "capsule_collider": { "half_height": 0.4, "radius": 0.3 },
      "rigid_body": { "type": "Dynamic", "mass": 70.0, "lock_rotation": true },
      "player_controller": {
        "move_speed": 6.0,
        "jump_force": 300.0,
        "crouch_mode": "Hold",
        "sprint_mode": "Toggle"
      },
      "tags": ["Player", "World"]
    }
  ]
})";

TEST_CASE("SceneLoader — correct entity count", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, CONTROLLER_SCENE));
    CHECK(world.count() == 2);
}

TEST_CASE("SceneLoader — static entity has correct transform", "[scene]") {
    ecs::World world;
    SceneLoader::load_from_string(world, CONTROLLER_SCENE);

    bool found = false;
    world.each<ecs::LocalTransform, BoxCollider>([&](ecs::Entity, ecs::LocalTransform& lt, BoxCollider& box) {
        CHECK_THAT(lt.position.x, WithinAbs(1.0f, 1e-4f));
        CHECK_THAT(lt.position.z, WithinAbs(3.0f, 1e-4f));
        CHECK_THAT(lt.scale.y,    WithinAbs(5.0f, 1e-4f));
        CHECK_THAT(box.half_extents.y, WithinAbs(2.5f, 1e-4f));
        found = true;
    });
    CHECK(found);
}

TEST_CASE("SceneLoader — player controller config and modes", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, CONTROLLER_SCENE));

    bool found = false;
    world.each<PlayerControllerConfig, PlayerTag>([&](ecs::Entity, PlayerControllerConfig& cfg, PlayerTag&) {
        CHECK_THAT(cfg.move_speed, WithinAbs(6.0f, 1e-4f));
        CHECK_THAT(cfg.jump_force, WithinAbs(300.0f, 1e-4f));
        CHECK_THAT(cfg.look_sensitivity, WithinAbs(0.1f, 1e-6f));  // default kept
        CHECK(cfg.crouch_mode == InputMode::Hold);
        CHECK(cfg.sprint_mode == InputMode::Toggle);
        CHECK(cfg.walk_mode   == InputMode::Hold);
        found = true;
    });
    CHECK(found);
}

TEST_CASE("SceneLoader — capsule and rigid body options", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, CONTROLLER_SCENE));

    int found = 0;
    world.each<CapsuleCollider, RigidBodyConfig>([&](ecs::Entity, CapsuleCollider& cap, RigidBodyConfig& rb) {
        CHECK_THAT(cap.half_height, WithinAbs(0.4f, 1e-5f));
        CHECK_THAT(cap.radius,      WithinAbs(0.3f, 1e-5f));
        CHECK(rb.type == BodyType::Dynamic);
        CHECK(rb.lock_rotation);
        ++found;
    });
    CHECK(found == 1);
}

TEST_CASE("SceneLoader — simulation settings become a resource", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, CONTROLLER_SCENE));
    auto* sim = world.try_resource<SimulationSettings>();
    REQUIRE(sim != nullptr);
    CHECK_THAT(sim->fixed_dt, WithinAbs(0.01f, 1e-6f));
}

TEST_CASE("SceneLoader — fixed_dt defaults when omitted", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, R"({ "entities": [] })"));
    CHECK_THAT(world.resource<SimulationSettings>().fixed_dt, WithinAbs(0.02f, 1e-6f));
}

TEST_CASE("SceneLoader — non-positive fixed_dt is rejected", "[scene]") {
    ecs::World world;
    CHECK_FALSE(SceneLoader::load_from_string(world,
        R"({ "simulation": { "fixed_dt": 0.0 }, "entities": [] })"));
}

TEST_CASE("SceneLoader — unknown input mode fails and spawns nothing", "[scene]") {
    ecs::World world;
    CHECK_FALSE(SceneLoader::load_from_string(world, R"({
      "entities": [
        { "tags": ["World"] },
        { "player_controller": { "crouch_mode": "Press" }, "tags": ["Player"] }
      ]
    })"));
    CHECK(world.count() == 0);
}

TEST_CASE("SceneLoader — malformed JSON returns false", "[scene]") {
    ecs::World world;
    CHECK_FALSE(SceneLoader::load_from_string(world, "{bad json"));
    CHECK(world.count() == 0);
}

TEST_CASE("SceneLoader — player entity gets PlayerInput and Interactions", "[scene]") {
    ecs::World world;
    SceneLoader::load_from_string(world, CONTROLLER_SCENE);

    int player_count = 0;
    world.each<PlayerTag, PlayerInput, Interactions>([&](ecs::Entity, PlayerTag&, PlayerInput&, Interactions& gates) {
        CHECK(gates.primary.precondition_count() == 0);
        CHECK_FALSE(gates.secondary.has_action());
        ++player_count;
    });
    CHECK(player_count == 1);
}

TEST_CASE("SceneLoader — unload removes world entities", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, CONTROLLER_SCENE));
    SceneLoader::unload(world);
    CHECK(world.count() == 0);
}

// ---------------------------------------------------------------------------
// DebugPanel
// ---------------------------------------------------------------------------

TEST_CASE("DebugPanel — rows group into sections by insertion order", "[debug]") {
    DebugPanel panel;
    panel.watch("Engine", "FPS",        []() { return std::string("60"); });
    panel.watch("Player", "Move State", []() { return std::string("Running"); });
    panel.watch("Engine", "Entities",   []() { return std::string("5"); });

    REQUIRE(panel.sections().size() == 2);
    CHECK(panel.sections()[0].title == "Engine");
    CHECK(panel.sections()[1].title == "Player");
    CHECK(panel.row_count() == 3);

    const auto* engine = panel.find("Engine");
    REQUIRE(engine != nullptr);
    REQUIRE(engine->rows.size() == 2);
    CHECK(engine->rows[1].fn() == "5");
    CHECK(panel.find("Camera") == nullptr);
}

TEST_CASE("DebugPanel — provider returns the current value", "[debug]") {
    int counter = 0;
    DebugPanel panel;
    panel.watch("Test", "Count", [&counter]() { return std::to_string(counter); });

    CHECK(panel.sections()[0].rows[0].fn() == "0");
    counter = 42;
    CHECK(panel.sections()[0].rows[0].fn() == "42");
    CHECK_FALSE(panel.visible);
}
