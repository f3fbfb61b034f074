#include "player_input.hpp"
#include "../components.hpp"
#include "../math_util.hpp"
#include <raylib.h>

using namespace ecs;
using namespace fpc::math;

namespace {

constexpr float kStickDeadzone = 0.15f;
// Full right-stick deflection in look units per second. Mouse deltas are
// already per frame; the stick is a rate, so it is scaled by dt to turn at
// the same speed at any frame rate. 1200 * 0.1 sensitivity = 120 deg/s.
constexpr float kStickLookRate = 1200.0f;

struct ButtonBinding {
    Button button;
    int    keys[2];
    int    mouse_button;   // -1 = unbound
    int    gamepad_button; // -1 = unbound
};

// One row per Button, in enum order.
constexpr ButtonBinding kBindings[kButtonCount] = {
    {Button::Jump,              {KEY_SPACE,        -1},               -1,                 GAMEPAD_BUTTON_RIGHT_FACE_DOWN},
    {Button::Interact,          {KEY_E,            -1},               MOUSE_BUTTON_LEFT,  GAMEPAD_BUTTON_RIGHT_FACE_LEFT},
    {Button::InteractSecondary, {KEY_F,            -1},               MOUSE_BUTTON_RIGHT, GAMEPAD_BUTTON_RIGHT_FACE_UP},
    {Button::Crouch,            {KEY_C,            KEY_LEFT_CONTROL}, -1,                 GAMEPAD_BUTTON_RIGHT_THUMB},
    {Button::Sprint,            {KEY_LEFT_SHIFT,   -1},               -1,                 GAMEPAD_BUTTON_LEFT_THUMB},
    {Button::Walk,              {KEY_LEFT_ALT,     -1},               -1,                 GAMEPAD_BUTTON_LEFT_TRIGGER_1},
};

// Any binding of the action is held this frame.
bool any_down(const InputRecord& record, const ButtonBinding& b) {
    for (int key : b.keys) {
        if (key >= 0 && record.keys_down[key]) return true;
    }
    if (b.mouse_button >= 0 && record.mouse_buttons[b.mouse_button]) return true;
    if (b.gamepad_button >= 0) {
        for (const auto& gp : record.gamepads) {
            if (gp.buttons[b.gamepad_button]) return true;
        }
    }
    return false;
}

// Any binding of the action went down since the previous frame.
bool any_pressed(const InputRecord& record, const ButtonBinding& b) {
    for (int key : b.keys) {
        if (key >= 0 && record.keys_pressed[key]) return true;
    }
    if (b.mouse_button >= 0 && record.mouse_buttons_pressed[b.mouse_button]) return true;
    if (b.gamepad_button >= 0) {
        for (const auto& gp : record.gamepads) {
            if (gp.buttons_pressed[b.gamepad_button]) return true;
        }
    }
    return false;
}

} // namespace

void PlayerInputSystem::emit_button_edges(const InputRecord& record,
                                          ButtonHoldState& hold,
                                          Events<ButtonEvent>& out) {
    for (const auto& b : kBindings) {
        bool& was_down = hold.held[static_cast<std::size_t>(b.button)];
        const bool down = any_down(record, b);

        if (down != was_down) {
            out.send({b.button, down});
        } else if (!down && any_pressed(record, b)) {
            // Tapped between two polls
            out.send({b.button, true});
            out.send({b.button, false});
        }
        was_down = down;
    }
}

void PlayerInputSystem::Update(World& world, float dt) {
    auto* input_ptr = world.try_resource<InputRecord>();
    if (!input_ptr) return;
    const auto& record = *input_ptr;

    // --- Button edges ---
    if (auto* events = world.try_resource<Events<ButtonEvent>>()) {
        if (!world.try_resource<ButtonHoldState>()) world.set_resource(ButtonHoldState{});
        emit_button_edges(record, world.resource<ButtonHoldState>(), *events);
    }

    // --- Axis samples (last sample wins) ---
    world.each<PlayerTag, PlayerInput>([&](Entity, PlayerTag&, PlayerInput& input) {
        ecs::Vec2 move = {0, 0};
        if (record.keys_down[KEY_W]) move.y += 1.0f;
        if (record.keys_down[KEY_S]) move.y -= 1.0f;
        if (record.keys_down[KEY_A]) move.x -= 1.0f;
        if (record.keys_down[KEY_D]) move.x += 1.0f;

        // Raylib reports screen-space y (down is positive); look y is up-positive.
        ecs::Vec2 look = {record.mouse_delta.x, -record.mouse_delta.y};

        for (const auto& gp : record.gamepads) {
            move.x += apply_deadzone(gp.axes[GAMEPAD_AXIS_LEFT_X], kStickDeadzone);
            move.y -= apply_deadzone(gp.axes[GAMEPAD_AXIS_LEFT_Y], kStickDeadzone);
            look.x += apply_deadzone(gp.axes[GAMEPAD_AXIS_RIGHT_X], kStickDeadzone) * kStickLookRate * dt;
            look.y -= apply_deadzone(gp.axes[GAMEPAD_AXIS_RIGHT_Y], kStickDeadzone) * kStickLookRate * dt;
        }

        input.move_input = clamp_unit(move);
        input.look_input = look;
    });
}
