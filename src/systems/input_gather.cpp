#include "input_gather.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <cstring>

namespace {

constexpr int kMaxGamepads = 16;

// Some platforms enumerate laptop sensors and media-key devices as joysticks.
// A controller needs both sticks and a name that is not one of those.
bool is_controller(int i) {
    if (!IsGamepadAvailable(i) || GetGamepadAxisCount(i) < 4) return false;
    const char* name = GetGamepadName(i);
    if (!name) return false;
    for (const char* skip : {"Keyboard", "Mouse", "Touchpad", "Trackpad", "Accelerometer",
                             "Sensor", "Consumer Control", "System Control"}) {
        if (std::strstr(name, skip)) return false;
    }
    return true;
}

void poll_keyboard(InputRecord& input) {
    for (int k = 0; k < 512; k++) {
        input.keys_down[k]    = IsKeyDown(k);
        input.keys_pressed[k] = IsKeyPressed(k);
    }
}

void poll_mouse(InputRecord& input) {
    input.mouse_delta = GetMouseDelta();
    for (int b = 0; b < 8; b++) {
        input.mouse_buttons[b]         = IsMouseButtonDown(b);
        input.mouse_buttons_pressed[b] = IsMouseButtonPressed(b);
    }
}

GamepadState poll_gamepad(int i) {
    GamepadState gp;
    gp.id = i;
    const int axis_count = GetGamepadAxisCount(i);
    for (int a = 0; a < 8 && a < axis_count; a++) gp.axes[a] = GetGamepadAxisMovement(i, a);
    for (int b = 0; b < 32; b++) {
        gp.buttons[b]         = IsGamepadButtonDown(i, b);
        gp.buttons_pressed[b] = IsGamepadButtonPressed(i, b);
    }
    return gp;
}

} // namespace

void InputGatherSystem::Update(ecs::World& world) {
    if (!world.try_resource<InputRecord>()) world.set_resource(InputRecord{});
    auto& input = world.resource<InputRecord>();

    poll_keyboard(input);
    poll_mouse(input);

    const std::size_t previous = input.gamepads.size();
    input.gamepads.clear();
    for (int i = 0; i < kMaxGamepads; i++) {
        if (is_controller(i)) input.gamepads.push_back(poll_gamepad(i));
    }
    if (input.gamepads.size() != previous) {
        TraceLog(LOG_INFO, "INPUT: %d controller(s) connected", static_cast<int>(input.gamepads.size()));
    }
}
