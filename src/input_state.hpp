#pragma once
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <vector>

// Raw device snapshot for one frame, written by InputGatherSystem.
// *_down is the level this frame; *_pressed is the edge raylib saw since the
// previous frame. Releases are derived from the level by PlayerInputSystem.

struct GamepadState {
    int id = -1;
    float axes[8] = {0};
    bool buttons[32] = {false};
    bool buttons_pressed[32] = {false};
};

struct InputRecord {
    bool keys_down[512] = {false};
    bool keys_pressed[512] = {false};

    Vector2 mouse_delta = {0, 0};
    bool mouse_buttons[8] = {false};
    bool mouse_buttons_pressed[8] = {false};

    // Real controllers only; see InputGatherSystem.
    std::vector<GamepadState> gamepads;
};
