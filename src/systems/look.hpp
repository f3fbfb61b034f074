#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"

// Mouse / right-stick look. Runs every frame in the Logic phase.
//
// Horizontal input turns the player body (yaw about world up, positive turns
// right); vertical input pitches MainCamera only (positive looks up). Pitch
// accumulates without limit.
class LookSystem {
public:
    struct LookDelta {
        float yaw_degrees   = 0.0f;
        float pitch_degrees = 0.0f;
    };

    static void Update(ecs::World& world, float dt);

    // Levels the camera (pitch 0) and restores the default view basis.
    // The body's yaw is reset by respawning it, so a scene reload calls this
    // to keep the view in step with the fresh body.
    static void reset_view(ecs::World& world);

    // Pure input scaling, no Jolt dependency. Exposed for unit testing.
    static LookDelta compute_look(const ecs::Vec2& look_input, float sensitivity);
};
