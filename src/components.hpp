#pragma once
#include <ecs/ecs.hpp>

// Plain data components. No Jolt or Raylib dependency, so everything in here
// can be used from the headless test target.

// ---------------------------------------------------------------------------
// Physics Configuration (Authoring)
// ---------------------------------------------------------------------------

enum class BodyType { Static, Kinematic, Dynamic };

struct BoxCollider {
    ecs::Vec3 half_extents = {0.5f, 0.5f, 0.5f};
};

struct SphereCollider {
    float radius = 0.5f;
};

// Upright capsule. Total half height is half_height + radius.
struct CapsuleCollider {
    float half_height = 0.5f;
    float radius      = 0.5f;
};

// If present, PhysicsSystem creates a Jolt body for this entity
struct RigidBodyConfig {
    BodyType type = BodyType::Dynamic;
    float mass = 1.0f;
    float friction = 0.5f;
    float restitution = 0.0f;
    bool sensor = false;
    bool lock_rotation = false; // translation-only DOFs (player bodies)
};

// ---------------------------------------------------------------------------
// Player controller
// ---------------------------------------------------------------------------

enum class MoveState { Sprinting, Running, Walking, Crouching, Crawling, Idle };

// Toggle: press once to turn on, press again to turn off.
// Hold:   on while held, off on release.
enum class InputMode { Toggle, Hold };

struct PlayerControllerConfig {
    float move_speed          = 5.0f;  // units per second at multiplier 1
    float jump_force          = 5.0f;  // upward impulse
    float look_sensitivity    = 0.1f;  // degrees per unit of look input
    float ground_probe_length = 1.1f;  // measured from the body centre
    float eye_height          = 0.6f;  // camera offset above the body centre
    InputMode crouch_mode = InputMode::Toggle;
    InputMode sprint_mode = InputMode::Hold;
    InputMode walk_mode   = InputMode::Hold;
};

// One latch per toggle-capable action. Only flipped in Toggle mode.
struct ActionLatches {
    bool crouch = false;
    bool sprint = false;
    bool walk   = false;
};

struct MovementState {
    MoveState     state = MoveState::Running;
    ActionLatches latches;
    bool          jump_requested = false; // consumed by the next fixed tick
};

// Latest raw axis samples. Overwritten every frame, never smoothed here.
struct PlayerInput {
    ecs::Vec2 move_input = {0, 0}; // x = strafe, y = forward/back
    ecs::Vec2 look_input = {0, 0}; // x = yaw, y = pitch
};

// ---------------------------------------------------------------------------
// Camera (collaborator for pitch; stored as a World resource)
// ---------------------------------------------------------------------------

struct MainCamera {
    // Accumulated pitch. Never clamped or wrapped, so the view can roll over
    // the top.
    float pitch_degrees = 0.0f;

    // Derived each frame by LookSystem
    ecs::Vec3 position     = {0, 0, 0};
    ecs::Vec3 view_forward = {0, 0, 1};
    ecs::Vec3 view_right   = {-1, 0, 0};
    ecs::Vec3 view_up      = {0, 1, 0};

    void rotate_pitch(float degrees) { pitch_degrees += degrees; }
};

// ---------------------------------------------------------------------------
// Simulation
// ---------------------------------------------------------------------------

struct SimulationSettings {
    float fixed_dt = 0.02f;
};

struct PlayerTag {};
struct WorldTag {};
