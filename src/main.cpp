#include "components.hpp"
#include "debug_panel.hpp"
#include "input_state.hpp"
#include "pipeline.hpp"
#include "scene.hpp"
#include "modules/camera_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/input_module.hpp"
#include "modules/physics_module.hpp"
#include "modules/player_module.hpp"
#include "systems/controller_log.hpp"
#include "systems/interaction.hpp"
#include "systems/look.hpp"
#include "systems/move_state.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

static const char* SCENE_PATH = "resources/scenes/default.json";

static void set_cursor_locked(bool locked) {
    if (locked) DisableCursor();
    else        EnableCursor();
}

// Example gates: the primary interaction only fires with a locked cursor
// while standing on something; the secondary one always fires.
static void wire_interactions(ecs::World& world) {
    world.each<PlayerTag, Interactions>([&](ecs::Entity e, PlayerTag&, Interactions& gates) {
        gates.primary.clear();
        gates.primary.add_precondition([]() { return IsCursorHidden(); });
        gates.primary.add_precondition([&world, e]() { return MoveStateSystem::is_grounded(world, e); });
        gates.primary.set_action([]() { TraceLog(LOG_INFO, "PLAYER: Interact"); });

        gates.secondary.clear();
        gates.secondary.set_action([]() { TraceLog(LOG_INFO, "PLAYER: Secondary interact"); });
    });
}

static bool load_scene(ecs::World& world) {
    if (!SceneLoader::load(world, SCENE_PATH)) {
        TraceLog(LOG_ERROR, "SCENE: Failed to load '%s'", SCENE_PATH);
        return false;
    }
    // The player respawns with its authored pose, so the view and totals restart too.
    LookSystem::reset_view(world);
    ControllerLogSystem::reset(world);
    wire_interactions(world);
    return true;
}

int main() {
  InitWindow(1280, 720, "First-Person Controller");
  SetTargetFPS(60);
  SetExitKey(KEY_NULL); // Escape is not a quit key while the cursor is locked

  ecs::World world;
  ecs::Pipeline pipeline;

  // --- Module installation (order matters, see each module header) ---
  EventBusModule::install(world, pipeline);
  DebugModule::install(world, pipeline);
  InputModule::install(world, pipeline);
  PlayerModule::install(world, pipeline);
  CameraModule::install(world, pipeline);
  PlayerModule::install_log(world, pipeline);
  PlayerModule::install_motor(world, pipeline);
  PhysicsModule::install(world, pipeline);

  world.resource<DebugPanel>().visible = true;

  if (!load_scene(world)) {
    CloseWindow();
    return 1;
  }

  bool cursor_locked = true;
  set_cursor_locked(cursor_locked);

  // --- Main Loop ---
  float accumulator = 0.0f;

  while (!WindowShouldClose()) {
    float dt = GetFrameTime();

    // 1. Input & Logic (variable tick)
    pipeline.update(world, dt);

    if (const auto* record = world.try_resource<InputRecord>()) {
      if (record->keys_pressed[KEY_TAB]) {
        cursor_locked = !cursor_locked;
        set_cursor_locked(cursor_locked);
      }
      if (record->keys_pressed[KEY_R]) {
        SceneLoader::unload(world);
        if (!load_scene(world)) break;
        accumulator = 0.0f;
      }
    }

    // 2. Motion & Physics (fixed tick)
    const float fixed_dt = world.resource<SimulationSettings>().fixed_dt;
    accumulator += dt;
    while (accumulator >= fixed_dt) {
      pipeline.step_physics(world, fixed_dt);
      accumulator -= fixed_dt;
    }

    // 3. Overlay
    BeginDrawing();
    ClearBackground(Color{30, 30, 36, 255});
    pipeline.render(world);
    EndDrawing();
  }

  CloseWindow();
  return 0;
}
