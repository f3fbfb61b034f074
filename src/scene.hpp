#pragma once
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// SceneLoader — reads JSON scene files and populates an ECS World.
//
// Components are added in lifecycle-safe order (colliders before rigid_body,
// rigid_body before player_controller) so on_add hooks see their siblings.
// The optional top-level "simulation" object becomes the SimulationSettings
// resource. No Jolt or Raylib dependency.
// ---------------------------------------------------------------------------

class SceneLoader {
public:
    // Load entities from a JSON file into world.
    // Returns false if the file cannot be opened or the JSON is malformed.
    static bool load(ecs::World& world, const std::string& path);

    // Same as load() without file I/O.
    static bool load_from_string(ecs::World& world, const std::string& json);

    // Destroy all WorldTag entities and flush deferred commands.
    static void unload(ecs::World& world);
};
