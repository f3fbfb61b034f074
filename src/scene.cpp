#include "scene.hpp"
#include "components.hpp"
#include "systems/interaction.hpp"
#include <ecs/modules/transform.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ecs::Vec3 parse_vec3(const json& j) {
    return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>()};
}

static ecs::Quat parse_quat(const json& j) {
    // stored as [x, y, z, w]
    return {j[0].get<float>(), j[1].get<float>(), j[2].get<float>(), j[3].get<float>()};
}

static BodyType parse_body_type(const std::string& s) {
    if (s == "Static")    return BodyType::Static;
    if (s == "Dynamic")   return BodyType::Dynamic;
    if (s == "Kinematic") return BodyType::Kinematic;
    throw std::runtime_error("SceneLoader: unknown body type '" + s + "'");
}

static InputMode parse_input_mode(const json& obj, const char* key, InputMode fallback) {
    if (!obj.contains(key)) return fallback;
    const std::string s = obj[key].get<std::string>();
    if (s == "Toggle") return InputMode::Toggle;
    if (s == "Hold")   return InputMode::Hold;
    throw std::runtime_error("SceneLoader: unknown input mode '" + s + "' for " + key);
}

static PlayerControllerConfig parse_player_controller(const json& pc) {
    PlayerControllerConfig cfg;
    cfg.move_speed          = pc.value("move_speed",          cfg.move_speed);
    cfg.jump_force          = pc.value("jump_force",          cfg.jump_force);
    cfg.look_sensitivity    = pc.value("look_sensitivity",    cfg.look_sensitivity);
    cfg.ground_probe_length = pc.value("ground_probe_length", cfg.ground_probe_length);
    cfg.eye_height          = pc.value("eye_height",          cfg.eye_height);
    cfg.crouch_mode = parse_input_mode(pc, "crouch_mode", cfg.crouch_mode);
    cfg.sprint_mode = parse_input_mode(pc, "sprint_mode", cfg.sprint_mode);
    cfg.walk_mode   = parse_input_mode(pc, "walk_mode",   cfg.walk_mode);
    return cfg;
}

// ---------------------------------------------------------------------------
// Entity spawning
// ---------------------------------------------------------------------------

static void spawn_entity(ecs::World& world, const json& e) {
    auto ent = world.create();

    // 1. LocalTransform + WorldTransform (must precede physics hooks)
    if (e.contains("transform")) {
        const auto& t = e["transform"];
        ecs::Vec3 pos = t.contains("position") ? parse_vec3(t["position"]) : ecs::Vec3{0,0,0};
        ecs::Quat rot = t.contains("rotation") ? parse_quat(t["rotation"]) : ecs::Quat{0,0,0,1};
        ecs::Vec3 scl = t.contains("scale")    ? parse_vec3(t["scale"])    : ecs::Vec3{1,1,1};
        world.add(ent, ecs::LocalTransform{pos, rot, scl});
        world.add(ent, ecs::WorldTransform{});
    }

    // 2. Colliders (must precede RigidBodyConfig so PhysicsSystem can read them)
    if (e.contains("box_collider")) {
        world.add(ent, BoxCollider{parse_vec3(e["box_collider"]["half_extents"])});
    }
    if (e.contains("sphere_collider")) {
        world.add(ent, SphereCollider{e["sphere_collider"]["radius"].get<float>()});
    }
    if (e.contains("capsule_collider")) {
        const auto& c = e["capsule_collider"];
        world.add(ent, CapsuleCollider{c.value("half_height", 0.5f), c.value("radius", 0.5f)});
    }

    // 3. Rigid body (triggers PhysicsSystem's on_add hook)
    if (e.contains("rigid_body")) {
        const auto& rb = e["rigid_body"];
        RigidBodyConfig cfg;
        cfg.type          = parse_body_type(rb.value("type", std::string("Dynamic")));
        cfg.mass          = rb.value("mass",          1.0f);
        cfg.friction      = rb.value("friction",      0.5f);
        cfg.restitution   = rb.value("restitution",   0.0f);
        cfg.sensor        = rb.value("sensor",        false);
        cfg.lock_rotation = rb.value("lock_rotation", false);
        world.add(ent, std::move(cfg));
    }

    // 4. Tags and player-specific components. PlayerInput and Interactions go
    //    in before the controller config so its hook sees a complete player.
    if (e.contains("tags")) {
        for (const auto& tag : e["tags"]) {
            const std::string t = tag.get<std::string>();
            if (t == "World")  world.add(ent, WorldTag{});
            if (t == "Player") {
                world.add(ent, PlayerTag{});
                world.add(ent, PlayerInput{});
                world.add(ent, Interactions{});
            }
        }
    }

    // 5. Controller last: its on_add hook expects the body and tags in place
    if (e.contains("player_controller")) {
        world.add(ent, parse_player_controller(e["player_controller"]));
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SceneLoader::load_from_string(ecs::World& world, const std::string& json_str) {
    try {
        json scene = json::parse(json_str);

        // Validate every entity before spawning any, so a bad scene leaves
        // the world untouched.
        const auto& entities = scene.at("entities");
        for (const auto& entity_json : entities) {
            if (entity_json.contains("rigid_body"))
                parse_body_type(entity_json["rigid_body"].value("type", std::string("Dynamic")));
            if (entity_json.contains("player_controller"))
                parse_player_controller(entity_json["player_controller"]);
        }

        SimulationSettings sim;
        if (scene.contains("simulation")) {
            sim.fixed_dt = scene["simulation"].value("fixed_dt", sim.fixed_dt);
            if (sim.fixed_dt <= 0.0f)
                throw std::runtime_error("SceneLoader: simulation.fixed_dt must be positive");
        }
        world.set_resource(sim);

        for (const auto& entity_json : entities) {
            spawn_entity(world, entity_json);
        }
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool SceneLoader::load(ecs::World& world, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(world, content);
}

void SceneLoader::unload(ecs::World& world) {
    std::vector<ecs::Entity> to_destroy;
    world.each<WorldTag>([&](ecs::Entity e, WorldTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
    world.deferred().flush(world);
}
