#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>

namespace ecs {

/**
 * @brief Groups systems by execution phase.
 *
 * The host drives two clocks: update() once per frame with the frame time,
 * and step_physics() zero or more times per frame with the fixed tick. No
 * phase ever runs while another is in progress.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(World&, float)>;

    void add_pre_update(SystemFunc func) { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func) { logic_.push_back(std::move(func)); }
    void add_physics(SystemFunc func) { physics_.push_back(std::move(func)); }
    void add_render(SystemFunc func) { render_.push_back(std::move(func)); }

    /**
     * @brief Frame tick: input, then gameplay logic.
     */
    void update(World& world, float dt) {
        // 1. Input / Pre-processing
        for (auto& sys : pre_update_) sys(world, dt);

        // 2. Gameplay Logic
        for (auto& sys : logic_) sys(world, dt);

        // 3. Apply structural changes before the fixed steps see the world
        world.deferred().flush(world);
    }

    /**
     * @brief Fixed tick: motion forwarding and the physics step.
     */
    void step_physics(World& world, float fixed_dt) {
        for (auto& sys : physics_) sys(world, fixed_dt);
    }

    void render(World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> physics_;
    std::vector<SystemFunc> render_;
};

} // namespace ecs
