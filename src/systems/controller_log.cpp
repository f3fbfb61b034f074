#include "controller_log.hpp"
#include "move_state.hpp"
#include "../events.hpp"
#include <raylib.h>

void ControllerLogSystem::Update(ecs::World& world, float /*dt*/) {
    auto* stats = world.try_resource<ControllerStats>();

    if (const auto* evts = world.try_resource<Events<MoveStateChangedEvent>>()) {
        for (const auto& ev : evts->read()) {
            TraceLog(LOG_DEBUG, "PLAYER: %s -> %s",
                     MoveStateSystem::to_string(ev.from), MoveStateSystem::to_string(ev.to));
            if (stats) stats->state_changes++;
        }
    }

    if (const auto* evts = world.try_resource<Events<InteractionEvent>>()) {
        for (const auto& ev : evts->read()) {
            bool primary = (ev.slot == InteractionSlot::Primary);
            TraceLog(LOG_DEBUG, "PLAYER: %s interaction fired", primary ? "Primary" : "Secondary");
            if (!stats) continue;
            if (primary) stats->primary_interacts++;
            else         stats->secondary_interacts++;
        }
    }
}

void ControllerLogSystem::reset(ecs::World& world) {
    if (auto* stats = world.try_resource<ControllerStats>()) *stats = ControllerStats{};
}
