#include "interaction.hpp"
#include "../components.hpp"
#include "../events.hpp"

using namespace ecs;

bool evaluate_gate(bool pressed,
                   const std::vector<InteractionGate::Precondition>& preconditions,
                   const InteractionGate::Action& action) {
    if (!pressed) return false;

    bool passed = true;
    for (const auto& check : preconditions) {
        // Called before the AND so a failed check never skips the rest.
        bool ok = check ? check() : true;
        passed = passed && ok;
    }
    if (!passed) return false;

    if (action) action();
    return true;
}

bool InteractionGate::evaluate(bool pressed) const {
    return evaluate_gate(pressed, preconditions_, action_);
}

void InteractionSystem::Update(World& world, float /*dt*/) {
    const auto* buttons = world.try_resource<Events<ButtonEvent>>();
    if (!buttons || buttons->empty()) return;
    auto* fired = world.try_resource<Events<InteractionEvent>>();

    world.each<PlayerTag, Interactions>([&](Entity e, PlayerTag&, Interactions& gates) {
        for (const auto& ev : buttons->read()) {
            if (ev.button == Button::Interact) {
                if (gates.primary.evaluate(ev.pressed) && fired)
                    fired->send({e, InteractionSlot::Primary});
            } else if (ev.button == Button::InteractSecondary) {
                if (gates.secondary.evaluate(ev.pressed) && fired)
                    fired->send({e, InteractionSlot::Secondary});
            }
        }
    });
}
