#pragma once
#include <ecs/ecs.hpp>

// Polls raylib once per frame and stores the raw snapshot in the InputRecord
// World resource (created on first use). Pre-Update phase, first input step.
class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};
