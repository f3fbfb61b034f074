#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem — Render-phase system; draws the DebugPanel overlay.
//
// F3 toggles visibility (read from InputRecord, so it follows the same
// per-frame snapshot as gameplay input).
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world, float dt);
};
