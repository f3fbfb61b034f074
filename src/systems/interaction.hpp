#pragma once
#include <ecs/ecs.hpp>
#include <functional>
#include <vector>

// ---------------------------------------------------------------------------
// InteractionGate — "all preconditions must pass" guard around an action.
//
// Preconditions run in registration order and are never short-circuited:
// every one is called on every press, even after one has failed. An empty
// precondition list passes. The action is optional; when it is unset a
// passing gate simply does nothing.
// ---------------------------------------------------------------------------

class InteractionGate {
public:
    using Precondition = std::function<bool()>;
    using Action       = std::function<void()>;

    void add_precondition(Precondition check) { preconditions_.push_back(std::move(check)); }
    void set_action(Action action)            { action_ = std::move(action); }
    void clear()                              { preconditions_.clear(); action_ = nullptr; }

    std::size_t precondition_count() const { return preconditions_.size(); }
    bool        has_action()         const { return static_cast<bool>(action_); }

    // Returns true when the gate opened (pressed and every check passed).
    bool evaluate(bool pressed) const;

private:
    std::vector<Precondition> preconditions_;
    Action                    action_;
};

bool evaluate_gate(bool pressed,
                   const std::vector<InteractionGate::Precondition>& preconditions,
                   const InteractionGate::Action& action);

// Two independent gates per controlled entity.
struct Interactions {
    InteractionGate primary;
    InteractionGate secondary;
};

// Routes Interact / InteractSecondary button edges to the matching gate and
// emits InteractionEvent for every gate that opens. Logic phase.
class InteractionSystem {
public:
    static void Update(ecs::World& world, float dt);
};
