#pragma once
#include "components.hpp"
#include <ecs/ecs.hpp>
#include <cstddef>
#include <functional>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T> — typed, frame-scoped event queue
//
// Stored as a World resource. Systems emit via send() and consume via read().
// EventRegistry::flush_all() clears all queues at the start of each frame.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    std::size_t           size()   const  { return buffer_.size(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// ---------------------------------------------------------------------------
// EventRegistry — flush coordinator (stored as a World resource)
//
// Call register_queue<T>(world) once per event type during startup.
// Call flush_all() as the first Pre-Update step each frame.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        world.set_resource(Events<T>{});
        flush_fns_.push_back([&world]() {
            if (auto* q = world.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all() {
        for (auto& fn : flush_fns_) fn();
    }

    std::size_t queue_count() const { return flush_fns_.size(); }

private:
    std::vector<std::function<void()>> flush_fns_;
};

// ---------------------------------------------------------------------------
// Concrete event types
// ---------------------------------------------------------------------------

enum class Button { Jump, Interact, InteractSecondary, Crouch, Sprint, Walk };
constexpr std::size_t kButtonCount = 6;

// Emitted by PlayerInputSystem when an action goes up or down. An action with
// several bindings is down while any of them is, so it produces one press and
// one release however many devices are involved. Within a frame, edges follow
// the order of the Button enum; consumers apply them in queue order.
struct ButtonEvent {
    Button button;
    bool   pressed;
};

// Emitted by MoveStateSystem whenever a button edge changes MoveState.
struct MoveStateChangedEvent {
    ecs::Entity entity;
    MoveState   from;
    MoveState   to;
};

enum class InteractionSlot { Primary, Secondary };

// Emitted by InteractionSystem when every precondition of a gate passed.
struct InteractionEvent {
    ecs::Entity     entity;
    InteractionSlot slot;
};
