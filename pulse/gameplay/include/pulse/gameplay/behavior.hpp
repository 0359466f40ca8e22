#pragma once

#include <pulse/scene/entity.hpp>
#include <cstdint>

namespace pulse::gameplay {

// Returned from on_tick to tell the host whether to keep ticking the entity
enum class TickResult : uint8_t {
    Continue,
    Deactivate
};

// Lifecycle hooks driven by BehaviorHost.
// The host guarantees on_create runs before the first on_tick and that
// no two hooks of the same behavior run concurrently.
class IEntityBehavior {
public:
    virtual ~IEntityBehavior() = default;

    virtual void on_create() = 0;
    virtual TickResult on_tick() = 0;

    // other is opaque; NullEntity means the host could not identify the collider
    virtual void on_overlap(scene::Entity other) = 0;
};

} // namespace pulse::gameplay
