#pragma once

#include <pulse/scene/entity.hpp>
#include <string>

namespace pulse::gameplay {

// Dispatched once, on the tick an EntityController transitions Alive -> Dead
struct EntityDiedEvent {
    scene::Entity entity = scene::NullEntity;
    std::string name;
    int health = 0;
};

// Dispatched for every overlap delivered to an EntityController
struct EntityOverlapEvent {
    scene::Entity entity = scene::NullEntity;
    scene::Entity other = scene::NullEntity;
};

} // namespace pulse::gameplay
