#pragma once

#include <entt/entt.hpp>
#include <cstdint>
#include <string>

namespace pulse::scene {

// Entity is just a type alias for entt::entity
using Entity = entt::entity;

// Null entity constant, also used as the "unknown entity" reference
constexpr Entity NullEntity = entt::null;

// Entity info component for diagnostics
struct EntityInfo {
    std::string name;
    uint64_t uuid = 0;
};

// Numeric id for log output; NullEntity prints as "null"
std::string entity_to_string(Entity e);

} // namespace pulse::scene
