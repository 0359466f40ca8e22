#pragma once

#include <pulse/gameplay/controller_config.hpp>
#include <pulse/core/math.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pulse::gameplay {

class BehaviorHost;

// One entry of the "entities" array:
//   { "name": "Player", "speed": 5.0, "health": 100,
//     "movement": [x, y, z], "bounds": { "min": [x, y, z], "max": [x, y, z] } }
struct SpawnDesc {
    std::string name;
    ControllerConfig config;
    core::Vec3 movement{0.0f};
    std::optional<core::AABB> trigger;
};

// { "frames": 60, "tick_rate": 60.0, "entities": [ ... ] }
struct EntityManifest {
    uint32_t frames = 60;
    double tick_rate = 60.0;
    std::vector<SpawnDesc> entities;

    double tick_interval() const { return 1.0 / tick_rate; }
};

std::optional<EntityManifest> parse_entity_manifest(const std::string& json_text);
std::optional<EntityManifest> load_entity_manifest(const std::string& path);

// Spawns every entry through host.spawn(); returns the number spawned
size_t spawn_manifest(BehaviorHost& host, const EntityManifest& manifest);

} // namespace pulse::gameplay
