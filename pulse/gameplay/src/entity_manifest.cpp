#include <pulse/gameplay/entity_manifest.hpp>
#include <pulse/gameplay/behavior_host.hpp>
#include <pulse/gameplay/entity_controller.hpp>
#include <pulse/core/filesystem.hpp>
#include <pulse/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>

namespace pulse::gameplay {

using json = nlohmann::json;

namespace {

bool read_vec3(const json& j, core::Vec3& out) {
    if (!j.is_array() || j.size() != 3) {
        return false;
    }
    for (const auto& v : j) {
        if (!v.is_number()) return false;
    }
    out = core::Vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
    return true;
}

bool read_frames(const json& j, uint32_t& out) {
    if (!j.is_number_integer()) {
        return false;
    }
    if (j.is_number_unsigned()) {
        auto v = j.get<uint64_t>();
        if (v > UINT32_MAX) return false;
        out = static_cast<uint32_t>(v);
        return true;
    }
    auto v = j.get<int64_t>();
    if (v < 0 || v > static_cast<int64_t>(UINT32_MAX)) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

std::optional<SpawnDesc> read_spawn_desc(const json& j, size_t index) {
    if (!j.is_object()) {
        core::log(core::LogLevel::Warn, "[Manifest] Entity {} is not an object", index);
        return std::nullopt;
    }

    SpawnDesc desc;
    desc.name = j.value("name", std::string());
    if (desc.name.empty()) {
        core::log(core::LogLevel::Warn, "[Manifest] Entity {} has no name", index);
        return std::nullopt;
    }

    auto config = controller_config_from_json(j);
    if (!config) {
        core::log(core::LogLevel::Warn, "[Manifest] Entity '{}' has an invalid config", desc.name);
        return std::nullopt;
    }
    desc.config = *config;

    if (j.contains("movement") && !read_vec3(j["movement"], desc.movement)) {
        core::log(core::LogLevel::Warn, "[Manifest] Entity '{}' movement must be [x, y, z]", desc.name);
        return std::nullopt;
    }

    if (j.contains("bounds")) {
        const auto& b = j["bounds"];
        core::AABB bounds;
        if (!b.is_object() || !b.contains("min") || !b.contains("max") ||
            !read_vec3(b["min"], bounds.min) || !read_vec3(b["max"], bounds.max)) {
            core::log(core::LogLevel::Warn, "[Manifest] Entity '{}' bounds need min and max", desc.name);
            return std::nullopt;
        }
        desc.trigger = bounds;
    }

    return desc;
}

} // namespace

std::optional<EntityManifest> parse_entity_manifest(const std::string& json_text) {
    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            core::log(core::LogLevel::Warn, "[Manifest] Root must be a JSON object");
            return std::nullopt;
        }

        EntityManifest manifest;
        if (j.contains("frames") && !read_frames(j["frames"], manifest.frames)) {
            core::log(core::LogLevel::Warn, "[Manifest] frames must be an integer in [0, {}], got {}",
                      UINT32_MAX, j["frames"].dump());
            return std::nullopt;
        }
        manifest.tick_rate = j.value("tick_rate", manifest.tick_rate);
        if (!(manifest.tick_rate > 0.0)) {
            core::log(core::LogLevel::Warn, "[Manifest] tick_rate must be positive");
            return std::nullopt;
        }

        if (j.contains("entities")) {
            const auto& entities = j["entities"];
            if (!entities.is_array()) {
                core::log(core::LogLevel::Warn, "[Manifest] 'entities' must be an array");
                return std::nullopt;
            }
            for (size_t i = 0; i < entities.size(); ++i) {
                auto desc = read_spawn_desc(entities[i], i);
                if (!desc) {
                    return std::nullopt;
                }
                manifest.entities.push_back(std::move(*desc));
            }
        }

        return manifest;
    } catch (const json::exception& e) {
        core::log(core::LogLevel::Warn, "[Manifest] Failed to parse: {}", e.what());
        return std::nullopt;
    }
}

std::optional<EntityManifest> load_entity_manifest(const std::string& path) {
    std::string content = core::FileSystem::read_text(path);
    if (content.empty()) {
        core::log(core::LogLevel::Warn, "[Manifest] Could not read: {}", path);
        return std::nullopt;
    }
    return parse_entity_manifest(content);
}

size_t spawn_manifest(BehaviorHost& host, const EntityManifest& manifest) {
    size_t spawned = 0;
    for (const auto& desc : manifest.entities) {
        scene::Entity entity = host.spawn(desc.name, desc.config);
        if (auto* controller = host.get_controller(entity)) {
            controller->set_movement_intent(desc.movement);
            spawned++;
        }
        if (desc.trigger) {
            host.set_trigger(entity, *desc.trigger);
        }
    }
    return spawned;
}

} // namespace pulse::gameplay
