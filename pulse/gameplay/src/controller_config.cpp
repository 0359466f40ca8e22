#include <pulse/gameplay/controller_config.hpp>
#include <pulse/core/filesystem.hpp>
#include <pulse/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <limits>

namespace pulse::gameplay {

using json = nlohmann::json;

namespace {

// nlohmann truncates floats silently when read as int; only accept integral values in range
bool read_health(const json& value, int& out) {
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) return false;
        out = static_cast<int>(v);
        return true;
    }
    auto v = value.get<int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(v);
    return true;
}

bool read_speed(const json& value, float& out) {
    if (!value.is_number()) {
        return false;
    }
    auto v = value.get<double>();
    if (!std::isfinite(v) || std::abs(v) > std::numeric_limits<float>::max()) return false;
    out = static_cast<float>(v);
    return true;
}

} // namespace

bool ControllerConfig::is_valid() const {
    return std::isfinite(speed) && speed >= 0.0f;
}

std::optional<ControllerConfig> controller_config_from_json(const json& j) {
    if (!j.is_object()) {
        core::log(core::LogLevel::Warn, "[Config] Controller config must be a JSON object");
        return std::nullopt;
    }

    ControllerConfig config;
    if (j.contains("speed") && !read_speed(j["speed"], config.speed)) {
        core::log(core::LogLevel::Warn, "[Config] 'speed' must be a finite number, got {}", j["speed"].dump());
        return std::nullopt;
    }
    if (j.contains("health") && !read_health(j["health"], config.initial_health)) {
        core::log(core::LogLevel::Warn, "[Config] 'health' must be an integer in int range, got {}", j["health"].dump());
        return std::nullopt;
    }

    if (!config.is_valid()) {
        core::log(core::LogLevel::Warn, "[Config] Invalid speed {}", config.speed);
        return std::nullopt;
    }
    return config;
}

json controller_config_to_json(const ControllerConfig& config) {
    return json{
        {"speed", config.speed},
        {"health", config.initial_health}
    };
}

std::optional<ControllerConfig> parse_controller_config(const std::string& json_text) {
    try {
        return controller_config_from_json(json::parse(json_text));
    } catch (const json::exception& e) {
        core::log(core::LogLevel::Warn, "[Config] Failed to parse controller config: {}", e.what());
        return std::nullopt;
    }
}

std::optional<ControllerConfig> load_controller_config(const std::string& path) {
    std::string content = core::FileSystem::read_text(path);
    if (content.empty()) {
        core::log(core::LogLevel::Warn, "[Config] Could not read controller config: {}", path);
        return std::nullopt;
    }
    return parse_controller_config(content);
}

bool save_controller_config(const std::string& path, const ControllerConfig& config) {
    return core::FileSystem::write_text(path, controller_config_to_json(config).dump(4));
}

} // namespace pulse::gameplay
