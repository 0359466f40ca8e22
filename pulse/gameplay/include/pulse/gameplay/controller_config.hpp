#pragma once

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace pulse::gameplay {

// Per-entity configuration, fixed at creation.
// JSON form: { "speed": 5.0, "health": 100 }; missing keys keep the defaults.
struct ControllerConfig {
    float speed = 5.0f;
    int initial_health = 100;

    // Speed must be finite and non-negative
    bool is_valid() const;

    bool operator==(const ControllerConfig&) const = default;
};

// Throws nlohmann::json::exception on wrong value types; callers catch at the load boundary
std::optional<ControllerConfig> controller_config_from_json(const nlohmann::json& j);
nlohmann::json controller_config_to_json(const ControllerConfig& config);

std::optional<ControllerConfig> parse_controller_config(const std::string& json_text);
std::optional<ControllerConfig> load_controller_config(const std::string& path);
bool save_controller_config(const std::string& path, const ControllerConfig& config);

} // namespace pulse::gameplay
