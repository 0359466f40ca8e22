#pragma once

#include <pulse/gameplay/behavior.hpp>
#include <pulse/gameplay/controller_config.hpp>
#include <pulse/core/event_dispatcher.hpp>
#include <pulse/core/log.hpp>
#include <pulse/core/math.hpp>
#include <pulse/scene/entity.hpp>
#include <cstdint>
#include <string>

namespace pulse::gameplay {

enum class LifeState : uint8_t {
    Uninitialized,
    Alive,
    Dead        // Terminal until the next on_create
};

const char* life_state_name(LifeState state);

// Health and movement state of one entity, driven by the host through IEntityBehavior.
//
// Diagnostics go to the injected sink under the "EntityController" category.
// Death is detected, never caused: ticking does not modify health or movement intent.
class EntityController : public IEntityBehavior {
public:
    static constexpr const char* LogCategory = "EntityController";

    // sink must outlive the controller; events may be null
    EntityController(std::string name,
                     const ControllerConfig& config,
                     core::ILogSink& sink,
                     core::EventDispatcher* events = nullptr,
                     scene::Entity self = scene::NullEntity);

    // Resets health to the configured value and enters Alive.
    // Calling it again re-initializes; nothing accumulates.
    void on_create() override;

    // Alive: reports the tick, then enters Dead on the first tick with health <= 0.
    // Dead: no-op.
    TickResult on_tick() override;

    // Reports the overlap; no state change
    void on_overlap(scene::Entity other) override;

    // Host-side mutation hook (damage, healing, scripted kills)
    void set_health(int health) { m_health = health; }
    int get_health() const { return m_health; }

    void set_movement_intent(const core::Vec3& intent) { m_movement_intent = intent; }
    const core::Vec3& get_movement_intent() const { return m_movement_intent; }

    // Movement intent scaled by the configured speed
    core::Vec3 desired_velocity() const { return m_movement_intent * m_config.speed; }

    float get_speed() const { return m_config.speed; }
    const ControllerConfig& get_config() const { return m_config; }

    LifeState get_state() const { return m_state; }
    bool is_alive() const { return m_state == LifeState::Alive; }
    bool is_dead() const { return m_state == LifeState::Dead; }

    const std::string& get_name() const { return m_name; }
    scene::Entity get_entity() const { return m_self; }

    // Ticks processed while Alive since the last on_create
    uint64_t get_tick_count() const { return m_tick_count; }

private:
    void emit(core::LogLevel level, const std::string& message);

    const ControllerConfig m_config;
    const std::string m_name;
    const scene::Entity m_self;

    core::ILogSink& m_sink;
    core::EventDispatcher* m_events;

    LifeState m_state = LifeState::Uninitialized;
    int m_health;
    core::Vec3 m_movement_intent{0.0f};
    uint64_t m_tick_count = 0;
};

} // namespace pulse::gameplay
