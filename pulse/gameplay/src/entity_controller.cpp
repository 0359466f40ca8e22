#include <pulse/gameplay/entity_controller.hpp>
#include <pulse/gameplay/controller_events.hpp>
#include <format>
#include <utility>

namespace pulse::gameplay {

const char* life_state_name(LifeState state) {
    switch (state) {
        case LifeState::Uninitialized: return "Uninitialized";
        case LifeState::Alive:         return "Alive";
        case LifeState::Dead:          return "Dead";
    }
    return "Unknown";
}

EntityController::EntityController(std::string name,
                                   const ControllerConfig& config,
                                   core::ILogSink& sink,
                                   core::EventDispatcher* events,
                                   scene::Entity self)
    : m_config(config)
    , m_name(std::move(name))
    , m_self(self)
    , m_sink(sink)
    , m_events(events)
    , m_health(config.initial_health) {}

void EntityController::on_create() {
    m_health = m_config.initial_health;
    m_state = LifeState::Alive;
    m_tick_count = 0;

    emit(core::LogLevel::Info, std::format("{} initialized (health {}, speed {})",
                                           m_name, m_health, m_config.speed));
}

TickResult EntityController::on_tick() {
    switch (m_state) {
        case LifeState::Uninitialized:
            emit(core::LogLevel::Warn, std::format("{} ticked before on_create, ignoring", m_name));
            return TickResult::Continue;
        case LifeState::Dead:
            return TickResult::Deactivate;
        case LifeState::Alive:
            break;
    }

    ++m_tick_count;
    emit(core::LogLevel::Trace, std::format("Updating {}...", m_name));

    if (m_health > 0) {
        return TickResult::Continue;
    }

    m_state = LifeState::Dead;
    emit(core::LogLevel::Info, std::format("{} died (health {})", m_name, m_health));

    if (m_events) {
        m_events->dispatch(EntityDiedEvent{m_self, m_name, m_health});
    }
    return TickResult::Deactivate;
}

void EntityController::on_overlap(scene::Entity other) {
    emit(core::LogLevel::Info, std::format("{} overlap entered with entity {}",
                                           m_name, scene::entity_to_string(other)));

    if (m_events) {
        m_events->dispatch(EntityOverlapEvent{m_self, other});
    }
}

void EntityController::emit(core::LogLevel level, const std::string& message) {
    m_sink.log(level, LogCategory, message);
}

} // namespace pulse::gameplay
