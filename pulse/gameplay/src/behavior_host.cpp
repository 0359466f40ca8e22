#include <pulse/gameplay/behavior_host.hpp>
#include <pulse/gameplay/entity_controller.hpp>
#include <format>
#include <vector>

namespace pulse::gameplay {

namespace {

// Snapshot so hooks may attach or destroy entities while we iterate
std::vector<scene::Entity> collect_behaviors(scene::World& world) {
    std::vector<scene::Entity> entities;
    auto view = world.view<BehaviorComponent>();
    entities.reserve(view.size());
    for (auto entity : view) {
        entities.push_back(entity);
    }
    return entities;
}

} // namespace

BehaviorHost::BehaviorHost(scene::World& world, core::ILogSink& sink, core::EventDispatcher& events)
    : m_world(world)
    , m_sink(sink)
    , m_events(events) {
    m_world.registry().storage<BehaviorComponent>();
    m_world.registry().storage<TriggerVolume>();
}

bool BehaviorHost::attach(scene::Entity entity, std::unique_ptr<IEntityBehavior> behavior) {
    if (!m_world.valid(entity)) {
        emit(core::LogLevel::Warn, std::format("Cannot attach behavior to invalid entity {}",
                                               scene::entity_to_string(entity)));
        return false;
    }
    if (!behavior) {
        emit(core::LogLevel::Warn, std::format("Cannot attach null behavior to {}",
                                               m_world.name_of(entity)));
        return false;
    }

    if (m_world.has<BehaviorComponent>(entity)) {
        emit(core::LogLevel::Debug, std::format("Replacing behavior on {}", m_world.name_of(entity)));
    }

    BehaviorComponent comp;
    comp.behavior = std::move(behavior);
    m_world.emplace<BehaviorComponent>(entity, std::move(comp));
    return true;
}

scene::Entity BehaviorHost::spawn(const std::string& name, const ControllerConfig& config) {
    scene::Entity entity = m_world.create(name);
    attach(entity, std::make_unique<EntityController>(name, config, m_sink, &m_events, entity));
    return entity;
}

void BehaviorHost::detach(scene::Entity entity) {
    if (m_world.valid(entity) && m_world.has<BehaviorComponent>(entity)) {
        m_world.remove<BehaviorComponent>(entity);
    }
}

bool BehaviorHost::reactivate(scene::Entity entity) {
    if (!m_world.valid(entity)) return false;
    auto* comp = m_world.try_get<BehaviorComponent>(entity);
    if (!comp) return false;

    comp->created = false;
    comp->active = true;
    emit(core::LogLevel::Debug, std::format("Reactivating {}", m_world.name_of(entity)));
    return true;
}

IEntityBehavior* BehaviorHost::get_behavior(scene::Entity entity) {
    if (!m_world.valid(entity)) return nullptr;
    auto* comp = m_world.try_get<BehaviorComponent>(entity);
    return comp ? comp->behavior.get() : nullptr;
}

EntityController* BehaviorHost::get_controller(scene::Entity entity) {
    return dynamic_cast<EntityController*>(get_behavior(entity));
}

bool BehaviorHost::is_created(scene::Entity entity) const {
    if (!m_world.valid(entity)) return false;
    const auto* comp = m_world.try_get<BehaviorComponent>(entity);
    return comp && comp->created;
}

bool BehaviorHost::is_active(scene::Entity entity) const {
    if (!m_world.valid(entity)) return false;
    const auto* comp = m_world.try_get<BehaviorComponent>(entity);
    return comp && comp->active;
}

size_t BehaviorHost::behavior_count() const {
    return m_world.view<BehaviorComponent>().size();
}

size_t BehaviorHost::active_count() const {
    size_t count = 0;
    auto view = m_world.view<BehaviorComponent>();
    for (auto entity : view) {
        if (view.get<BehaviorComponent>(entity).active) {
            count++;
        }
    }
    return count;
}

void BehaviorHost::set_trigger(scene::Entity entity, const core::AABB& bounds) {
    if (!m_world.valid(entity)) return;
    m_world.emplace<TriggerVolume>(entity, TriggerVolume{bounds, true});
}

bool BehaviorHost::notify_overlap(scene::Entity entity, scene::Entity other) {
    return deliver_overlap(m_world, entity, other);
}

scene::SystemFn BehaviorHost::create_system() {
    return [this](scene::World& world, double) { run_create(world); };
}

scene::SystemFn BehaviorHost::tick_system() {
    return [this](scene::World& world, double) { run_tick(world); };
}

scene::SystemFn BehaviorHost::overlap_system() {
    return [this](scene::World& world, double) { run_overlap(world); };
}

void BehaviorHost::install(scene::Scheduler& scheduler) {
    scheduler.add(scene::Phase::PreUpdate, create_system(), CreateSystemName);
    scheduler.add(scene::Phase::Update, tick_system(), TickSystemName);
    scheduler.add(scene::Phase::PostUpdate, overlap_system(), OverlapSystemName);
}

void BehaviorHost::uninstall(scene::Scheduler& scheduler) {
    scheduler.remove(CreateSystemName);
    scheduler.remove(TickSystemName);
    scheduler.remove(OverlapSystemName);
}

void BehaviorHost::run_create(scene::World& world) {
    for (auto entity : collect_behaviors(world)) {
        if (!world.valid(entity)) continue;
        auto* comp = world.try_get<BehaviorComponent>(entity);
        if (!comp || comp->created) continue;

        comp->created = true;
        comp->active = true;
        comp->behavior->on_create();
    }
}

void BehaviorHost::run_tick(scene::World& world) {
    for (auto entity : collect_behaviors(world)) {
        if (!world.valid(entity)) continue;
        auto* comp = world.try_get<BehaviorComponent>(entity);
        if (!comp || !comp->created || !comp->active) continue;

        if (comp->behavior->on_tick() == TickResult::Deactivate) {
            // Re-fetch: on_tick may have replaced or removed the component
            comp = world.try_get<BehaviorComponent>(entity);
            if (comp) {
                comp->active = false;
                emit(core::LogLevel::Info, std::format("{} deactivated", world.name_of(entity)));
            }
        }
    }
}

void BehaviorHost::run_overlap(scene::World& world) {
    std::vector<std::pair<scene::Entity, core::AABB>> volumes;
    auto view = world.view<TriggerVolume>();
    for (auto entity : view) {
        const auto& trigger = view.get<TriggerVolume>(entity);
        if (trigger.enabled) {
            volumes.emplace_back(entity, trigger.bounds);
        }
    }

    // Brute force pair test; trigger counts are small
    std::set<EntityPair> current;
    for (size_t i = 0; i < volumes.size(); ++i) {
        for (size_t j = i + 1; j < volumes.size(); ++j) {
            if (!volumes[i].second.intersects(volumes[j].second)) continue;

            scene::Entity a = volumes[i].first;
            scene::Entity b = volumes[j].first;
            if (b < a) std::swap(a, b);
            current.emplace(a, b);
        }
    }

    for (const auto& pair : current) {
        if (m_overlapping.count(pair)) continue;
        deliver_overlap(world, pair.first, pair.second);
        deliver_overlap(world, pair.second, pair.first);
    }

    m_overlapping = std::move(current);
}

bool BehaviorHost::deliver_overlap(scene::World& world, scene::Entity entity, scene::Entity other) {
    if (!world.valid(entity)) return false;
    auto* comp = world.try_get<BehaviorComponent>(entity);
    if (!comp || !comp->created || !comp->active) {
        return false;
    }

    comp->behavior->on_overlap(other);
    return true;
}

void BehaviorHost::emit(core::LogLevel level, const std::string& message) {
    m_sink.log(level, LogCategory, message);
}

} // namespace pulse::gameplay
