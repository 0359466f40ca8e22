#pragma once

#include <pulse/gameplay/behavior.hpp>
#include <pulse/gameplay/controller_config.hpp>
#include <pulse/core/event_dispatcher.hpp>
#include <pulse/core/log.hpp>
#include <pulse/core/math.hpp>
#include <pulse/scene/systems.hpp>
#include <pulse/scene/world.hpp>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace pulse::gameplay {

class EntityController;

// Behavior attached to an entity, owned by the World
struct BehaviorComponent {
    std::unique_ptr<IEntityBehavior> behavior;
    bool created = false;   // on_create has run
    bool active = true;     // still ticked and notified of overlaps
};

// World-space trigger bounds used by the overlap broadcast
struct TriggerVolume {
    core::AABB bounds;
    bool enabled = true;
};

// Drives IEntityBehavior hooks from Scheduler phases:
//   PreUpdate  - on_create for newly attached behaviors
//   Update     - on_tick for created, active behaviors
//   PostUpdate - on_overlap for TriggerVolume pairs that started overlapping
//
// The systems operate on the World passed by the Scheduler, which must be the
// host's World. Host diagnostics go to the injected sink under "BehaviorHost".
class BehaviorHost {
public:
    static constexpr const char* LogCategory = "BehaviorHost";
    static constexpr const char* CreateSystemName = "behavior_create";
    static constexpr const char* TickSystemName = "behavior_tick";
    static constexpr const char* OverlapSystemName = "behavior_overlap";

    BehaviorHost(scene::World& world, core::ILogSink& sink, core::EventDispatcher& events);

    BehaviorHost(const BehaviorHost&) = delete;
    BehaviorHost& operator=(const BehaviorHost&) = delete;

    // Takes ownership; on_create runs on the next PreUpdate.
    // Returns false for an invalid entity or a null behavior.
    bool attach(scene::Entity entity, std::unique_ptr<IEntityBehavior> behavior);

    // Creates a named entity with an EntityController wired to this host's sink and events
    scene::Entity spawn(const std::string& name, const ControllerConfig& config = {});

    void detach(scene::Entity entity);

    // Re-runs on_create on the next PreUpdate and resumes ticking, e.g. to revive a
    // dead controller. Returns false if the entity has no behavior.
    bool reactivate(scene::Entity entity);

    IEntityBehavior* get_behavior(scene::Entity entity);
    EntityController* get_controller(scene::Entity entity);

    bool is_created(scene::Entity entity) const;
    bool is_active(scene::Entity entity) const;
    size_t behavior_count() const;
    size_t active_count() const;

    void set_trigger(scene::Entity entity, const core::AABB& bounds);

    // Host-delivered overlap (e.g. from a physics backend).
    // Returns false if entity has no created, active behavior.
    bool notify_overlap(scene::Entity entity, scene::Entity other);

    scene::SystemFn create_system();
    scene::SystemFn tick_system();
    scene::SystemFn overlap_system();

    void install(scene::Scheduler& scheduler);
    void uninstall(scene::Scheduler& scheduler);

    // Trigger pairs currently overlapping, as (lower id, higher id)
    size_t overlapping_pair_count() const { return m_overlapping.size(); }

private:
    using EntityPair = std::pair<scene::Entity, scene::Entity>;

    void run_create(scene::World& world);
    void run_tick(scene::World& world);
    void run_overlap(scene::World& world);

    bool deliver_overlap(scene::World& world, scene::Entity entity, scene::Entity other);
    void emit(core::LogLevel level, const std::string& message);

    scene::World& m_world;
    core::ILogSink& m_sink;
    core::EventDispatcher& m_events;

    std::set<EntityPair> m_overlapping;
};

} // namespace pulse::gameplay
