#pragma once

#include <pulse/scene/world.hpp>
#include <array>
#include <functional>
#include <string>
#include <vector>

namespace pulse::scene {

// System execution phases, run in declaration order by run_frame()
enum class Phase {
    PreUpdate,      // Entity creation hooks
    Update,         // Per-tick behavior
    PostUpdate,     // Overlap broadcast, late bookkeeping
    Count
};

constexpr size_t PhaseCount = static_cast<size_t>(Phase::Count);

// System function signature
using SystemFn = std::function<void(World&, double)>;

// System scheduler manages system registration and execution
class Scheduler {
public:
    Scheduler() = default;

    // Register a system for a specific phase
    // Higher priority systems run first (default 0), equal priorities keep insertion order
    void add(Phase phase, SystemFn fn, int priority = 0);
    void add(Phase phase, SystemFn fn, const std::string& name, int priority = 0);

    // Remove every system registered under name
    void remove(const std::string& name);
    bool has(const std::string& name) const;

    // Run all systems for a specific phase
    void run(World& world, double dt, Phase phase);

    // Run PreUpdate, Update and PostUpdate in order and count the frame
    void run_frame(World& world, double dt);

    void clear();

    void set_enabled(const std::string& name, bool enabled);
    bool is_enabled(const std::string& name) const;

    size_t system_count(Phase phase) const;
    uint64_t frame_count() const { return m_frame_count; }

private:
    struct SystemEntry {
        int priority;
        SystemFn fn;
        std::string name;
        bool enabled = true;
    };

    std::array<std::vector<SystemEntry>, PhaseCount> m_systems;
    uint64_t m_frame_count = 0;

    void sort_phase(Phase phase);
};

} // namespace pulse::scene
