// Controller Demo
// Loads an entity manifest, spawns an EntityController per entry and drives
// create / tick / overlap phases for a fixed number of frames.
//
// Usage: controller_demo [manifest.json] [--frames N] [--quiet]

#include <pulse/core/core.hpp>
#include <pulse/scene/scene.hpp>
#include <pulse/gameplay/gameplay.hpp>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

using namespace pulse::core;
using namespace pulse::scene;
using namespace pulse::gameplay;

namespace {

// Used when no manifest path is given
constexpr const char* DEFAULT_MANIFEST = R"({
    "frames": 3,
    "tick_rate": 60.0,
    "entities": [
        { "name": "Player", "bounds": { "min": [0, 0, 0], "max": [1, 2, 1] } },
        { "name": "Pickup", "speed": 0.0, "health": 1,
          "bounds": { "min": [0.5, 0, 0.5], "max": [1.5, 1, 1.5] } },
        { "name": "Corpse", "health": 0 }
    ]
})";

void print_usage() {
    log(LogLevel::Info, "Usage: controller_demo [manifest.json] [--frames N] [--quiet]");
}

} // namespace

int main(int argc, char* argv[]) {
    std::string manifest_path;
    long long frame_override = -1;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--frames") == 0) {
            if (i + 1 >= argc) {
                log(LogLevel::Error, "[Demo] --frames requires a value");
                print_usage();
                return EXIT_FAILURE;
            }
            char* end = nullptr;
            errno = 0;
            long long value = std::strtoll(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || errno == ERANGE ||
                value < 0 || value > static_cast<long long>(UINT32_MAX)) {
                log(LogLevel::Error, "[Demo] Invalid frame count: {}", argv[i]);
                return EXIT_FAILURE;
            }
            frame_override = value;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            quiet = true;
        } else {
            manifest_path = argv[i];
        }
    }

    auto manifest = manifest_path.empty()
        ? parse_entity_manifest(DEFAULT_MANIFEST)
        : load_entity_manifest(manifest_path);
    if (!manifest) {
        log(LogLevel::Error, "[Demo] Failed to load manifest");
        return EXIT_FAILURE;
    }
    if (frame_override >= 0) {
        manifest->frames = static_cast<uint32_t>(frame_override);
    }

    ConsoleLogSink sink(quiet ? LogLevel::Info : LogLevel::Trace);
    EventDispatcher events;
    World world;
    Scheduler scheduler;
    BehaviorHost host(world, sink, events);
    host.install(scheduler);

    int deaths = 0;
    auto died_conn = events.subscribe<EntityDiedEvent>([&](const EntityDiedEvent& e) {
        deaths++;
        log(LogLevel::Info, "[Demo] {} is out of the game (health {})", e.name, e.health);
    });

    size_t spawned = spawn_manifest(host, *manifest);
    log(LogLevel::Info, "[Demo] Spawned {} entities, running {} frames", spawned, manifest->frames);

    const double dt = manifest->tick_interval();
    for (uint32_t frame = 0; frame < manifest->frames; ++frame) {
        scheduler.run_frame(world, dt);
    }

    log(LogLevel::Info, "[Demo] Done: {} active, {} died", host.active_count(), deaths);
    host.uninstall(scheduler);
    return EXIT_SUCCESS;
}
