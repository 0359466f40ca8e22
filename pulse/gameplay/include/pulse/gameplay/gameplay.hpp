#pragma once

#include <pulse/gameplay/behavior.hpp>
#include <pulse/gameplay/behavior_host.hpp>
#include <pulse/gameplay/controller_config.hpp>
#include <pulse/gameplay/controller_events.hpp>
#include <pulse/gameplay/entity_controller.hpp>
#include <pulse/gameplay/entity_manifest.hpp>
