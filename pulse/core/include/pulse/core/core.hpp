#pragma once

#include <pulse/core/log.hpp>
#include <pulse/core/math.hpp>
#include <pulse/core/event_dispatcher.hpp>
#include <pulse/core/filesystem.hpp>
