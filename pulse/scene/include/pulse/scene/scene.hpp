#pragma once

#include <pulse/scene/entity.hpp>
#include <pulse/scene/world.hpp>
#include <pulse/scene/systems.hpp>
