#pragma once

#include <glm/glm.hpp>

namespace pulse::core {

using Vec2 = glm::vec2;
using Vec3 = glm::vec3;

// Axis-aligned bounding box
struct AABB {
    Vec3 min{0.0f};
    Vec3 max{0.0f};

    AABB() = default;
    AABB(const Vec3& min_, const Vec3& max_) : min(min_), max(max_) {}

    static AABB from_center(const Vec3& center, const Vec3& half_extents) {
        return AABB(center - half_extents, center + half_extents);
    }

    // Touching faces count as intersecting
    bool intersects(const AABB& other) const {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y &&
               min.z <= other.max.z && max.z >= other.min.z;
    }
};

} // namespace pulse::core
