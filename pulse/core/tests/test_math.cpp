#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <pulse/core/math.hpp>

using namespace pulse::core;
using Catch::Matchers::WithinAbs;

TEST_CASE("AABB from center", "[core][math]") {
    AABB box = AABB::from_center(Vec3(0.0f, 2.0f, 0.0f), Vec3(1.0f, 2.0f, 2.0f));

    REQUIRE_THAT(box.min.x, WithinAbs(-1.0f, 0.0001f));
    REQUIRE_THAT(box.min.y, WithinAbs(0.0f, 0.0001f));
    REQUIRE_THAT(box.max.y, WithinAbs(4.0f, 0.0001f));
    REQUIRE_THAT(box.max.z, WithinAbs(2.0f, 0.0001f));
}

TEST_CASE("AABB intersection", "[core][math]") {
    AABB a = AABB::from_center(Vec3(0.0f), Vec3(1.0f));

    SECTION("Overlapping") {
        AABB b = AABB::from_center(Vec3(1.5f, 0.0f, 0.0f), Vec3(1.0f));
        REQUIRE(a.intersects(b));
        REQUIRE(b.intersects(a));
    }

    SECTION("Touching faces") {
        AABB b = AABB::from_center(Vec3(2.0f, 0.0f, 0.0f), Vec3(1.0f));
        REQUIRE(a.intersects(b));
    }

    SECTION("Separated on one axis") {
        AABB b = AABB::from_center(Vec3(0.0f, 0.0f, 2.5f), Vec3(1.0f));
        REQUIRE_FALSE(a.intersects(b));
    }
}
