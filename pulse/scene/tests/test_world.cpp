#include <catch2/catch_test_macros.hpp>
#include <pulse/scene/world.hpp>

using namespace pulse::scene;

// Test components
struct TestHealth {
    int current = 100;
};

struct TestTag {};

TEST_CASE("World entity creation", "[scene][world]") {
    World world;
    REQUIRE(world.empty());

    SECTION("Unnamed entity gets a generated name") {
        Entity e = world.create();
        REQUIRE(world.valid(e));
        REQUIRE(world.size() == 1);
        REQUIRE(world.get<EntityInfo>(e).name == "Entity_1");
        REQUIRE(world.get<EntityInfo>(e).uuid == 1);
    }

    SECTION("Named entity") {
        Entity e = world.create("Player");
        REQUIRE(world.name_of(e) == "Player");
        REQUIRE(world.find_by_name("Player") == e);
    }

    SECTION("Uuids increase") {
        Entity e1 = world.create();
        Entity e2 = world.create();
        REQUIRE(e1 != e2);
        REQUIRE(world.get<EntityInfo>(e2).uuid == world.get<EntityInfo>(e1).uuid + 1);
    }
}

TEST_CASE("World entity destruction", "[scene][world]") {
    World world;
    Entity e = world.create("Doomed");
    world.emplace<TestHealth>(e);

    world.destroy(e);
    REQUIRE_FALSE(world.valid(e));
    REQUIRE(world.empty());

    // Destroying twice is harmless
    world.destroy(e);
    world.destroy(NullEntity);
}

TEST_CASE("World component management", "[scene][world]") {
    World world;
    Entity e = world.create();

    SECTION("Emplace and get") {
        world.emplace<TestHealth>(e, 42);
        REQUIRE(world.get<TestHealth>(e).current == 42);

        const World& const_world = world;
        REQUIRE(const_world.get<TestHealth>(e).current == 42);
    }

    SECTION("Emplace replaces existing") {
        world.emplace<TestHealth>(e, 1);
        world.emplace<TestHealth>(e, 2);
        REQUIRE(world.get<TestHealth>(e).current == 2);
    }

    SECTION("Try get and has") {
        REQUIRE(world.try_get<TestHealth>(e) == nullptr);
        REQUIRE_FALSE(world.has<TestHealth>(e));

        world.emplace<TestHealth>(e);
        REQUIRE(world.try_get<TestHealth>(e) != nullptr);
        REQUIRE(world.has<TestHealth>(e));
    }

    SECTION("Remove") {
        world.emplace<TestTag>(e);
        world.remove<TestTag>(e);
        REQUIRE_FALSE(world.has<TestTag>(e));
    }
}

TEST_CASE("World views", "[scene][world]") {
    World world;
    Entity a = world.create();
    Entity b = world.create();
    world.create();

    world.emplace<TestHealth>(a, 10);
    world.emplace<TestHealth>(b, 20);
    world.emplace<TestTag>(b);

    int sum = 0;
    for (auto entity : world.view<TestHealth>()) {
        sum += world.get<TestHealth>(entity).current;
    }
    REQUIRE(sum == 30);

    int tagged = 0;
    for (auto entity : world.view<TestHealth, TestTag>()) {
        (void)entity;
        tagged++;
    }
    REQUIRE(tagged == 1);
}

TEST_CASE("World names and lookup", "[scene][world]") {
    World world;
    Entity player = world.create("Player");

    SECTION("Missing name") {
        REQUIRE(world.find_by_name("Nobody") == NullEntity);
    }

    SECTION("Name of invalid entity falls back to id") {
        REQUIRE(world.name_of(NullEntity) == "null");
        world.destroy(player);
        REQUIRE(world.name_of(player) == entity_to_string(player));
    }

    SECTION("Clear") {
        world.create("Enemy");
        REQUIRE(world.size() == 2);

        world.clear();
        REQUIRE(world.empty());
        REQUIRE(world.get<EntityInfo>(world.create()).uuid == 1);
    }
}
