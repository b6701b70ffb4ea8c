#include <catch2/catch_test_macros.hpp>
#include <cadence/scene/query.hpp>
#include <algorithm>

using namespace cadence::scene;

namespace {

struct Position {
    float x = 0.0f;
    float y = 0.0f;
};

struct Velocity {
    float vx = 0.0f;
    float vy = 0.0f;
};

struct Frozen {
    bool permanent = false;
};

bool contains(const std::vector<Entity>& entities, Entity e) {
    return std::find(entities.begin(), entities.end(), e) != entities.end();
}

} // namespace

TEST_CASE("Query with components", "[scene][query]") {
    World world;
    Entity moving = world.create();
    world.emplace<Position>(moving);
    world.emplace<Velocity>(moving);

    Entity still = world.create();
    world.emplace<Position>(still);

    Entity bare = world.create();

    SECTION("Single component") {
        auto result = Query::with<Position>().evaluate(world);
        REQUIRE(result.size() == 2);
        REQUIRE(contains(result, moving));
        REQUIRE(contains(result, still));
    }

    SECTION("Multiple components") {
        auto query = Query::with<Position, Velocity>();
        auto result = query.evaluate(world);
        REQUIRE(result.size() == 1);
        REQUIRE(result[0] == moving);
        REQUIRE(query.matches(world, moving));
        REQUIRE_FALSE(query.matches(world, still));
        REQUIRE(query.first(world) == moving);
    }

    SECTION("All entities") {
        auto query = Query::all();
        REQUIRE(query.count(world) == 3);
        REQUIRE(query.matches(world, bare));
    }
}

TEST_CASE("Query with exclusion", "[scene][query]") {
    World world;
    Entity a = world.create();
    world.emplace<Position>(a);

    Entity b = world.create();
    world.emplace<Position>(b);
    world.emplace<Frozen>(b);

    auto query = Query::with<Position>(entt::exclude<Frozen>);
    auto result = query.evaluate(world);

    REQUIRE(result.size() == 1);
    REQUIRE(result[0] == a);
    REQUIRE(query.matches(world, a));
    REQUIRE_FALSE(query.matches(world, b));
}

TEST_CASE("Query where refines a copy", "[scene][query]") {
    World world;
    Entity left = world.create();
    world.emplace<Position>(left, -5.0f, 0.0f);
    Entity right = world.create();
    world.emplace<Position>(right, 5.0f, 0.0f);

    auto base = Query::with<Position>();
    auto right_side = base.where([](const World& w, Entity e) {
        return w.get<Position>(e).x > 0.0f;
    });

    REQUIRE(base.count(world) == 2);
    REQUIRE(right_side.count(world) == 1);
    REQUIRE(right_side.first(world) == right);
    REQUIRE_FALSE(right_side.matches(world, left));
}

TEST_CASE("Query reflects the current world", "[scene][query]") {
    World world;
    auto query = Query::with<Velocity>();

    SECTION("No matches") {
        REQUIRE(query.evaluate(world).empty());
        REQUIRE(query.first(world) == NullEntity);
        REQUIRE(query.count(world) == 0);
    }

    SECTION("Created and destroyed entities") {
        Entity e = world.create();
        world.emplace<Velocity>(e);
        REQUIRE(query.count(world) == 1);

        world.destroy(e);
        REQUIRE(query.count(world) == 0);
        REQUIRE_FALSE(query.matches(world, e));
    }

    SECTION("Removed component") {
        Entity e = world.create();
        world.emplace<Velocity>(e);
        world.remove<Velocity>(e);
        REQUIRE(query.count(world) == 0);
    }
}
