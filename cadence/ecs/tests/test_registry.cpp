#include <catch2/catch_test_macros.hpp>
#include <cadence/ecs/registry.hpp>
#include <vector>

using namespace cadence::ecs;

namespace {

struct TaggedEntry {
    int id = 0;
    int priority = 0;
};

std::vector<int> ids(const Registry<TaggedEntry>& registry) {
    std::vector<int> out;
    for (const auto& entry : registry.entries()) {
        out.push_back(entry.id);
    }
    return out;
}

} // namespace

TEST_CASE("Registry sorts by priority", "[ecs][registry]") {
    Registry<TaggedEntry> registry;
    REQUIRE(registry.empty());

    registry.insert({1, 0});
    registry.insert({2, 100});
    registry.insert({3, 50});

    REQUIRE(registry.size() == 3);
    REQUIRE(ids(registry) == std::vector<int>{2, 3, 1});
}

TEST_CASE("Registry keeps insertion order on ties", "[ecs][registry]") {
    Registry<TaggedEntry> registry;

    registry.insert({1, 5});
    registry.insert({2, 5});
    registry.insert({3, 10});
    registry.insert({4, 5});
    registry.insert({5, -1});
    registry.insert({6, 10});

    REQUIRE(ids(registry) == std::vector<int>{3, 6, 1, 2, 4, 5});
}

TEST_CASE("Registry snapshot is independent", "[ecs][registry]") {
    Registry<TaggedEntry> registry;
    registry.insert({1, 0});

    auto snapshot = registry.snapshot();
    registry.insert({2, 10});

    REQUIRE(snapshot.size() == 1);
    REQUIRE(snapshot[0].id == 1);
    REQUIRE(registry.size() == 2);
}
