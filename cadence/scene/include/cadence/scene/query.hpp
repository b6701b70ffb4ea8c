#pragma once

#include <cadence/scene/world.hpp>
#include <cstddef>
#include <functional>
#include <vector>

namespace cadence::scene {

// Query is a predicate over the entities of a World, evaluated against the
// world's state at the moment evaluate() is called. Nothing is cached, so
// entities created or destroyed between two evaluations are always reflected.
//
//   auto movers = Query::with<Position, Velocity>(entt::exclude<Frozen>)
//                     .where([](const World& w, Entity e) { return w.get<Velocity>(e).speed > 0.0f; });
//   for (Entity e : movers.evaluate(world)) { ... }
class Query {
public:
    using Predicate = std::function<bool(const World&, Entity)>;

    // Entities carrying every listed component
    template<typename T, typename... Ts>
    static Query with() {
        return Query(
            [](World& world, std::vector<Entity>& out) {
                for (auto entity : world.view<T, Ts...>()) {
                    out.push_back(entity);
                }
            },
            [](const World& world, Entity e) {
                return world.has_all<T, Ts...>(e);
            });
    }

    // Entities carrying every listed component and none of the excluded ones
    template<typename T, typename... Ts, typename... Exclude>
    static Query with(entt::exclude_t<Exclude...> exclude) {
        return Query(
            [exclude](World& world, std::vector<Entity>& out) {
                for (auto entity : world.view<T, Ts...>(exclude)) {
                    out.push_back(entity);
                }
            },
            [](const World& world, Entity e) {
                if (!world.has_all<T, Ts...>(e)) return false;
                if constexpr (sizeof...(Exclude) > 0) {
                    return !world.has_any<Exclude...>(e);
                }
                return true;
            });
    }

    // Every entity created through World::create()
    static Query all();

    // Returns a copy of this query that additionally requires predicate
    Query where(Predicate predicate) const;

    // Current matching entities, in the order the store's view yields them
    std::vector<Entity> evaluate(World& world) const;

    bool matches(const World& world, Entity e) const;
    size_t count(World& world) const;

    // First match in view order, or NullEntity
    Entity first(World& world) const;

private:
    using Collector = std::function<void(World&, std::vector<Entity>&)>;

    Query(Collector collect, Predicate match);

    bool passes_filters(const World& world, Entity e) const;

    Collector m_collect;
    Predicate m_match;
    std::vector<Predicate> m_filters;
};

} // namespace cadence::scene
