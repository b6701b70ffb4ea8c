#include <cadence/scene/query.hpp>
#include <algorithm>
#include <utility>

namespace cadence::scene {

Query::Query(Collector collect, Predicate match)
    : m_collect(std::move(collect))
    , m_match(std::move(match)) {
}

Query Query::all() {
    return with<EntityInfo>();
}

Query Query::where(Predicate predicate) const {
    Query refined = *this;
    if (predicate) {
        refined.m_filters.push_back(std::move(predicate));
    }
    return refined;
}

std::vector<Entity> Query::evaluate(World& world) const {
    std::vector<Entity> result;
    m_collect(world, result);

    if (!m_filters.empty()) {
        result.erase(
            std::remove_if(result.begin(), result.end(),
                [&](Entity e) { return !passes_filters(world, e); }),
            result.end()
        );
    }
    return result;
}

bool Query::matches(const World& world, Entity e) const {
    if (!world.valid(e)) return false;
    return m_match(world, e) && passes_filters(world, e);
}

size_t Query::count(World& world) const {
    return evaluate(world).size();
}

Entity Query::first(World& world) const {
    auto entities = evaluate(world);
    return entities.empty() ? NullEntity : entities.front();
}

bool Query::passes_filters(const World& world, Entity e) const {
    for (const auto& filter : m_filters) {
        if (!filter(world, e)) {
            return false;
        }
    }
    return true;
}

} // namespace cadence::scene
