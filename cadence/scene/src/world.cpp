#include <cadence/scene/world.hpp>

namespace cadence::scene {

Entity World::create() {
    Entity e = m_registry.create();
    auto& info = m_registry.emplace<EntityInfo>(e);
    info.uuid = m_next_uuid++;
    info.name = "Entity_" + std::to_string(info.uuid);
    return e;
}

Entity World::create(const std::string& name) {
    Entity e = m_registry.create();
    auto& info = m_registry.emplace<EntityInfo>(e);
    info.uuid = m_next_uuid++;
    info.name = name;
    return e;
}

void World::destroy(Entity e) {
    if (!valid(e)) return;
    m_registry.destroy(e);
}

bool World::valid(Entity e) const {
    return m_registry.valid(e);
}

size_t World::size() const {
    return m_registry.view<EntityInfo>().size();
}

void World::clear() {
    m_registry.clear();
    m_next_uuid = 1;
}

Entity World::find_by_name(const std::string& name) const {
    auto view = m_registry.view<EntityInfo>();
    for (auto [entity, info] : view.each()) {
        if (info.name == name) {
            return entity;
        }
    }
    return NullEntity;
}

} // namespace cadence::scene
