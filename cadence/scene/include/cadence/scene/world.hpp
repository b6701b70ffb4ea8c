#pragma once

#include <cadence/scene/entity.hpp>
#include <entt/entt.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace cadence::scene {

// World owns entities and their components using EnTT.
// It is the store the ECS schedules against; the ECS itself never creates or
// destroys entities, only systems and scripts do.
// Not thread-safe: create, destroy and component changes must all happen on
// the thread that drives ECS::tick() / ECS::frame().
class World {
public:
    World() = default;
    ~World() = default;

    // Non-copyable but movable
    World(const World&) = delete;
    World& operator=(const World&) = delete;
    World(World&&) = default;
    World& operator=(World&&) = default;

    // Entity management
    Entity create();
    Entity create(const std::string& name);
    void destroy(Entity e);
    bool valid(Entity e) const;

    // Component management
    template<typename T, typename... Args>
    decltype(auto) emplace(Entity e, Args&&... args) {
        return m_registry.emplace_or_replace<T>(e, std::forward<Args>(args)...);
    }

    template<typename T>
    void remove(Entity e) {
        m_registry.remove<T>(e);
    }

    template<typename T>
    T& get(Entity e) {
        return m_registry.get<T>(e);
    }

    template<typename T>
    const T& get(Entity e) const {
        return m_registry.get<T>(e);
    }

    template<typename T>
    T* try_get(Entity e) {
        return m_registry.try_get<T>(e);
    }

    template<typename T>
    const T* try_get(Entity e) const {
        return m_registry.try_get<T>(e);
    }

    template<typename T>
    bool has(Entity e) const {
        return m_registry.all_of<T>(e);
    }

    template<typename... Ts>
    bool has_all(Entity e) const {
        return m_registry.all_of<Ts...>(e);
    }

    template<typename... Ts>
    bool has_any(Entity e) const {
        return m_registry.any_of<Ts...>(e);
    }

    // View creation for iteration
    template<typename... Ts>
    auto view() {
        return m_registry.view<Ts...>();
    }

    template<typename... Ts, typename... Exclude>
    auto view(entt::exclude_t<Exclude...> exclude) {
        return m_registry.view<Ts...>(exclude);
    }

    // Direct registry access for advanced use
    entt::registry& registry() { return m_registry; }
    const entt::registry& registry() const { return m_registry; }

    // Number of live entities
    size_t size() const;
    bool empty() const { return size() == 0; }

    // Destroy all entities
    void clear();

    // Find entity by name (linear scan)
    Entity find_by_name(const std::string& name) const;

private:
    entt::registry m_registry;
    uint64_t m_next_uuid = 1;
};

} // namespace cadence::scene
