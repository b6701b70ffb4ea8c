#pragma once

#include <entt/entt.hpp>
#include <cstdint>
#include <string>

namespace cadence::scene {

// Entity is just a type alias for entt::entity
using Entity = entt::entity;

// Null entity constant
constexpr Entity NullEntity = entt::null;

// Attached to every entity the World creates
struct EntityInfo {
    std::string name;
    uint64_t uuid = 0;
};

} // namespace cadence::scene
