#pragma once

#include <cadence/scene/entity.hpp>

namespace cadence::render {
class Surface;
}

namespace cadence::ecs {

class ECS;

// Behavior attached to the entities of a query through ECS::add_script().
// Implement ScriptUpdater, ScriptDrawer, or both.
class Script {
public:
    virtual ~Script() = default;
};

class ScriptUpdater : public virtual Script {
public:
    virtual void update(ECS& ecs, scene::Entity entity) = 0;
};

class ScriptDrawer : public virtual Script {
public:
    virtual void draw(ECS& ecs, scene::Entity entity, render::Surface& screen) = 0;
};

struct ScriptOptions {
    // Stored on the binding but not applied: bindings run in insertion order
    // and draw into the surface the ScriptSystem itself receives.
    int priority = 0;
    render::Surface* target = nullptr;
};

} // namespace cadence::ecs
