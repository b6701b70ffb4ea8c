#pragma once

#include <functional>
#include <memory>
#include <utility>

namespace cadence::render {
class Surface;
}

namespace cadence::ecs {

class ECS;

// Common base for everything that can be passed to ECS::add_system().
// A system takes part in dispatch through the capability interfaces below;
// one that derives from neither is rejected at registration.
class System {
public:
    virtual ~System() = default;
};

// Called once per ECS::tick(), after the clock has advanced
class Updater : public virtual System {
public:
    virtual void update(ECS& ecs) = 0;
};

// Called once per ECS::frame() with the resolved output surface
class Drawer : public virtual System {
public:
    virtual void draw(ECS& ecs, render::Surface& screen) = 0;
};

struct SystemOptions {
    // Higher priority runs first; equal priorities keep registration order
    int priority = 0;

    // Drawers only: render into this surface instead of the one passed to
    // ECS::frame(). Not owned; must outlive the ECS.
    render::Surface* target = nullptr;
};

// Adapters for registering plain callables as systems
using UpdateFn = std::function<void(ECS&)>;
using DrawFn = std::function<void(ECS&, render::Surface&)>;

class FunctionUpdater final : public Updater {
public:
    explicit FunctionUpdater(UpdateFn fn) : m_fn(std::move(fn)) {}
    void update(ECS& ecs) override;

private:
    UpdateFn m_fn;
};

class FunctionDrawer final : public Drawer {
public:
    explicit FunctionDrawer(DrawFn fn) : m_fn(std::move(fn)) {}
    void draw(ECS& ecs, render::Surface& screen) override;

private:
    DrawFn m_fn;
};

std::shared_ptr<Updater> make_updater(UpdateFn fn);
std::shared_ptr<Drawer> make_drawer(DrawFn fn);

} // namespace cadence::ecs
