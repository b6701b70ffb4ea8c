#include <cadence/ecs/system.hpp>
#include <cadence/core/error.hpp>

namespace cadence::ecs {

void FunctionUpdater::update(ECS& ecs) {
    m_fn(ecs);
}

void FunctionDrawer::draw(ECS& ecs, render::Surface& screen) {
    m_fn(ecs, screen);
}

std::shared_ptr<Updater> make_updater(UpdateFn fn) {
    if (!fn) {
        throw core::ConfigurationError("make_updater called with an empty function");
    }
    return std::make_shared<FunctionUpdater>(std::move(fn));
}

std::shared_ptr<Drawer> make_drawer(DrawFn fn) {
    if (!fn) {
        throw core::ConfigurationError("make_drawer called with an empty function");
    }
    return std::make_shared<FunctionDrawer>(std::move(fn));
}

} // namespace cadence::ecs
