#include <cadence/ecs/ecs.hpp>
#include <cadence/core/error.hpp>
#include <cadence/core/log.hpp>
#include <cadence/render/surface.hpp>
#include <string>
#include <utility>

namespace cadence::ecs {

ECS::ECS(scene::World& world, const core::Settings& settings)
    : m_world(world)
    , m_script_system(std::make_shared<ScriptSystem>()) {
    m_time.set_time_scale(settings.time.time_scale);
    add_system(m_script_system);
}

void ECS::add_system(std::shared_ptr<System> system, const SystemOptions& options) {
    auto updater = std::dynamic_pointer_cast<Updater>(system);
    auto drawer = std::dynamic_pointer_cast<Drawer>(system);
    if (!updater && !drawer) {
        const char* message = "[ECS] System must implement Updater or Drawer at least";
        core::log(core::LogLevel::Error, message);
        throw core::ConfigurationError(message);
    }

    std::string kinds;
    if (updater) {
        m_updaters.insert({std::move(updater), options.priority});
        kinds += " update";
    }
    if (drawer) {
        m_drawers.insert({std::move(drawer), options.priority, options.target});
        kinds += options.target ? " draw(target)" : " draw";
    }

    core::log(core::LogLevel::Debug,
        "[ECS] Added system" + kinds + " priority=" + std::to_string(options.priority));
}

void ECS::add_script(scene::Query query, std::shared_ptr<Script> script, const ScriptOptions& options) {
    m_script_system->add_script(std::move(query), std::move(script), options);
}

void ECS::tick() {
    m_time.advance();
    for (auto& entry : m_updaters.snapshot()) {
        entry.updater->update(*this);
    }
}

void ECS::frame(render::Surface& screen) {
    for (auto& entry : m_drawers.snapshot()) {
        entry.drawer->draw(*this, entry.target ? *entry.target : screen);
    }
}

} // namespace cadence::ecs
