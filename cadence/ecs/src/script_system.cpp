#include <cadence/ecs/script_system.hpp>
#include <cadence/ecs/ecs.hpp>
#include <cadence/core/error.hpp>
#include <cadence/core/log.hpp>
#include <cadence/render/surface.hpp>
#include <string>
#include <utility>

namespace cadence::ecs {

void ScriptSystem::add_script(scene::Query query, std::shared_ptr<Script> script, const ScriptOptions& options) {
    auto* updater = dynamic_cast<ScriptUpdater*>(script.get());
    auto* drawer = dynamic_cast<ScriptDrawer*>(script.get());
    if (!updater && !drawer) {
        const char* message = "[ECS] Script must implement ScriptUpdater or ScriptDrawer at least";
        core::log(core::LogLevel::Error, message);
        throw core::ConfigurationError(message);
    }

    m_bindings.push_back({std::move(query), std::move(script), updater, drawer,
                          options.priority, options.target});

    core::log(core::LogLevel::Debug,
        "[ECS] Added script #" + std::to_string(m_bindings.size()) +
        (updater ? " update" : "") + (drawer ? " draw" : ""));
}

void ScriptSystem::update(ECS& ecs) {
    // Scripts added while this pass runs are picked up next tick. Bindings are
    // only ever appended, so index i stays valid if the vector reallocates;
    // m_bindings[i] is re-read after every call for that reason.
    const size_t count = m_bindings.size();
    for (size_t i = 0; i < count; ++i) {
        ScriptUpdater* updater = m_bindings[i].updater;
        if (!updater) continue;

        for (auto entity : m_bindings[i].query.evaluate(ecs.world())) {
            // An earlier call in this pass may have destroyed it or changed
            // what it carries
            if (!m_bindings[i].query.matches(ecs.world(), entity)) continue;
            updater->update(ecs, entity);
        }
    }
}

void ScriptSystem::draw(ECS& ecs, render::Surface& screen) {
    const size_t count = m_bindings.size();
    for (size_t i = 0; i < count; ++i) {
        ScriptDrawer* drawer = m_bindings[i].drawer;
        if (!drawer) continue;

        for (auto entity : m_bindings[i].query.evaluate(ecs.world())) {
            if (!m_bindings[i].query.matches(ecs.world(), entity)) continue;
            drawer->draw(ecs, entity, screen);
        }
    }
}

} // namespace cadence::ecs
