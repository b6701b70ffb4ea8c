#pragma once

#include <cadence/core/settings.hpp>
#include <cadence/core/time.hpp>
#include <cadence/ecs/registry.hpp>
#include <cadence/ecs/script.hpp>
#include <cadence/ecs/script_system.hpp>
#include <cadence/ecs/system.hpp>
#include <cadence/scene/query.hpp>
#include <cadence/scene/world.hpp>
#include <cstddef>
#include <memory>
#include <utility>

namespace cadence::ecs {

// ECS drives a World: it owns the clock, runs updaters once per tick and
// drawers once per frame, both in priority order (higher first, registration
// order on ties).
//
// Dispatch is fail fast. An exception thrown by a system or script leaves
// tick()/frame() immediately and reaches the caller unchanged.
//
// Systems and scripts may register more systems or scripts from inside a
// tick or frame. Each pass runs over the participants registered when it
// started; new ones take part from the next pass on.
class ECS {
public:
    explicit ECS(scene::World& world, const core::Settings& settings = {});
    ~ECS() = default;

    ECS(const ECS&) = delete;
    ECS& operator=(const ECS&) = delete;

    // Register a system that is an Updater, a Drawer, or both. Throws
    // core::ConfigurationError (registering nothing) if it is neither.
    void add_system(std::shared_ptr<System> system, const SystemOptions& options = {});

    // add_system() with default options for each argument, in order
    template<typename... Systems>
    void add_systems(std::shared_ptr<Systems>... systems) {
        (add_system(std::move(systems)), ...);
    }

    // Attach script to every entity matching query. See ScriptSystem.
    void add_script(scene::Query query, std::shared_ptr<Script> script, const ScriptOptions& options = {});

    // Advance the clock, then run every updater
    void tick();

    // Run every drawer, each into its own target or else into screen
    void frame(render::Surface& screen);

    scene::World& world() { return m_world; }
    const scene::World& world() const { return m_world; }
    core::Time& time() { return m_time; }
    const core::Time& time() const { return m_time; }
    ScriptSystem& script_system() { return *m_script_system; }
    const ScriptSystem& script_system() const { return *m_script_system; }

    size_t updater_count() const { return m_updaters.size(); }
    size_t drawer_count() const { return m_drawers.size(); }

private:
    scene::World& m_world;
    core::Time m_time;
    UpdaterRegistry m_updaters;
    DrawerRegistry m_drawers;
    std::shared_ptr<ScriptSystem> m_script_system;
};

} // namespace cadence::ecs
