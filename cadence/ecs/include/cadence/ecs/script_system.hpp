#pragma once

#include <cadence/ecs/script.hpp>
#include <cadence/ecs/system.hpp>
#include <cadence/scene/query.hpp>
#include <cstddef>
#include <memory>
#include <vector>

namespace cadence::ecs {

// Runs scripts against the live results of their queries.
// The ECS creates exactly one ScriptSystem and registers it as an ordinary
// updater and drawer with priority 0, so scripts interleave with priority-0
// systems in registration order.
class ScriptSystem final : public Updater, public Drawer {
public:
    struct Binding {
        scene::Query query;
        std::shared_ptr<Script> script;
        ScriptUpdater* updater = nullptr;   // Non-null if script can update
        ScriptDrawer* drawer = nullptr;     // Non-null if script can draw
        int priority = 0;
        render::Surface* target = nullptr;
    };

    ScriptSystem() = default;

    ScriptSystem(const ScriptSystem&) = delete;
    ScriptSystem& operator=(const ScriptSystem&) = delete;

    // Throws core::ConfigurationError if script is neither a ScriptUpdater
    // nor a ScriptDrawer
    void add_script(scene::Query query, std::shared_ptr<Script> script, const ScriptOptions& options = {});

    // For each binding in insertion order, evaluate its query and call the
    // script once per matching entity
    void update(ECS& ecs) override;
    void draw(ECS& ecs, render::Surface& screen) override;

    const std::vector<Binding>& bindings() const { return m_bindings; }
    size_t binding_count() const { return m_bindings.size(); }

private:
    std::vector<Binding> m_bindings;
};

} // namespace cadence::ecs
