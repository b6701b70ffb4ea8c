#pragma once

#include <cadence/ecs/system.hpp>
#include <algorithm>
#include <cstddef>
#include <memory>
#include <vector>

namespace cadence::ecs {

struct UpdaterEntry {
    std::shared_ptr<Updater> updater;
    int priority = 0;
};

struct DrawerEntry {
    std::shared_ptr<Drawer> drawer;
    int priority = 0;
    render::Surface* target = nullptr;
};

// Participants of one dispatch kind, kept sorted by priority (higher first).
// Entries with equal priority stay in insertion order.
template<typename Entry>
class Registry {
public:
    void insert(Entry entry) {
        m_entries.push_back(std::move(entry));
        std::stable_sort(m_entries.begin(), m_entries.end(),
            [](const Entry& a, const Entry& b) {
                return a.priority > b.priority;
            });
    }

    // Copy of the current order. Dispatch iterates this so participants
    // registered mid-pass neither invalidate the loop nor run in that pass.
    std::vector<Entry> snapshot() const { return m_entries; }

    const std::vector<Entry>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

private:
    std::vector<Entry> m_entries;
};

using UpdaterRegistry = Registry<UpdaterEntry>;
using DrawerRegistry = Registry<DrawerEntry>;

} // namespace cadence::ecs
