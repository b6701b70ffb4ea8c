#pragma once

#include <cadence/core/log.hpp>
#include <string>

namespace cadence::core {

struct TimeSettings {
    double time_scale = 1.0;    // Multiplier applied to every measured delta
};

struct LogSettings {
    LogLevel level = LogLevel::Info;
};

struct Settings {
    TimeSettings time;
    LogSettings log;

    // Singleton access
    static Settings& get();

    // Load settings from a JSON file. Returns false and keeps the current
    // values if the file is missing or malformed.
    bool load(const std::string& path);

    // Same as load() but from an in-memory JSON document
    bool parse(const std::string& text);

    // Save settings to a JSON file
    bool save(const std::string& path) const;

    // Reset to defaults
    void reset();
};

} // namespace cadence::core
