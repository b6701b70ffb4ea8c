#include <cadence/core/settings.hpp>
#include <cadence/core/filesystem.hpp>
#include <nlohmann/json.hpp>

namespace cadence::core {

using json = nlohmann::json;

Settings& Settings::get() {
    static Settings instance;
    return instance;
}

bool Settings::load(const std::string& path) {
    if (!FileSystem::exists(path)) {
        core::log(LogLevel::Warn, "[Settings] File not found: " + path);
        return false;
    }

    if (!parse(FileSystem::read_text(path))) {
        core::log(LogLevel::Error, "[Settings] Failed to load " + path);
        return false;
    }
    return true;
}

bool Settings::parse(const std::string& text) {
    if (text.empty()) {
        return false;
    }

    // Fill a copy so a bad document leaves the current values untouched
    Settings parsed = *this;

    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return false;
        }

        if (j.contains("time")) {
            auto& t = j["time"];
            parsed.time.time_scale = t.value("time_scale", parsed.time.time_scale);
        }

        if (j.contains("log")) {
            auto& l = j["log"];
            if (l.contains("level")) {
                auto level = log_level_from_string(l["level"].get<std::string>());
                if (!level) {
                    return false;
                }
                parsed.log.level = *level;
            }
        }
    } catch (const json::exception&) {
        return false;
    }

    *this = parsed;
    return true;
}

bool Settings::save(const std::string& path) const {
    json j;

    j["time"] = {
        {"time_scale", time.time_scale}
    };

    j["log"] = {
        {"level", to_string(log.level)}
    };

    return FileSystem::write_text(path, j.dump(4));
}

void Settings::reset() {
    *this = Settings{};
}

} // namespace cadence::core
