#pragma once

#include "taskfarm/task_source.h"
#include "logging/Level.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace taskfarm {
    // Site-level knobs, read from an optional JSON file. Anything missing
    // keeps the compiled-in default from taskfarm-config.h.
    struct Settings {
        std::vector<std::string> launcher;
        std::string noopCommand;
        double delayIncrement;
        std::string scratchDir;
        std::string shell;
        MissingArgumentPolicy missingFiles;
        std::optional<logging::Level> logLevel;

        Settings();

        static Settings fromJson(const nlohmann::json& settingsJson);
        static Settings load(const std::string& filePath);
    };
}
