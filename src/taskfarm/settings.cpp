#include "taskfarm-config.h"
#include "taskfarm/settings.h"
#include "taskfarm/errors.h"

#include "utils/json_utils.h"
#include "fmt/format.h"

#include <fstream>
#include <stdexcept>

namespace taskfarm {
    Settings::Settings() :
        launcher{ TASKFARM_LAUNCHER_PROGRAM, TASKFARM_MULTI_PROG_FLAG },
        noopCommand(TASKFARM_NOOP_COMMAND),
        delayIncrement(TASKFARM_DELAY_INCREMENT),
        shell(TASKFARM_SLOT_SHELL),
        missingFiles(MissingArgumentPolicy::Skip) {
    }

    Settings Settings::fromJson(const nlohmann::json& settingsJson) {
        if (!settingsJson.is_object()) {
            throw std::invalid_argument("Settings must be a JSON object");
        }

        Settings settings;

        settings.launcher = utils::json::getOr(settingsJson, "launcher", settings.launcher);
        if (settings.launcher.empty() || settings.launcher.front().empty()) {
            throw std::invalid_argument("Settings launcher must name a program");
        }

        settings.noopCommand = utils::json::getOr(settingsJson, "noop_command", settings.noopCommand);
        if (settings.noopCommand.empty()) {
            throw std::invalid_argument("Settings noop_command must not be empty");
        }

        settings.delayIncrement = utils::json::getOr(settingsJson, "delay_increment", settings.delayIncrement);
        if (settings.delayIncrement < 0) {
            throw std::invalid_argument(fmt::format("Settings delay_increment must not be negative: {}", settings.delayIncrement));
        }

        settings.scratchDir = utils::json::getOr(settingsJson, "scratch_dir", settings.scratchDir);
        settings.shell = utils::json::getOr(settingsJson, "shell", settings.shell);
        settings.missingFiles = parseMissingArgumentPolicy(
            utils::json::getOr(settingsJson, "missing_files", toPolicyName(settings.missingFiles))
        );

        if (settingsJson.contains("log_level")) {
            settings.logLevel = logging::fromLevelName(utils::json::getOr<std::string>(settingsJson, "log_level", ""));
        }

        return settings;
    }

    Settings Settings::load(const std::string& filePath) {
        std::ifstream settingsFile(filePath);
        if (!settingsFile.is_open()) {
            throw PreconditionError(fmt::format("Can't open settings file {}", filePath));
        }

        try {
            nlohmann::json settingsJson;
            settingsFile >> settingsJson;

            return fromJson(settingsJson);
        }
        catch (const nlohmann::json::exception& e) {
            throw PreconditionError(fmt::format("Invalid settings file {}: {}", filePath, e.what()));
        }
        catch (const std::invalid_argument& e) {
            throw PreconditionError(fmt::format("Invalid settings file {}: {}", filePath, e.what()));
        }
    }
}
