#include "taskfarm-config.h"
#include "taskfarm/launch_config.h"
#include "taskfarm/errors.h"
#include "taskfarm/logger.h"

#include "utils/io_utils.h"
#include "fmt/format.h"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace taskfarm {
    std::vector<std::string> templateSlotCommands(const Assignment& round) {
        std::vector<std::string> slotCommands;
        slotCommands.reserve(round.slotCount());

        std::size_t slot = 0;
        for (const auto& slotTasks : round.slots) {
            if (slotTasks.size() != 1) {
                throw std::invalid_argument(fmt::format(
                    "Slot {} of a template round holds {} commands, expected 1", slot, slotTasks.size()
                ));
            }

            slotCommands.push_back(slotTasks.front().command);
            ++slot;
        }

        return slotCommands;
    }

    std::vector<std::string> scriptSlotCommands(std::size_t slotCount, const std::string& shell, const std::string& workDir) {
        std::string scriptPattern = (fs::path(workDir) / fmt::format(fmt::runtime(TASKFARM_SLOT_SCRIPT_PATTERN), TASKFARM_SLOT_WILDCARD)).string();

        return std::vector<std::string>(slotCount, fmt::format("{} {}", shell, scriptPattern));
    }

    std::string slotScriptPath(const std::string& workDir, std::size_t slot) {
        return (fs::path(workDir) / fmt::format(fmt::runtime(TASKFARM_SLOT_SCRIPT_PATTERN), slot)).string();
    }

    std::string renderSlotScript(const std::vector<Task>& slotTasks, const std::string& shell, const std::optional<std::string>& startDelay) {
        std::string script = fmt::format("#!{}\n", shell);
        if (startDelay) {
            script.append(*startDelay);
            script.push_back('\n');
        }

        for (const auto& task : slotTasks) {
            script.append(task.command);
            script.push_back('\n');
        }

        return script;
    }

    std::vector<std::string> writeSlotScripts(
        const Assignment& assignment,
        const std::string& shell,
        const std::string& workDir,
        std::optional<double> delayIncrement
    ) {
        auto& logger = getLogger();
        std::vector<std::string> scriptPaths;

        for (std::size_t slot = 0; slot != assignment.slotCount(); ++slot) {
            std::string scriptPath = slotScriptPath(workDir, slot);
            std::optional<std::string> startDelay;
            if (delayIncrement) {
                startDelay = delayCommand(static_cast<uint32_t>(slot), *delayIncrement);
            }

            try {
                utils::writeFile(scriptPath, renderSlotScript(assignment.slots[slot], shell, startDelay));
                utils::makeExecutable(scriptPath);
            }
            catch (const std::runtime_error& e) {
                throw PreconditionError(e.what());
            }

            logger.debug(fmt::format("Slot {} script: {} ({} tasks)", slot, scriptPath, assignment.slots[slot].size()));
            scriptPaths.push_back(scriptPath);
        }

        return scriptPaths;
    }

    std::string serializeLaunchConfig(const std::vector<std::string>& slotCommands) {
        if (slotCommands.empty()) {
            throw std::invalid_argument("Launch configuration needs at least one slot");
        }

        std::string config;
        std::size_t slot = 0;
        for (const auto& slotCommand : slotCommands) {
            if (slotCommand.find_first_not_of(" \t") == std::string::npos) {
                throw std::invalid_argument(fmt::format("Slot {} has an empty command", slot));
            }

            if (slotCommand.find_first_of("\r\n") != std::string::npos) {
                throw std::invalid_argument(fmt::format("Slot {} command spans several lines", slot));
            }

            config.append(fmt::format("{} {}\n", slot, slotCommand));
            ++slot;
        }

        return config;
    }

    void writeLaunchConfig(const std::string& configPath, const std::vector<std::string>& slotCommands) {
        std::string config = serializeLaunchConfig(slotCommands);

        try {
            utils::writeFile(configPath, config);
        }
        catch (const std::runtime_error& e) {
            throw PreconditionError(e.what());
        }

        getLogger().info(fmt::format("Wrote launch configuration {} ({} slots)", configPath, slotCommands.size()));
    }
}
