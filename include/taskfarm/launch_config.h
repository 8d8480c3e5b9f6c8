#pragma once

#include "taskfarm/assignment.h"

#include <optional>
#include <string>
#include <vector>

namespace taskfarm {
    // Launcher command of every slot of a template round, slot id = index.
    std::vector<std::string> templateSlotCommands(const Assignment& round);

    // Command-file mode: every slot runs its own script through the launcher's
    // slot-id wildcard, "<shell> <workDir>/slot_%t.sh".
    std::vector<std::string> scriptSlotCommands(std::size_t slotCount, const std::string& shell, const std::string& workDir);

    std::string slotScriptPath(const std::string& workDir, std::size_t slot);

    // Shebang, then the optional start-up delay on a line of its own, then
    // the slot's tasks in order.
    std::string renderSlotScript(
        const std::vector<Task>& slotTasks,
        const std::string& shell,
        const std::optional<std::string>& startDelay = std::nullopt
    );

    // Slot i's script sleeps i x delayIncrement before its first task when
    // a delay increment is given.
    std::vector<std::string> writeSlotScripts(
        const Assignment& assignment,
        const std::string& shell,
        const std::string& workDir,
        std::optional<double> delayIncrement = std::nullopt
    );

    // One "<slot-id> <command>" line per slot, ids 0..N-1 in order.
    std::string serializeLaunchConfig(const std::vector<std::string>& slotCommands);
    void writeLaunchConfig(const std::string& configPath, const std::vector<std::string>& slotCommands);
}
