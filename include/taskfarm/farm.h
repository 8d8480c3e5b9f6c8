#pragma once

#include "taskfarm/assignment.h"
#include "taskfarm/execution_context.h"
#include "taskfarm/launcher.h"
#include "taskfarm/settings.h"
#include "taskfarm/task_source.h"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace taskfarm {
    struct FarmOptions {
        uint32_t threadsPerTask = 1;
        bool delay = false;
        bool bareParameters = false;
        bool dryRun = false;
    };

    // One launcher invocation.
    struct LaunchRound {
        std::string configPath;
        Assignment assignment;
        std::vector<std::string> slotCommands;
    };

    struct RunPlan {
        SourceMode mode;
        std::string workDir;
        uint32_t slotCount;
        std::size_t taskCount;
        std::vector<std::string> scriptPaths;
        std::vector<LaunchRound> rounds;
    };

    nlohmann::json describePlan(const RunPlan& plan);

    // Task source to launcher: resolves the slot count, assigns and pads the
    // tasks, writes scripts and launch configurations into the work directory
    // and runs the launcher once per round.
    class Farm {
    public:
        Farm(const ExecutionContext& context, const Settings& settings, const FarmOptions& options);

        RunPlan plan(const TaskSource& source) const;

        // Rounds run in order; the first failing round ends the run with its status.
        int32_t execute(const RunPlan& plan, Launcher& launcher) const;

        void printPlan(const RunPlan& plan, std::ostream& os) const;

        int32_t run(const TaskSource& source, Launcher& launcher, std::ostream& dryRunOutput = std::cout) const;

    private:
        void planCommandFile(const std::vector<Task>& tasks, RunPlan& plan) const;
        void planTemplate(const std::vector<Task>& tasks, RunPlan& plan) const;
        std::vector<std::string> finishSlotCommands(std::vector<std::string> slotCommands) const;

        ExecutionContext _context;
        Settings _settings;
        FarmOptions _options;
    };
}
