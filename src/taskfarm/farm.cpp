#include "taskfarm-config.h"
#include "taskfarm/farm.h"
#include "taskfarm/errors.h"
#include "taskfarm/launch_config.h"
#include "taskfarm/logger.h"
#include "taskfarm/work_dir.h"

#include "utils/io_utils.h"
#include "fmt/format.h"

#include <filesystem>
#include <optional>
#include <stdexcept>

namespace fs = std::filesystem;

namespace taskfarm {
    nlohmann::json describePlan(const RunPlan& plan) {
        nlohmann::json rounds = nlohmann::json::array();
        for (const auto& round : plan.rounds) {
            nlohmann::json slotTaskCounts = nlohmann::json::array();
            for (const auto& slotTasks : round.assignment.slots) {
                slotTaskCounts.push_back(slotTasks.size());
            }

            rounds.push_back({
                { "config", round.configPath },
                { "tasks_per_slot", slotTaskCounts },
                { "noop_slots", round.assignment.noopCount() },
            });
        }

        return {
            { "mode", plan.mode == SourceMode::CommandFile ? "command_file" : "template" },
            { "work_dir", plan.workDir },
            { "slots", plan.slotCount },
            { "tasks", plan.taskCount },
            { "scripts", plan.scriptPaths },
            { "rounds", rounds },
        };
    }

    Farm::Farm(const ExecutionContext& context, const Settings& settings, const FarmOptions& options) :
        _context(context), _settings(settings), _options(options) {
        if (_options.threadsPerTask == 0) {
            throw std::invalid_argument("Threads per task must be greater than 0");
        }
    }

    RunPlan Farm::plan(const TaskSource& source) const {
        auto& logger = getLogger();

        uint32_t slotCount = resolveSlotCount(_context, _options.threadsPerTask);
        logger.info(fmt::format("Slot count: {}", slotCount));

        TemplateOptions templateOptions{
            .bareParameters = _options.bareParameters,
            .missingArguments = _settings.missingFiles,
            .noopCommand = _settings.noopCommand,
        };
        std::vector<Task> tasks = source.load(templateOptions);
        logger.info(fmt::format("Read tasks count: {}", tasks.size()));

        if (source.getMode() == SourceMode::Template && source.getArguments().empty()) {
            logger.info(fmt::format("No arguments, every slot runs: {}", source.getCommandTemplate()));
            tasks.assign(slotCount, Task{ source.getCommandTemplate() });
        }

        if (!hasOutputRedirection(tasks)) {
            logger.warning("No task redirects its output, all slots share the launcher's output streams");
        }

        RunPlan plan{
            .mode = source.getMode(),
            .workDir = prepareWorkDirectory(_context, _settings),
            .slotCount = slotCount,
            .taskCount = tasks.size(),
            .scriptPaths = {},
            .rounds = {},
        };

        if (plan.mode == SourceMode::CommandFile) {
            planCommandFile(tasks, plan);
        }
        else {
            planTemplate(tasks, plan);
        }

        std::string manifestPath = (fs::path(plan.workDir) / TASKFARM_MANIFEST_FILE).string();
        try {
            utils::writeFile(manifestPath, describePlan(plan).dump(2) + "\n");
        }
        catch (const std::runtime_error& e) {
            throw PreconditionError(e.what());
        }

        return plan;
    }

    void Farm::planCommandFile(const std::vector<Task>& tasks, RunPlan& plan) const {
        LaunchRound round;
        round.configPath = (fs::path(plan.workDir) / TASKFARM_FILE_MODE_CONFIG).string();
        round.assignment = assignRoundRobin(tasks, plan.slotCount);
        padAssignment(round.assignment, _settings.noopCommand);

        // The launcher runs its lines without a shell, so the delay lives in the scripts.
        std::optional<double> delayIncrement;
        if (_options.delay) {
            delayIncrement = _settings.delayIncrement;
        }

        plan.scriptPaths = writeSlotScripts(round.assignment, _settings.shell, plan.workDir, delayIncrement);
        round.slotCommands = scriptSlotCommands(plan.slotCount, _settings.shell, plan.workDir);
        writeLaunchConfig(round.configPath, round.slotCommands);

        plan.rounds.push_back(std::move(round));
    }

    void Farm::planTemplate(const std::vector<Task>& tasks, RunPlan& plan) const {
        auto& logger = getLogger();

        std::vector<Assignment> assignments = assignRounds(tasks, plan.slotCount);
        if (assignments.empty()) {
            // Every slot still needs an entry for the launcher to start.
            assignments.push_back(Assignment{ std::vector<std::vector<Task>>(plan.slotCount) });
        }

        if (assignments.size() > 1) {
            logger.info(fmt::format("{} tasks on {} slots run in {} launcher rounds", tasks.size(), plan.slotCount, assignments.size()));
        }

        std::size_t roundIndex = 0;
        for (auto& assignment : assignments) {
            LaunchRound round;
            round.configPath = (fs::path(plan.workDir) / fmt::format(fmt::runtime(TASKFARM_ROUND_CONFIG_PATTERN), roundIndex)).string();
            round.assignment = std::move(assignment);
            padAssignment(round.assignment, _settings.noopCommand);

            round.slotCommands = finishSlotCommands(templateSlotCommands(round.assignment));
            writeLaunchConfig(round.configPath, round.slotCommands);

            plan.rounds.push_back(std::move(round));
            ++roundIndex;
        }
    }

    std::vector<std::string> Farm::finishSlotCommands(std::vector<std::string> slotCommands) const {
        if (_options.delay) {
            injectDelays(slotCommands, _settings.delayIncrement);
        }

        return slotCommands;
    }

    int32_t Farm::execute(const RunPlan& plan, Launcher& launcher) const {
        auto& logger = getLogger();

        std::size_t roundIndex = 0;
        for (const auto& round : plan.rounds) {
            logger.info(fmt::format("Launch round {}/{}: {}", roundIndex + 1, plan.rounds.size(), round.configPath));

            LaunchRequest request{
                .launcherCommand = _settings.launcher,
                .configPath = round.configPath,
                .threadsPerTask = _options.threadsPerTask,
            };

            int32_t status = launcher.launch(request);
            if (status != 0) {
                logger.error(fmt::format("Round {} failed with status {}", roundIndex + 1, status));

                return status;
            }

            ++roundIndex;
        }

        return 0;
    }

    void Farm::printPlan(const RunPlan& plan, std::ostream& os) const {
        for (const auto& round : plan.rounds) {
            os << "# " << round.configPath << "\n";
            os << serializeLaunchConfig(round.slotCommands);
        }

        os.flush();
    }

    int32_t Farm::run(const TaskSource& source, Launcher& launcher, std::ostream& dryRunOutput) const {
        RunPlan runPlan = plan(source);

        if (_options.dryRun) {
            printPlan(runPlan, dryRunOutput);

            return 0;
        }

        return execute(runPlan, launcher);
    }
}
