#include "taskfarm-config.h"
#include "taskfarm/logger.h"

#include "taskfarm/errors.h"
#include "taskfarm/execution_context.h"
#include "taskfarm/farm.h"
#include "taskfarm/launcher.h"
#include "taskfarm/settings.h"
#include "taskfarm/task_source.h"
#include "fmt/format.h"
#include <argparse/argparse.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

static argparse::ArgumentParser createArgumentParser();
static taskfarm::Settings loadSettings(const argparse::ArgumentParser& argumentParser);

auto& logger = getLogger();

int main(int argc, char* argv[]) {
    auto argumentParser = createArgumentParser();

    try {
        argumentParser.parse_args(argc, argv);
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << "\n\n" << argumentParser;

        return TASKFARM_PRECONDITION_EXIT_CODE;
    }

    try {
        auto settings = loadSettings(argumentParser);

        if (argumentParser.get<bool>("--verbose")) {
            logger.setThreshold(logging::Level::Debug);
        }
        else if (settings.logLevel) {
            logger.setThreshold(*settings.logLevel);
        }

        if (auto missingFiles = argumentParser.present("--missing-files")) {
            settings.missingFiles = taskfarm::parseMissingArgumentPolicy(*missingFiles);
        }

        taskfarm::FarmOptions options{
            .threadsPerTask = argumentParser.get<uint32_t>("--threads"),
            .delay = argumentParser.get<bool>("--delay"),
            .bareParameters = argumentParser.get<bool>("--params"),
            .dryRun = argumentParser.get<bool>("--dry-run"),
        };
        logger.debug(fmt::format("Threads per task: {}", options.threadsPerTask));

        const auto context = taskfarm::ExecutionContext::fromProcessEnvironment();
        const auto positionals = argumentParser.present<std::vector<std::string>>("command")
            .value_or(std::vector<std::string>());
        const auto source = taskfarm::TaskSource::fromPositionals(positionals, context.searchPath);

        taskfarm::Farm farm(context, settings, options);
        taskfarm::ProcessLauncher launcher;

        return farm.run(source, launcher);
    }
    catch (const std::exception& e) {
        logger.critical(e.what());

        return TASKFARM_PRECONDITION_EXIT_CODE;
    }
}

static argparse::ArgumentParser createArgumentParser() {
    argparse::ArgumentParser program("taskfarm");

    program.add_description(
        "Distribute the lines of a command file, or a command template applied to each argument, "
        "round-robin over the slots of the current allocation and run them with one multi-program launch."
    );

    program.add_argument("-t", "--threads")
        .help("Threads per task, passed to the launcher and as " + std::string(TASKFARM_THREADS_ENV))
        .default_value(uint32_t(1))
        .scan<'d', uint32_t>();

    program.add_argument("-d", "--delay")
        .help("Stagger slot start-up by the delay increment (0.1s by default) per slot")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-p", "--params")
        .help("Treat arguments as bare parameters instead of files")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-v", "--verbose")
        .help("Log progress")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--missing-files")
        .help("What to do with file arguments that don't exist: skip or fail");

    program.add_argument("--dry-run")
        .help("Write and print the launch configuration without launching")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--config")
        .help("JSON settings file, defaults to $" + std::string(TASKFARM_ENV_CONFIG));

    program.add_argument("command")
        .help("Command file, or command template followed by its arguments")
        .remaining();

    return program;
}

static taskfarm::Settings loadSettings(const argparse::ArgumentParser& argumentParser) {
    if (auto settingsPath = argumentParser.present("--config")) {
        return taskfarm::Settings::load(*settingsPath);
    }

    const char* settingsPath = std::getenv(TASKFARM_ENV_CONFIG);
    if (settingsPath && *settingsPath) {
        return taskfarm::Settings::load(settingsPath);
    }

    return taskfarm::Settings();
}
