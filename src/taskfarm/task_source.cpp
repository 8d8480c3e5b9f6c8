#include "taskfarm-config.h"
#include "taskfarm/task_source.h"
#include "taskfarm/errors.h"
#include "taskfarm/logger.h"

#include "utils/io_utils.h"
#include "fmt/format.h"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <unistd.h>

namespace fs = std::filesystem;

namespace taskfarm {
    static std::string firstWord(const std::string& command);
    static bool isExecutableFile(const fs::path& path);

    MissingArgumentPolicy parseMissingArgumentPolicy(const std::string& name) {
        if (name == "skip") {
            return MissingArgumentPolicy::Skip;
        }
        else if (name == "fail") {
            return MissingArgumentPolicy::Fail;
        }

        throw std::invalid_argument(fmt::format("Unknown missing files policy: {} (expected skip or fail)", name));
    }

    std::string toPolicyName(MissingArgumentPolicy policy) {
        return policy == MissingArgumentPolicy::Skip ? "skip" : "fail";
    }

    bool isCommentLine(const std::string& line) {
        auto firstVisible = line.find_first_not_of(" \t");

        return firstVisible != std::string::npos && line[firstVisible] == TASKFARM_COMMENT_MARKER;
    }

    std::vector<Task> parseTaskLines(const std::vector<std::string>& lines) {
        std::vector<Task> tasks;
        tasks.reserve(lines.size());

        for (const auto& line : lines) {
            if (line.find_first_not_of(" \t") == std::string::npos || isCommentLine(line)) {
                continue;
            }

            tasks.push_back(Task{ line });
        }

        return tasks;
    }

    std::vector<Task> readTaskFile(const std::string& filePath) {
        std::vector<std::string> lines;

        try {
            utils::readLines(filePath, lines);
        }
        catch (const std::runtime_error& e) {
            throw PreconditionError(fmt::format("Command file not readable: {}", e.what()));
        }

        return parseTaskLines(lines);
    }

    std::string composeCommand(const std::string& commandTemplate, const std::string& argument) {
        const std::string placeholder(TASKFARM_TEMPLATE_PLACEHOLDER);

        auto placeholderPos = commandTemplate.find(placeholder);
        if (placeholderPos == std::string::npos) {
            return fmt::format("{} {}", commandTemplate, argument);
        }

        std::string command;
        std::size_t copiedPos = 0;
        while (placeholderPos != std::string::npos) {
            command.append(commandTemplate, copiedPos, placeholderPos - copiedPos);
            command.append(argument);

            copiedPos = placeholderPos + placeholder.size();
            placeholderPos = commandTemplate.find(placeholder, copiedPos);
        }
        command.append(commandTemplate, copiedPos, std::string::npos);

        return command;
    }

    std::vector<Task> expandTemplate(
        const std::string& commandTemplate,
        const std::vector<std::string>& arguments,
        const TemplateOptions& options
    ) {
        auto& logger = getLogger();

        std::vector<Task> tasks;
        tasks.reserve(arguments.size());

        for (const auto& argument : arguments) {
            std::error_code errorCode;
            if (!options.bareParameters && !fs::exists(argument, errorCode)) {
                if (options.missingArguments == MissingArgumentPolicy::Fail) {
                    throw PreconditionError(fmt::format("File argument not found: {}", argument));
                }

                logger.warning(fmt::format("Skip missing file argument: {}", argument));
                tasks.push_back(Task::noop(options.noopCommand));

                continue;
            }

            tasks.push_back(Task{ composeCommand(commandTemplate, argument) });
        }

        return tasks;
    }

    std::optional<std::string> findExecutable(const std::string& command, const std::string& searchPath) {
        std::string program = firstWord(command);
        if (program.empty()) {
            return std::nullopt;
        }

        if (program.find('/') != std::string::npos) {
            if (isExecutableFile(program)) {
                return program;
            }

            return std::nullopt;
        }

        std::istringstream searchPathStream(searchPath);
        std::string searchDir;
        while (std::getline(searchPathStream, searchDir, ':')) {
            // Empty PATH entries mean the current directory.
            fs::path candidate = fs::path(searchDir.empty() ? "." : searchDir) / program;
            if (isExecutableFile(candidate)) {
                return candidate.string();
            }
        }

        return std::nullopt;
    }

    bool hasOutputRedirection(const std::vector<Task>& tasks) {
        return std::any_of(tasks.cbegin(), tasks.cend(), [](const Task& task) {
            return !task.isNoop && task.command.find('>') != std::string::npos;
        });
    }

    TaskSource TaskSource::fromPositionals(const std::vector<std::string>& positionals, const std::string& searchPath) {
        if (positionals.empty()) {
            throw PreconditionError("No command file or command template given");
        }

        const auto& first = positionals.front();
        std::error_code errorCode;
        if (positionals.size() == 1 && fs::is_regular_file(first, errorCode)) {
            return commandFile(first);
        }

        if (!findExecutable(first, searchPath)) {
            throw PreconditionError(fmt::format("Command file or executable not found: {}", first));
        }

        return commandTemplate(first, std::vector<std::string>(positionals.begin() + 1, positionals.end()));
    }

    TaskSource TaskSource::commandFile(const std::string& filePath) {
        TaskSource source(SourceMode::CommandFile);
        source._commandFile = filePath;

        return source;
    }

    TaskSource TaskSource::commandTemplate(const std::string& commandTemplate, const std::vector<std::string>& arguments) {
        TaskSource source(SourceMode::Template);
        source._commandTemplate = commandTemplate;
        source._arguments = arguments;

        return source;
    }

    std::vector<Task> TaskSource::load(const TemplateOptions& options) const {
        if (_mode == SourceMode::CommandFile) {
            return readTaskFile(_commandFile);
        }

        return expandTemplate(_commandTemplate, _arguments, options);
    }

    static std::string firstWord(const std::string& command) {
        std::istringstream commandStream(command);
        std::string word;
        commandStream >> word;

        return word;
    }

    static bool isExecutableFile(const fs::path& path) {
        std::error_code errorCode;
        if (!fs::is_regular_file(path, errorCode)) {
            return false;
        }

        return ::access(path.c_str(), X_OK) == 0;
    }
}
