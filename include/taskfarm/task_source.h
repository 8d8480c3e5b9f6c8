#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace taskfarm {
    // One unit of work, a shell command line. No-op entries stand in for
    // slots or slot cycles that have nothing to run.
    struct Task {
        std::string command;
        bool isNoop = false;

        static Task noop(const std::string& noopCommand) {
            return Task{ noopCommand, true };
        }

        bool operator==(const Task& rhs) const = default;
    };

    enum class SourceMode : int8_t {
        CommandFile,
        Template,
    };

    // What happens to a template argument that is not an existing path while
    // arguments are treated as files.
    enum class MissingArgumentPolicy : int8_t {
        // Keep its position, run the no-op entry in its slot cycle.
        Skip,
        // Abort before any slot work begins.
        Fail,
    };

    MissingArgumentPolicy parseMissingArgumentPolicy(const std::string& name);
    std::string toPolicyName(MissingArgumentPolicy policy);

    struct TemplateOptions {
        bool bareParameters = false;
        MissingArgumentPolicy missingArguments = MissingArgumentPolicy::Skip;
        std::string noopCommand;
    };

    bool isCommentLine(const std::string& line);
    std::vector<Task> parseTaskLines(const std::vector<std::string>& lines);
    std::vector<Task> readTaskFile(const std::string& filePath);

    // Replaces every "{}" in commandTemplate with argument, or appends the
    // argument after a space when there is no placeholder.
    std::string composeCommand(const std::string& commandTemplate, const std::string& argument);

    std::vector<Task> expandTemplate(
        const std::string& commandTemplate,
        const std::vector<std::string>& arguments,
        const TemplateOptions& options
    );

    // Resolves the first word of command to an executable, either as a path
    // or through the ':'-separated searchPath.
    std::optional<std::string> findExecutable(const std::string& command, const std::string& searchPath);

    bool hasOutputRedirection(const std::vector<Task>& tasks);

    class TaskSource {
    public:
        // A single positional naming a regular file is a command file; otherwise
        // the first positional is a command template whose program must be
        // resolvable, and the rest are its arguments.
        static TaskSource fromPositionals(const std::vector<std::string>& positionals, const std::string& searchPath);

        static TaskSource commandFile(const std::string& filePath);
        static TaskSource commandTemplate(const std::string& commandTemplate, const std::vector<std::string>& arguments);

        SourceMode getMode() const {
            return _mode;
        }

        const std::string& getCommandFile() const {
            return _commandFile;
        }

        const std::string& getCommandTemplate() const {
            return _commandTemplate;
        }

        const std::vector<std::string>& getArguments() const {
            return _arguments;
        }

        // Tasks in source order. Can be called any number of times.
        std::vector<Task> load(const TemplateOptions& options) const;

    private:
        TaskSource(SourceMode mode) : _mode(mode) {}

        SourceMode _mode;
        std::string _commandFile;
        std::string _commandTemplate;
        std::vector<std::string> _arguments;
    };
}
