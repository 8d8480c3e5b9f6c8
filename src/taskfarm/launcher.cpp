#include "taskfarm-config.h"
#include "taskfarm/launcher.h"
#include "taskfarm/errors.h"
#include "taskfarm/logger.h"

#include "fmt/format.h"
#include "fmt/ranges.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace taskfarm {
    std::vector<std::string> buildLauncherArguments(const LaunchRequest& request) {
        if (request.launcherCommand.empty()) {
            throw std::invalid_argument("Launcher command is empty");
        }

        std::vector<std::string> arguments{ request.launcherCommand.front() };

        if (request.threadsPerTask > 1) {
            arguments.push_back(fmt::format("{}={}", TASKFARM_CPUS_PER_TASK_FLAG, request.threadsPerTask));
            arguments.push_back(TASKFARM_CPU_BIND_FLAG);
        }

        arguments.insert(arguments.end(), request.launcherCommand.begin() + 1, request.launcherCommand.end());
        arguments.push_back(request.configPath);

        return arguments;
    }

    int32_t ProcessLauncher::launch(const LaunchRequest& request) {
        auto& logger = getLogger();

        const std::vector<std::string> arguments = buildLauncherArguments(request);
        std::vector<char*> argv;
        for (const auto& argument : arguments) {
            argv.push_back(const_cast<char*>(argument.c_str()));
        }
        argv.push_back(nullptr);

        std::string threadCount = std::to_string(request.threadsPerTask);
        logger.info(fmt::format("Launch: {}", fmt::join(arguments, " ")));

        // Reports a failed exec back to the parent; closed by a successful one.
        int execErrorPipe[2];
        if (::pipe2(execErrorPipe, O_CLOEXEC) == -1) {
            throw std::runtime_error(fmt::format("Can't create pipe: {}", std::strerror(errno)));
        }

        pid_t pid = ::fork();
        if (pid == -1) {
            int forkError = errno;
            ::close(execErrorPipe[0]);
            ::close(execErrorPipe[1]);

            throw std::runtime_error(fmt::format("Can't fork launcher: {}", std::strerror(forkError)));
        }

        if (pid == 0) {
            ::close(execErrorPipe[0]);
            if (request.threadsPerTask > 1) {
                ::setenv(TASKFARM_THREADS_ENV, threadCount.c_str(), 1);
            }

            ::execvp(argv[0], argv.data());

            int execError = errno;
            ssize_t written = ::write(execErrorPipe[1], &execError, sizeof(execError));
            (void)written;
            ::_exit(127);
        }

        ::close(execErrorPipe[1]);

        int execError = 0;
        ssize_t readSize = 0;
        do {
            readSize = ::read(execErrorPipe[0], &execError, sizeof(execError));
        } while (readSize == -1 && errno == EINTR);
        ::close(execErrorPipe[0]);

        int status = 0;
        pid_t waitedPid = 0;
        do {
            waitedPid = ::waitpid(pid, &status, 0);
        } while (waitedPid == -1 && errno == EINTR);

        if (waitedPid == -1) {
            throw std::runtime_error(fmt::format("Can't wait for launcher: {}", std::strerror(errno)));
        }

        if (readSize == sizeof(execError)) {
            throw PreconditionError(fmt::format("Can't execute launcher {}: {}", arguments.front(), std::strerror(execError)));
        }

        if (WIFSIGNALED(status)) {
            int32_t signalNumber = WTERMSIG(status);
            logger.error(fmt::format("Launcher killed by signal {}", signalNumber));

            return 128 + signalNumber;
        }

        int32_t exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : EXIT_FAILURE;
        if (exitCode != 0) {
            logger.error(fmt::format("Launcher exited with status {}", exitCode));
        }
        else {
            logger.info("Launcher finished");
        }

        return exitCode;
    }
}
