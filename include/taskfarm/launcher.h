#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace taskfarm {
    struct LaunchRequest {
        // Program and leading flags, e.g. {"srun", "--multi-prog"}.
        std::vector<std::string> launcherCommand;
        std::string configPath;
        uint32_t threadsPerTask = 1;
    };

    // launcherCommand[0], thread binding flags when threadsPerTask > 1, the
    // remaining launcher flags, then the configuration path.
    std::vector<std::string> buildLauncherArguments(const LaunchRequest& request);

    // Runs a launch configuration to completion and reports the aggregate
    // exit status. No retries.
    class Launcher {
    public:
        virtual ~Launcher() {}

        virtual int32_t launch(const LaunchRequest& request) = 0;
    };

    // Spawns the launcher as a child process and waits for it. Exit status is
    // passed through; death by signal N is reported as 128 + N.
    class ProcessLauncher : public Launcher {
    public:
        int32_t launch(const LaunchRequest& request) override;
    };
}
