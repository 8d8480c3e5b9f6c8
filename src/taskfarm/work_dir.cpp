#include "taskfarm-config.h"
#include "taskfarm/work_dir.h"
#include "taskfarm/errors.h"
#include "taskfarm/logger.h"

#include "fmt/format.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace taskfarm {
    std::string workDirectoryPath(const ExecutionContext& context, const Settings& settings) {
        if (context.allocationId.empty()) {
            throw PreconditionError(fmt::format("No active resource allocation: {} is not set", TASKFARM_ENV_JOB_ID));
        }

        if (context.allocationId.find('/') != std::string::npos || context.allocationId == "." || context.allocationId == "..") {
            throw PreconditionError(fmt::format("Invalid allocation id: {}", context.allocationId));
        }

        std::string scratchDir = settings.scratchDir;
        if (scratchDir.empty()) {
            uint64_t nodeCount = context.nodeCount().value_or(1);

            // Slot scripts must be readable on every node of the allocation.
            if (nodeCount > 1 && !context.submitDir.empty()) {
                scratchDir = context.submitDir;
            }
            else {
                scratchDir = context.scratchDir.empty() ? TASKFARM_DEFAULT_SCRATCH_DIR : context.scratchDir;

                if (nodeCount > 1) {
                    getLogger().warning(fmt::format(
                        "Allocation spans {} nodes but the work directory is under {}, which may be node-local; "
                        "set scratch_dir to a shared directory",
                        nodeCount, scratchDir
                    ));
                }
            }
        }

        return (fs::path(scratchDir) / fmt::format("{}{}", TASKFARM_WORK_DIR_PREFIX, context.allocationId)).string();
    }

    std::string prepareWorkDirectory(const ExecutionContext& context, const Settings& settings) {
        auto& logger = getLogger();
        std::string workDir = workDirectoryPath(context, settings);

        std::error_code errorCode;
        if (fs::exists(workDir, errorCode)) {
            auto removedCount = fs::remove_all(workDir, errorCode);
            if (errorCode) {
                throw PreconditionError(fmt::format("Can't clear stale work directory {}: {}", workDir, errorCode.message()));
            }

            logger.info(fmt::format("Cleared stale work directory {} ({} entries)", workDir, removedCount));
        }

        fs::create_directories(workDir, errorCode);
        if (errorCode) {
            throw PreconditionError(fmt::format("Can't create work directory {}: {}", workDir, errorCode.message()));
        }

        logger.debug(fmt::format("Work directory: {}", workDir));

        return workDir;
    }
}
