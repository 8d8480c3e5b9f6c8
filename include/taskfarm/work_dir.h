#pragma once

#include "taskfarm/execution_context.h"
#include "taskfarm/settings.h"

#include <string>

namespace taskfarm {
    // <scratch>/taskfarm.<allocation id>. Scratch is the scratch_dir setting;
    // otherwise SLURM_SUBMIT_DIR when the allocation spans several nodes, then
    // TMPDIR, then /tmp. A multi-node allocation left with TMPDIR or /tmp is
    // warned about.
    std::string workDirectoryPath(const ExecutionContext& context, const Settings& settings);

    // Removes whatever a previous run of the same allocation left behind and
    // creates the directory empty. Returns its path.
    std::string prepareWorkDirectory(const ExecutionContext& context, const Settings& settings);
}
