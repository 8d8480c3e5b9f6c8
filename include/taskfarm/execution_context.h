#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace taskfarm {
    using Environment = std::map<std::string, std::string>;

    // Everything taskfarm needs from the surrounding resource allocation,
    // captured once at startup.
    struct ExecutionContext {
        std::string allocationId;
        std::optional<uint32_t> taskCount;
        std::optional<uint32_t> cpusPerNode;
        std::optional<std::string> nodeList;
        std::string scratchDir;
        std::string submitDir;
        std::string searchPath;

        // Hosts in the node list, nullopt when the allocation names none.
        // Throws PreconditionError on a malformed list.
        std::optional<uint64_t> nodeCount() const;

        static ExecutionContext fromEnvironment(const Environment& environment);
        static ExecutionContext fromProcessEnvironment();
    };

    // Number of hosts in a compressed host list such as "node[01-03,07],gpu5",
    // counted without expanding it. Throws std::invalid_argument on a
    // malformed list.
    uint64_t countNodes(const std::string& nodeList);

    // Number of launcher slots: the explicit task count when the allocation has
    // one, else CPUs per node times node count divided by threadsPerTask.
    uint32_t resolveSlotCount(const ExecutionContext& context, uint32_t threadsPerTask = 1);
}
