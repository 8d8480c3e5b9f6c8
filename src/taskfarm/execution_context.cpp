#include "taskfarm-config.h"
#include "taskfarm/execution_context.h"
#include "taskfarm/errors.h"
#include "taskfarm/logger.h"

#include "fmt/format.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

extern char** environ;

namespace taskfarm {
    static std::optional<std::string> lookup(const Environment& environment, const char* name);
    static std::optional<uint32_t> lookupCount(const Environment& environment, const char* name);
    static std::vector<std::string> splitTopLevel(const std::string& nodeList);
    static uint64_t countHostPattern(const std::string& pattern);
    static uint64_t countRange(const std::string& range);
    static uint64_t parseRangeBound(const std::string& bound, const std::string& range);
    static uint64_t saturatingAdd(uint64_t lhs, uint64_t rhs);
    static uint64_t saturatingMultiply(uint64_t lhs, uint64_t rhs);

    ExecutionContext ExecutionContext::fromEnvironment(const Environment& environment) {
        ExecutionContext context;

        context.allocationId = lookup(environment, TASKFARM_ENV_JOB_ID).value_or("");
        context.taskCount = lookupCount(environment, TASKFARM_ENV_NTASKS);
        if (!context.taskCount) {
            context.taskCount = lookupCount(environment, TASKFARM_ENV_NPROCS);
        }

        context.cpusPerNode = lookupCount(environment, TASKFARM_ENV_CPUS_ON_NODE);
        context.nodeList = lookup(environment, TASKFARM_ENV_JOB_NODELIST);
        if (!context.nodeList) {
            context.nodeList = lookup(environment, TASKFARM_ENV_NODELIST);
        }

        context.scratchDir = lookup(environment, TASKFARM_ENV_SCRATCH_DIR).value_or("");
        context.submitDir = lookup(environment, TASKFARM_ENV_SUBMIT_DIR).value_or("");
        context.searchPath = lookup(environment, "PATH").value_or("");

        return context;
    }

    ExecutionContext ExecutionContext::fromProcessEnvironment() {
        Environment environment;

        for (char** entry = environ; entry && *entry; ++entry) {
            std::string variable(*entry);
            auto separatorPos = variable.find('=');
            if (separatorPos == std::string::npos) {
                continue;
            }

            environment.emplace(variable.substr(0, separatorPos), variable.substr(separatorPos + 1));
        }

        return fromEnvironment(environment);
    }

    std::optional<uint64_t> ExecutionContext::nodeCount() const {
        if (!nodeList) {
            return std::nullopt;
        }

        try {
            return countNodes(*nodeList);
        }
        catch (const std::invalid_argument& e) {
            throw PreconditionError(e.what());
        }
    }

    uint64_t countNodes(const std::string& nodeList) {
        uint64_t count = 0;

        for (const auto& pattern : splitTopLevel(nodeList)) {
            count = saturatingAdd(count, countHostPattern(pattern));
        }

        return count;
    }

    uint32_t resolveSlotCount(const ExecutionContext& context, uint32_t threadsPerTask) {
        auto& logger = getLogger();

        if (context.taskCount) {
            if (*context.taskCount == 0) {
                throw PreconditionError("Allocation reports 0 tasks");
            }

            logger.debug(fmt::format("Slot count from allocation task count: {}", *context.taskCount));

            return *context.taskCount;
        }

        if (!context.nodeList || !context.cpusPerNode) {
            throw PreconditionError(fmt::format(
                "No active resource allocation: {} or {} and {} must be set",
                TASKFARM_ENV_NTASKS, TASKFARM_ENV_CPUS_ON_NODE, TASKFARM_ENV_JOB_NODELIST
            ));
        }

        uint64_t nodeCount = *context.nodeCount();
        uint64_t cpuCount = saturatingMultiply(*context.cpusPerNode, nodeCount);
        if (cpuCount == 0) {
            throw PreconditionError(fmt::format("Allocation has no CPUs: {}", *context.nodeList));
        }

        uint64_t slotCount = cpuCount / std::max<uint32_t>(threadsPerTask, 1);
        if (slotCount > UINT32_MAX) {
            throw PreconditionError(fmt::format("Allocation too large: {} slots on {}", slotCount, *context.nodeList));
        }

        logger.debug(fmt::format(
            "Slot count from node list: {} nodes x {} CPUs / {} threads", nodeCount, *context.cpusPerNode, threadsPerTask
        ));

        return static_cast<uint32_t>(std::max<uint64_t>(slotCount, 1));
    }

    static std::optional<std::string> lookup(const Environment& environment, const char* name) {
        auto variable = environment.find(name);
        if (variable == environment.end() || variable->second.empty()) {
            return std::nullopt;
        }

        return variable->second;
    }

    // Slurm writes counts such as SLURM_CPUS_ON_NODE as plain integers;
    // anything else is a broken allocation.
    static std::optional<uint32_t> lookupCount(const Environment& environment, const char* name) {
        auto value = lookup(environment, name);
        if (!value) {
            return std::nullopt;
        }

        std::size_t parsedSize = 0;
        unsigned long count = 0;
        try {
            count = std::stoul(*value, &parsedSize);
        }
        catch (const std::exception&) {
            parsedSize = 0;
        }

        if (parsedSize != value->size() || (*value)[0] == '-' || count > UINT32_MAX) {
            throw PreconditionError(fmt::format("Invalid {} value: {}", name, *value));
        }

        return static_cast<uint32_t>(count);
    }

    static std::vector<std::string> splitTopLevel(const std::string& nodeList) {
        std::vector<std::string> patterns;
        std::string pattern;
        int32_t depth = 0;

        for (char c : nodeList) {
            if (c == '[') {
                ++depth;
            }
            else if (c == ']') {
                if (--depth < 0) {
                    throw std::invalid_argument(fmt::format("Unbalanced ']' in node list: {}", nodeList));
                }
            }

            if (c == ',' && depth == 0) {
                if (!pattern.empty()) {
                    patterns.push_back(pattern);
                }
                pattern.clear();

                continue;
            }

            pattern.push_back(c);
        }

        if (depth != 0) {
            throw std::invalid_argument(fmt::format("Unbalanced '[' in node list: {}", nodeList));
        }

        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }

        return patterns;
    }

    // Hosts named by one pattern: the product of the widths of its bracket
    // groups, e.g. "rack[1-2]-n[1-4]" names 8 hosts.
    static uint64_t countHostPattern(const std::string& pattern) {
        uint64_t count = 1;
        std::size_t groupBegin = 0;

        while ((groupBegin = pattern.find('[', groupBegin)) != std::string::npos) {
            auto groupEnd = pattern.find(']', groupBegin);
            std::string ranges = pattern.substr(groupBegin + 1, groupEnd - groupBegin - 1);
            if (ranges.find('[') != std::string::npos) {
                throw std::invalid_argument(fmt::format("Nested '[' in node list pattern: {}", pattern));
            }

            uint64_t groupCount = 0;
            std::size_t rangeBegin = 0;
            while (rangeBegin <= ranges.size()) {
                auto rangeEnd = ranges.find(',', rangeBegin);
                if (rangeEnd == std::string::npos) {
                    rangeEnd = ranges.size();
                }

                groupCount = saturatingAdd(groupCount, countRange(ranges.substr(rangeBegin, rangeEnd - rangeBegin)));
                rangeBegin = rangeEnd + 1;
            }

            count = saturatingMultiply(count, groupCount);
            groupBegin = groupEnd + 1;
        }

        return count;
    }

    static uint64_t countRange(const std::string& range) {
        auto dashPos = range.find('-');
        std::string low = range.substr(0, dashPos);
        std::string high = dashPos == std::string::npos ? low : range.substr(dashPos + 1);

        uint64_t lowValue = parseRangeBound(low, range);
        uint64_t highValue = parseRangeBound(high, range);
        if (highValue < lowValue) {
            throw std::invalid_argument(fmt::format("Invalid node range: [{}]", range));
        }

        return saturatingAdd(highValue - lowValue, 1);
    }

    static uint64_t parseRangeBound(const std::string& bound, const std::string& range) {
        if (bound.empty() || bound.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument(fmt::format("Invalid node range: [{}]", range));
        }

        try {
            return std::stoull(bound);
        }
        catch (const std::out_of_range&) {
            throw std::invalid_argument(fmt::format("Node range bound out of range: [{}]", range));
        }
    }

    static uint64_t saturatingAdd(uint64_t lhs, uint64_t rhs) {
        return lhs > UINT64_MAX - rhs ? UINT64_MAX : lhs + rhs;
    }

    static uint64_t saturatingMultiply(uint64_t lhs, uint64_t rhs) {
        if (lhs != 0 && rhs > UINT64_MAX / lhs) {
            return UINT64_MAX;
        }

        return lhs * rhs;
    }
}
