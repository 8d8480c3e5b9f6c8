#pragma once

#include "taskfarm/task_source.h"

#include <cstdint>
#include <string>
#include <vector>

namespace taskfarm {
    // Tasks bound to each launcher slot, indexed by slot id.
    struct Assignment {
        std::vector<std::vector<Task>> slots;

        std::size_t slotCount() const {
            return slots.size();
        }

        std::size_t taskCount() const;
        std::size_t noopCount() const;
    };

    // Task k goes to slot k mod slotCount; a slot may receive several tasks.
    Assignment assignRoundRobin(const std::vector<Task>& tasks, uint32_t slotCount);

    // ceil(M / slotCount) assignments of at most one task per slot, run one
    // after another.
    std::vector<Assignment> assignRounds(const std::vector<Task>& tasks, uint32_t slotCount);

    // Gives every empty slot the no-op entry. Returns the number of padded slots.
    std::size_t padAssignment(Assignment& assignment, const std::string& noopCommand);

    // "sleep <slot x increment>", the offset printed with one decimal.
    std::string delayCommand(uint32_t slot, double increment);

    // "sleep <slot x increment> && <command>"
    std::string injectDelay(const std::string& command, uint32_t slot, double increment);
    void injectDelays(std::vector<std::string>& slotCommands, double increment);
}
