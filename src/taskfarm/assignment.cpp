#include "taskfarm/assignment.h"
#include "taskfarm/logger.h"

#include "utils/task_utils.h"
#include "fmt/format.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace taskfarm {
    std::size_t Assignment::taskCount() const {
        return std::accumulate(slots.cbegin(), slots.cend(), std::size_t(0), [](std::size_t count, const auto& slotTasks) {
            return count + slotTasks.size();
        });
    }

    std::size_t Assignment::noopCount() const {
        std::size_t count = 0;
        for (const auto& slotTasks : slots) {
            count += std::count_if(slotTasks.cbegin(), slotTasks.cend(), [](const Task& task) {
                return task.isNoop;
            });
        }

        return count;
    }

    Assignment assignRoundRobin(const std::vector<Task>& tasks, uint32_t slotCount) {
        return Assignment{ utils::generateTaskChunks(tasks, slotCount) };
    }

    std::vector<Assignment> assignRounds(const std::vector<Task>& tasks, uint32_t slotCount) {
        std::vector<Assignment> rounds;

        for (const auto& roundTasks : utils::generateTaskRounds(tasks, slotCount)) {
            rounds.push_back(assignRoundRobin(roundTasks, slotCount));
        }

        return rounds;
    }

    std::size_t padAssignment(Assignment& assignment, const std::string& noopCommand) {
        std::size_t paddedCount = 0;

        for (auto& slotTasks : assignment.slots) {
            if (slotTasks.empty()) {
                slotTasks.push_back(Task::noop(noopCommand));
                ++paddedCount;
            }
        }

        if (paddedCount > 0) {
            getLogger().warning(fmt::format(
                "Not enough tasks to fill all slots: {} of {} slots run '{}'",
                paddedCount, assignment.slotCount(), noopCommand
            ));
        }

        return paddedCount;
    }

    std::string delayCommand(uint32_t slot, double increment) {
        if (increment < 0) {
            throw std::invalid_argument(fmt::format("Delay increment must not be negative: {}", increment));
        }

        // At least one decimal, more only when the increment needs them.
        int32_t precision = 1;
        while (precision < 6 && std::abs(increment * std::pow(10.0, precision) - std::round(increment * std::pow(10.0, precision))) > 1e-9) {
            ++precision;
        }

        return fmt::format("sleep {:.{}f}", slot * increment, precision);
    }

    std::string injectDelay(const std::string& command, uint32_t slot, double increment) {
        return fmt::format("{} && {}", delayCommand(slot, increment), command);
    }

    void injectDelays(std::vector<std::string>& slotCommands, double increment) {
        uint32_t slot = 0;
        for (auto& slotCommand : slotCommands) {
            slotCommand = injectDelay(slotCommand, slot, increment);

            ++slot;
        }
    }
}
