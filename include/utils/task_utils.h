#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace utils {
    inline std::size_t slotFor(std::size_t taskIndex, std::size_t slotCount) {
        return taskIndex % slotCount;
    }

    // ceil(taskCount / slotCount)
    inline std::size_t roundCount(std::size_t taskCount, std::size_t slotCount) {
        if (slotCount == 0) {
            throw std::invalid_argument("Slot count must be greater than 0");
        }

        return (taskCount + slotCount - 1) / slotCount;
    }

    // Task k of taskList ends up in chunk k mod slotCount, in source order.
    template <class T>
    std::vector<std::vector<T>> generateTaskChunks(
        const std::vector<T>& taskList, std::size_t slotCount
    ) {
        if (slotCount == 0) {
            throw std::invalid_argument("Slot count must be greater than 0");
        }

        std::vector<std::vector<T>> taskChunks(slotCount, std::vector<T>());

        std::size_t tasksTotalCount = taskList.size();
        for (std::size_t taskIndex = 0; taskIndex != tasksTotalCount; ++taskIndex) {
            auto& taskChunk = taskChunks[slotFor(taskIndex, slotCount)];

            taskChunk.push_back(taskList[taskIndex]);
        }

        return taskChunks;
    }

    // Splits taskList into consecutive rounds of at most slotCount tasks: task k
    // lands in round k / slotCount at position k mod slotCount.
    template <class T>
    std::vector<std::vector<T>> generateTaskRounds(
        const std::vector<T>& taskList, std::size_t slotCount
    ) {
        std::vector<std::vector<T>> taskRounds(roundCount(taskList.size(), slotCount));

        std::size_t tasksTotalCount = taskList.size();
        for (std::size_t taskIndex = 0; taskIndex != tasksTotalCount; ++taskIndex) {
            auto& taskRound = taskRounds[taskIndex / slotCount];

            taskRound.push_back(taskList[taskIndex]);
        }

        return taskRounds;
    }
}
