#pragma once

#include "logging/Level.h"
#include <string>
#include <chrono>
#include <cstdint>

namespace logging {
    using TimePoint = std::chrono::time_point<std::chrono::system_clock>;

    // One log line before formatting.
    class Record {
    public:
        std::string name;
        Level level;
        TimePoint time;
        int64_t processId;
        std::string message;

        std::string getLevelName() const {
            return toLevelName(level);
        }
    };
}
