#include "logging/formatters/CFormatter.h"
#include "logging/Record.h"
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <cstring>
#include <iterator>

namespace logging::formatters::cstr {
    static std::string makeTimeString(time_t timeObj);

    std::string formatRecord(const Record& record) {
        static const int32_t LOG_HEADER_BUFFER_SIZE = 256;

        time_t timeObj = std::chrono::system_clock::to_time_t(record.time);
        std::string timeString = makeTimeString(timeObj);

        char logHeaderBuffer[LOG_HEADER_BUFFER_SIZE];
        memset(logHeaderBuffer, 0, LOG_HEADER_BUFFER_SIZE);
        snprintf(logHeaderBuffer, LOG_HEADER_BUFFER_SIZE, "%-10s| <pid-%lld> [%s] %sZ - ",
            record.name.c_str(),
            static_cast<long long>(record.processId),
            record.getLevelName().c_str(),
            timeString.c_str()
        );

        // Messages carry whole task commands, which have no length limit.
        return std::string(logHeaderBuffer) + record.message;
    }

    static std::string makeTimeString(time_t timeObj) {
        static constexpr std::size_t TIME_BUFFER_SIZE = std::size("YYYY-mm-ddTHH:MM:SS");

        char timeBuffer[TIME_BUFFER_SIZE];
        memset(timeBuffer, 0, TIME_BUFFER_SIZE);

        std::tm timeParts{};
        gmtime_r(&timeObj, &timeParts);
        std::strftime(std::data(timeBuffer), TIME_BUFFER_SIZE, "%Y-%m-%dT%H:%M:%S", &timeParts);

        return std::string(timeBuffer);
    }
}
