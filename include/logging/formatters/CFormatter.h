#pragma once

#include <string>

namespace logging {
    class Record;

    namespace formatters::cstr {
        // "<name> | <pid> [LEVEL] YYYY-mm-ddTHH:MM:SSZ - message"
        std::string formatRecord(const logging::Record& record);
    }
}
