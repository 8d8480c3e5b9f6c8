#pragma once

#include <stdexcept>
#include <string>

namespace taskfarm {
    // A local condition that must hold before the launcher can be invoked:
    // readable command file, active allocation, writable work directory.
    class PreconditionError : public std::runtime_error {
    public:
        explicit PreconditionError(const std::string& message) : std::runtime_error(message) {}
    };
}
