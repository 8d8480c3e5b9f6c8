#pragma once

#include <iostream>
#include <cstdint>
#include <string>
#include <array>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace logging {
    enum class Level : int8_t {
        Critical = 0,
        Error = 1,
        Warning = 2,
        Info = 3,
        Debug = 4,
        Trace = 5,
    };

    inline constexpr std::array<const char*, 6> LevelNames{
        "CRITICAL",
        "ERROR",
        "WARN",
        "INFO",
        "DEBUG",
        "TRACE",
    };

    inline std::string toLevelName(Level level)
    {
        return LevelNames.at(static_cast<std::size_t>(level));
    }

    // Accepts the names printed by toLevelName, case-insensitive.
    inline Level fromLevelName(const std::string& name)
    {
        std::string upperName(name);
        std::transform(upperName.begin(), upperName.end(), upperName.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });

        for (std::size_t levelIndex = 0; levelIndex != LevelNames.size(); ++levelIndex) {
            if (upperName == LevelNames[levelIndex]) {
                return static_cast<Level>(levelIndex);
            }
        }

        throw std::invalid_argument("Unknown log level: " + name);
    }

    inline std::ostream& operator<<(std::ostream& os, Level level)
    {
        os << toLevelName(level);

        return os;
    }
}
