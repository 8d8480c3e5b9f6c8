#pragma once

#include "logging/Logger.h"
#include "logging/formatters/CFormatter.h"
#include "logging/handlers/StreamHandler.h"

using LoggerType = decltype(logging::LoggerFactory<logging::Level::Debug>::createLogger("taskfarm", std::make_tuple(
    logging::handlers::StreamHandler<logging::Level::Debug>(logging::formatters::cstr::formatRecord)
)));

// Process-wide logger writing to stderr. Warnings and above by default,
// lowered to Debug by --verbose.
LoggerType& getLogger();
