#include "taskfarm/logger.h"

LoggerType& getLogger() {
    using logging::LoggerFactory;
    using logging::Level;
    using logging::handlers::StreamHandler;
    using logging::formatters::cstr::formatRecord;

    static auto logger = LoggerFactory<Level::Debug>::createLogger("taskfarm", std::make_tuple(
        StreamHandler<Level::Debug>(formatRecord)
    ), Level::Warning);

    return logger;
}
