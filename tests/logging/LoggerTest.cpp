#include <gtest/gtest.h>
#include "logging/Logger.h"
#include "logging/formatters/CFormatter.h"
#include "logging/handlers/StreamHandler.h"

#include <sstream>
#include <stdexcept>

using logging::Level;
using logging::LoggerFactory;
using logging::handlers::StreamHandler;

TEST(LoggerTest, RuntimeThresholdDropsLowerLevels) {
    std::ostringstream output;
    auto logger = LoggerFactory<Level::Debug>::createLogger("test", std::make_tuple(
        StreamHandler<Level::Debug>(output, logging::defaultFormatter)
    ), Level::Warning);

    logger.info("hidden");
    logger.debug("hidden");
    logger.warning("shown");
    logger.error("also shown");

    EXPECT_EQ(output.str(), "WARN:test:shown\nERROR:test:also shown\n");
}

TEST(LoggerTest, LoweringThresholdEnablesDebug) {
    std::ostringstream output;
    auto logger = LoggerFactory<Level::Debug>::createLogger("test", std::make_tuple(
        StreamHandler<Level::Debug>(output, logging::defaultFormatter)
    ), Level::Warning);

    EXPECT_FALSE(logger.isEnabled(Level::Debug));
    logger.setThreshold(Level::Debug);
    EXPECT_TRUE(logger.isEnabled(Level::Debug));

    logger.debug("details");
    logger.trace("compiled out");

    EXPECT_EQ(output.str(), "DEBUG:test:details\n");
}

TEST(LoggerTest, HandlerLevelFiltersIndependently) {
    std::ostringstream verbose;
    std::ostringstream quiet;
    auto logger = LoggerFactory<Level::Debug>::createLogger("test", std::make_tuple(
        StreamHandler<Level::Debug>(verbose, logging::defaultFormatter),
        StreamHandler<Level::Error>(quiet, logging::defaultFormatter)
    ));

    logger.info("progress");
    logger.error("failure");

    EXPECT_EQ(verbose.str(), "INFO:test:progress\nERROR:test:failure\n");
    EXPECT_EQ(quiet.str(), "ERROR:test:failure\n");
}

TEST(LevelTest, ParsesLevelNames) {
    EXPECT_EQ(logging::fromLevelName("WARN"), Level::Warning);
    EXPECT_EQ(logging::fromLevelName("debug"), Level::Debug);
    EXPECT_EQ(logging::toLevelName(Level::Critical), "CRITICAL");
    EXPECT_THROW(logging::fromLevelName("loud"), std::invalid_argument);
}

TEST(CFormatterTest, FormatsHeaderAndFullMessage) {
    logging::Record record{
        .name = "taskfarm",
        .level = Level::Warning,
        .time = logging::TimePoint{},
        .processId = 42,
        .message = std::string(5000, 'x'),
    };

    std::string line = logging::formatters::cstr::formatRecord(record);

    EXPECT_EQ(line, "taskfarm  | <pid-42> [WARN] 1970-01-01T00:00:00Z - " + std::string(5000, 'x'));
}
