#pragma once

#include <string>
#include <tuple>
#include <utility>
#include <chrono>
#include <unistd.h>
#include "logging/Level.h"
#include "logging/Handler.h"

namespace logging {
    // Records above maxLevel are compiled out; records above the runtime
    // threshold are dropped before reaching the handlers.
    template <Level maxLevel, Handler... HandlerTypes>
        requires(sizeof...(HandlerTypes) > 0)
    class Logger {
    public:
        static constexpr int32_t HandlerCount = sizeof...(HandlerTypes);
        static constexpr Level MaxLevel = maxLevel;

        Logger(const std::string& name, std::tuple<HandlerTypes...>&& attachedHandlers, Level threshold = maxLevel) :
            _name(name), _threshold(threshold),
            _attachedHandlers(std::forward<std::tuple<HandlerTypes...>>(attachedHandlers)) {
        }

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        Logger(Logger&& rhs) :
            _name(std::move(rhs._name)), _threshold(rhs._threshold),
            _attachedHandlers(std::move(rhs._attachedHandlers)) {
        }

        void setThreshold(Level threshold) {
            _threshold = threshold;
        }

        bool isEnabled(Level level) const {
            return level <= maxLevel && level <= _threshold;
        }

        template <Level level>
            requires (level > maxLevel)
        Logger& log(const std::string&) {
            return *this;
        }

        template <Level level>
            requires (level <= maxLevel)
        Logger& log(const std::string& message) {
            if (!isEnabled(level)) {
                return *this;
            }

            Record record{
                .name = _name,
                .level = level,
                .time = std::chrono::system_clock::now(),
                .processId = static_cast<int64_t>(::getpid()),
                .message = message,
            };

            handleLog<level, HandlerCount - 1>(record);

            return *this;
        }

        template <Level messageLevel, int32_t handlerIndex>
            requires (handlerIndex > 0)
        void handleLog(const Record& record) {
            handleLog<messageLevel, handlerIndex - 1>(record);

            auto& handler = std::get<handlerIndex>(_attachedHandlers);
            handler.template emit<messageLevel>(record);
        }

        template <Level messageLevel, int32_t handlerIndex>
            requires (handlerIndex == 0)
        void handleLog(const Record& record) {
            auto& handler = std::get<handlerIndex>(_attachedHandlers);
            handler.template emit<messageLevel>(record);
        }

        Logger& critical(const std::string& message) {
            return log<Level::Critical>(message);
        }

        Logger& error(const std::string& message) {
            return log<Level::Error>(message);
        }

        Logger& warning(const std::string& message) {
            return log<Level::Warning>(message);
        }

        Logger& info(const std::string& message) {
            return log<Level::Info>(message);
        }

        Logger& debug(const std::string& message) {
            return log<Level::Debug>(message);
        }

        Logger& trace(const std::string& message) {
            return log<Level::Trace>(message);
        }

    private:
        std::string _name;
        Level _threshold;
        std::tuple<HandlerTypes...> _attachedHandlers;
    };

    template <Level level = Level::Warning>
    class LoggerFactory {
    public:
        template <Handler... HandlerTypes>
        static Logger<level, HandlerTypes...> createLogger(
            const std::string& name,
            std::tuple<HandlerTypes...>&& attachedHandlers,
            Level threshold = level
        ) {
            return Logger<level, HandlerTypes...>(
                name, std::forward<std::tuple<HandlerTypes...>>(attachedHandlers), threshold
            );
        }
    };
}
