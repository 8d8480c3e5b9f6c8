#pragma once

#include "logging/Handler.h"
#include <iostream>

namespace logging::handlers {
    // Writes formatted records to a stream it does not own, stderr by default.
    template <Level HandlerLevel = Level::Warning>
    class StreamHandler : public BaseHandler<HandlerLevel> {
    public:
        StreamHandler(std::ostream& os = std::cerr, Formatter formatter = defaultFormatter) :
            BaseHandler<HandlerLevel>(std::move(formatter)), _stream(&os) {
        }

        StreamHandler(Formatter formatter) :
            BaseHandler<HandlerLevel>(std::move(formatter)), _stream(&std::cerr) {}

        StreamHandler(const StreamHandler&) = delete;
        StreamHandler(StreamHandler&& rhs) noexcept :
            BaseHandler<HandlerLevel>(std::move(rhs)), _stream(rhs._stream) {
        }

        template <Level emitLevel>
            requires (emitLevel <= HandlerLevel)
        void emit(const Record& record) {
            *_stream << this->format(record) << std::endl;
        }

        template <Level emitLevel>
            requires (emitLevel > HandlerLevel)
        void emit(const Record&) {
        }

    private:
        std::ostream* _stream;
    };
}
