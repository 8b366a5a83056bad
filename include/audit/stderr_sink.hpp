#pragma once

#include "audit/event_sink.hpp"

#include <cstdio>

namespace promptshield {

/**
 * @brief Mirrors event lines to stderr (logging.mirror_to_stderr)
 */
class StderrSink : public IEventSink {
public:
    [[nodiscard]] bool write(std::string_view line) override {
        return std::fprintf(stderr, "%.*s\n", static_cast<int>(line.size()), line.data()) >= 0;
    }

    void flush() override { std::fflush(stderr); }
    void shutdown() override { std::fflush(stderr); }
    [[nodiscard]] std::string name() const override { return "stderr"; }
};

} // namespace promptshield
