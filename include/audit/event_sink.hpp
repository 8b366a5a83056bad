#pragma once

#include <string>
#include <string_view>

namespace promptshield {

/**
 * @brief Abstract interface for event log destinations
 *
 * Each sink receives serialized "EVENT_JSON {...}" lines from the
 * EventLogger's writer thread. Implementations are only called from the
 * writer thread, so no internal locking is needed.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    /// Write a single serialized event line. Returns true on success.
    [[nodiscard]] virtual bool write(std::string_view line) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:logs/shield_events.log")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace promptshield
