#pragma once

#include "audit/event_sink.hpp"
#include "audit/ring_buffer.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace promptshield {

/**
 * @brief Durable append-only log of ShieldEvents
 *
 * Decouples event production from I/O using a lock-free MPSC ring buffer
 * and a dedicated background writer thread.
 *
 *   [worker 1] --log()--> [Ring Buffer] --drain()--> [Writer Thread] --> [FileSink]
 *   [worker N] --log()-->                                            --> [StderrSink]
 *
 * The writer assigns sequence numbers and, with integrity enabled, links
 * every record to its predecessor with a SHA-256 hash chain. On startup
 * the chain resumes from the last valid record in the live file.
 *
 * Persisted format is one "EVENT_JSON {...}" line per event. query()
 * reads the live file and its rotated predecessors back, most recent
 * first, skipping lines that do not parse.
 */
class EventLogger {
public:
    static constexpr std::string_view kLinePrefix = "EVENT_JSON ";
    static constexpr size_t kDefaultQueryLimit = 200;
    static constexpr size_t kMaxQueryLimit = 5000;

    struct Config {
        std::string output_file = "logs/shield_events.log";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;
        int max_files = 10;
        std::chrono::hours rotation_interval{24};   // zero disables
        bool integrity_enabled = true;
        bool mirror_to_stderr = false;
        size_t buffer_capacity = 4096;
        std::chrono::milliseconds flush_interval{50};
    };

    /**
     * @brief Creates the FileSink (plus StderrSink when mirroring) and
     *        starts the writer thread.
     * @throws std::runtime_error if the event log cannot be opened
     */
    explicit EventLogger(const Config& config);

    /// Extra sinks receive every line after the file sink
    EventLogger(const Config& config, std::vector<std::unique_ptr<IEventSink>> extra_sinks);

    ~EventLogger();

    EventLogger(const EventLogger&) = delete;
    EventLogger& operator=(const EventLogger&) = delete;
    EventLogger(EventLogger&&) = delete;
    EventLogger& operator=(EventLogger&&) = delete;

    /**
     * @brief Enqueue an event (non-blocking unless the buffer is full)
     *
     * A full buffer triggers one flush and a single retry; the event is
     * dropped and counted only if that also fails.
     * @return false if the event was dropped
     */
    bool log(ShieldEvent event);

    /// Block until everything logged before this call reached the sinks
    void flush();

    /// Drain, flush and close all sinks. Later log() calls are dropped.
    void shutdown();

    /**
     * @brief Most recent events first
     *
     * Flushes first, so events logged by this thread are visible.
     * limit is clamped to kMaxQueryLimit.
     */
    [[nodiscard]] std::vector<ShieldEvent> query(size_t limit = kDefaultQueryLimit);

    /// One event as a JSON object (also the body of a persisted line)
    [[nodiscard]] static std::string to_json(const ShieldEvent& event);

    /// "EVENT_JSON {...}" without trailing newline
    [[nodiscard]] static std::string to_line(const ShieldEvent& event);

    /// nullopt for lines without the prefix or with missing/invalid fields
    [[nodiscard]] static std::optional<ShieldEvent> parse_line(std::string_view line);

    /// SHA-256 over sequence_num|timestamp|event_type|preview|metadata|previous_hash
    [[nodiscard]] static std::string compute_record_hash(const ShieldEvent& event,
                                                         const std::string& prev_hash);

    struct Stats {
        uint64_t total_logged;          ///< Events accepted into the buffer
        uint64_t total_written;         ///< Events written to sinks
        uint64_t dropped;               ///< Events dropped (buffer full or stopped)
        uint64_t flush_count;           ///< Batches flushed to sinks
        uint64_t sink_write_failures;   ///< Failed sink write attempts
        size_t active_sinks;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    void start();
    void resume_chain();
    void writer_thread_func();
    void write_batch(std::vector<ShieldEvent>& batch);
    void write_to_sinks(std::string_view line);
    void flush_sinks();
    void shutdown_sinks();

    static constexpr size_t kMaxBatchSize = 512;

    Config config_;

    // -- Sinks (writer thread, or under io_mutex_ for query) --
    std::vector<std::unique_ptr<IEventSink>> sinks_;
    std::mutex io_mutex_;

    MpscRingBuffer<ShieldEvent> ring_buffer_;

    std::thread writer_thread_;
    std::atomic<bool> running_{false};

    // -- Flush handshake: requested/completed generations --
    std::mutex flush_mutex_;
    std::condition_variable flush_cv_;
    std::condition_variable flush_done_cv_;
    uint64_t flush_requested_ = 0;
    uint64_t flush_completed_ = 0;

    // -- Stats --
    std::atomic<uint64_t> total_logged_{0};
    std::atomic<uint64_t> total_written_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> flush_count_{0};
    std::atomic<uint64_t> sink_write_failures_{0};

    // -- Hash chain (writer thread only) --
    uint64_t next_sequence_ = 1;
    std::string previous_hash_;
};

} // namespace promptshield
