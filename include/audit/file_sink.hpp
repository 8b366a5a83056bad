#pragma once

#include "audit/event_sink.hpp"
#include <chrono>
#include <cstddef>
#include <fstream>
#include <string>

namespace promptshield {

/**
 * @brief File-based event sink with size and time-based rotation
 *
 * Appends one "EVENT_JSON {...}" line per event. Rotated files are named
 * with numeric suffixes: shield_events.log.1, shield_events.log.2, etc.,
 * .1 being the most recent. Rotated files past .<max_files> are deleted.
 *
 * Called exclusively from the EventLogger writer thread.
 */
class FileSink : public IEventSink {
public:
    struct Config {
        std::string output_file = "logs/shield_events.log";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;  // 100MB
        int max_files = 10;
        std::chrono::hours rotation_interval{24};
        bool time_based_rotation = true;
        bool size_based_rotation = true;
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    /// Path of the index-th rotated file (index 0 is the live file)
    [[nodiscard]] static std::string rotated_path(const std::string& base, int index);

    /// Number of rotations performed (for stats/testing)
    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }

    /// Current file size in bytes
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    void check_rotation();
    void rotate_file();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
    std::chrono::system_clock::time_point last_rotation_time_;
};

} // namespace promptshield
