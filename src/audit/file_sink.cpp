#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace promptshield {

FileSink::FileSink(const Config& config)
    : config_(config),
      last_rotation_time_(std::chrono::system_clock::now()) {
    std::error_code ec;
    const auto parent = std::filesystem::path(config_.output_file).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open event log: " + config_.output_file);
    }

    // Resume size accounting for size-based rotation
    const auto file_size = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::write(std::string_view line) {
    check_rotation();
    file_stream_.write(line.data(), static_cast<std::streamsize>(line.size()));
    file_stream_.put('\n');
    current_file_size_ += line.size() + 1;
    return file_stream_.good();
}

void FileSink::flush() {
    file_stream_.flush();
}

void FileSink::shutdown() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

std::string FileSink::rotated_path(const std::string& base, int index) {
    return index == 0 ? base : std::format("{}.{}", base, index);
}

void FileSink::check_rotation() {
    bool need_rotate = false;

    if (config_.size_based_rotation && current_file_size_ > 0 &&
        current_file_size_ >= config_.max_file_size_bytes) {
        need_rotate = true;
    }

    if (config_.time_based_rotation && current_file_size_ > 0) {
        const auto now = std::chrono::system_clock::now();
        if (now - last_rotation_time_ >= config_.rotation_interval) {
            need_rotate = true;
        }
    }

    if (need_rotate) {
        rotate_file();
    }
}

void FileSink::rotate_file() {
    file_stream_.flush();
    file_stream_.close();

    std::error_code ec;

    // Oldest file falls off the end
    std::filesystem::remove(rotated_path(config_.output_file, config_.max_files), ec);

    // Shift existing rotated files: .N -> .N+1 (missing files are fine)
    for (int i = config_.max_files - 1; i >= 1; --i) {
        std::filesystem::rename(rotated_path(config_.output_file, i),
                                rotated_path(config_.output_file, i + 1), ec);
    }

    std::filesystem::rename(config_.output_file, rotated_path(config_.output_file, 1), ec);
    if (ec) {
        utils::log::warn(std::format("Event log rotation failed: {}", ec.message()));
    }

    file_stream_.open(config_.output_file, std::ios::app);
    current_file_size_ = 0;
    last_rotation_time_ = std::chrono::system_clock::now();
    ++rotation_count_;
}

} // namespace promptshield
