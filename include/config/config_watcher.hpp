#pragma once

#include "config/config_loader.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace promptshield {

/**
 * @brief Background config file watcher with hot-reload support
 *
 * Monitors shield.toml by modification time. When it changes, the file is
 * re-parsed via ConfigLoader and, if valid, handed to the reload callback.
 * An invalid file is logged and the previous policy stays active.
 *
 * The callback runs on the watcher thread. PolicyStore installs the new
 * snapshot with an atomic swap, so request threads are never blocked.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<void(const ShieldConfig& new_config)>;

    explicit ConfigWatcher(
        std::string config_path,
        std::chrono::milliseconds poll_interval = std::chrono::seconds{5});

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void set_callback(ReloadCallback callback);

    void start();

    void stop();

    /**
     * @brief Run one poll cycle synchronously
     * @return true if the file changed and the reload callback ran
     */
    bool check_now();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    [[nodiscard]] uint64_t reload_count() const { return reloads_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t failure_count() const { return failures_.load(std::memory_order_relaxed); }

private:
    void watch_loop(std::stop_token stop);

    std::string config_path_;
    std::chrono::milliseconds poll_interval_;
    ReloadCallback callback_;

    std::filesystem::file_time_type last_mtime_{};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> reloads_{0};
    std::atomic<uint64_t> failures_{0};
    std::jthread watch_thread_;
};

} // namespace promptshield
