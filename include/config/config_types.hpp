#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace promptshield {

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 5000;
    size_t threads = 8;
    size_t max_prompt_length = 32000;       // code points
    size_t max_body_bytes = 1024 * 1024;
    std::string admin_token;                // empty = admin routes unauthenticated
    uint32_t shutdown_timeout_ms = 10000;
    uint32_t disconnect_poll_ms = 50;       // client-gone check for in-flight requests
};

struct LoggingConfig {
    std::string event_log = "logs/shield_events.log";
    size_t preview_length = 200;            // code points, ellipsis included
    bool integrity_enabled = true;
    size_t max_file_size_mb = 100;
    int max_files = 10;
    uint32_t rotation_interval_hours = 24;  // 0 disables time-based rotation
    bool mirror_to_stderr = false;
    size_t buffer_capacity = 4096;
    uint32_t flush_interval_ms = 50;
};

struct BackendConfig {
    bool enabled = true;
    std::string provider = "gemini";
    std::string endpoint = "https://generativelanguage.googleapis.com";
    std::string api_key;
    std::string model = "gemini-2.5-flash";
    uint32_t timeout_ms = 30000;
    uint32_t max_requests_per_minute = 60;
};

/// Capabilities of the local entity recognizer (not policy)
struct NerConfig {
    bool enabled = true;
    std::string gazetteer_file;             // optional extra names, one "LABEL<TAB>phrase" per line
};

struct ConfigWatcherConfig {
    bool enabled = true;
    int poll_interval_seconds = 5;
};

} // namespace promptshield
