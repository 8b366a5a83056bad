#include "audit/event_logger.hpp"
#include "audit/file_sink.hpp"
#include "audit/stderr_sink.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <format>
#include <fstream>
#include <functional>

namespace promptshield {

namespace {

constexpr std::streamoff kReverseBlockSize = 64 * 1024;

/**
 * @brief Visit the non-empty lines of a file from last to first.
 *
 * Reads fixed-size blocks backwards from the end, so the cost is bounded by
 * how far back the visitor goes rather than by the file size. Stops as soon
 * as `visit` returns false.
 */
void for_each_line_reversed(const std::string& path,
                            const std::function<bool(std::string_view)>& visit) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return;
    in.seekg(0, std::ios::end);
    std::streamoff pos = in.tellg();
    if (pos <= 0) return;

    std::string carry;      // partial line continuing into later blocks
    std::string block;
    while (pos > 0) {
        const std::streamoff len = std::min(pos, kReverseBlockSize);
        pos -= len;
        block.resize(static_cast<size_t>(len));
        in.seekg(pos);
        if (!in.read(block.data(), len)) return;

        block += carry;
        size_t end = block.size();
        for (size_t nl = block.rfind('\n', end == 0 ? 0 : end - 1);
             nl != std::string::npos;
             nl = nl == 0 ? std::string::npos : block.rfind('\n', nl - 1)) {
            const std::string_view line(block.data() + nl + 1, end - nl - 1);
            if (!line.empty() && !visit(line)) return;
            end = nl;
        }
        carry.assign(block, 0, end);
    }
    if (!carry.empty()) visit(carry);
}

FileSink::Config make_file_config(const EventLogger::Config& config) {
    FileSink::Config file_cfg;
    file_cfg.output_file = config.output_file;
    file_cfg.max_file_size_bytes = config.max_file_size_bytes;
    file_cfg.max_files = config.max_files;
    file_cfg.rotation_interval = config.rotation_interval;
    file_cfg.time_based_rotation = config.rotation_interval.count() > 0;
    file_cfg.size_based_rotation = config.max_file_size_bytes > 0;
    return file_cfg;
}

} // anonymous namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

EventLogger::EventLogger(const Config& config)
    : EventLogger(config, {}) {}

EventLogger::EventLogger(const Config& config,
                         std::vector<std::unique_ptr<IEventSink>> extra_sinks)
    : config_(config),
      ring_buffer_(config.buffer_capacity) {

    // Always a FileSink: query() reads it back
    sinks_.push_back(std::make_unique<FileSink>(make_file_config(config_)));

    if (config_.mirror_to_stderr) {
        sinks_.push_back(std::make_unique<StderrSink>());
    }
    for (auto& sink : extra_sinks) {
        sinks_.push_back(std::move(sink));
    }

    if (config_.integrity_enabled) {
        resume_chain();
    }
    start();
}

EventLogger::~EventLogger() {
    shutdown();
}

void EventLogger::start() {
    running_.store(true, std::memory_order_release);
    writer_thread_ = std::thread(&EventLogger::writer_thread_func, this);
}

void EventLogger::resume_chain() {
    for (int i = 0; i <= config_.max_files; ++i) {
        bool resumed = false;
        for_each_line_reversed(FileSink::rotated_path(config_.output_file, i),
                               [&](std::string_view line) {
            const auto event = parse_line(line);
            if (!event) return true;
            next_sequence_ = event->sequence_num + 1;
            previous_hash_ = event->record_hash;
            resumed = true;
            return false;
        });
        if (resumed) {
            utils::log::info(std::format("Event log: resuming at sequence {}", next_sequence_));
            return;
        }
    }
}

// ============================================================================
// Public Interface
// ============================================================================

bool EventLogger::log(ShieldEvent event) {
    if (!running_.load(std::memory_order_acquire)) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    if (!ring_buffer_.try_push(event)) {
        // Full: let the writer catch up once before giving up
        flush();
        if (!ring_buffer_.try_push(event)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn("Event log buffer full, event dropped");
            return false;
        }
    }
    total_logged_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void EventLogger::flush() {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    std::unique_lock<std::mutex> lock(flush_mutex_);
    const uint64_t generation = ++flush_requested_;
    flush_cv_.notify_one();
    flush_done_cv_.wait(lock, [&] {
        return flush_completed_ >= generation || !running_.load(std::memory_order_acquire);
    });
}

void EventLogger::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(flush_mutex_);
        flush_cv_.notify_one();
    }

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    flush_done_cv_.notify_all();
}

std::vector<ShieldEvent> EventLogger::query(size_t limit) {
    limit = std::min(limit, kMaxQueryLimit);
    std::vector<ShieldEvent> result;
    if (limit == 0) return result;

    flush();

    std::lock_guard<std::mutex> lock(io_mutex_);
    for (int i = 0; i <= config_.max_files && result.size() < limit; ++i) {
        for_each_line_reversed(FileSink::rotated_path(config_.output_file, i),
                               [&](std::string_view line) {
            if (auto event = parse_line(line)) {
                result.push_back(std::move(*event));
            }
            return result.size() < limit;
        });
    }
    return result;
}

EventLogger::Stats EventLogger::get_stats() const {
    return Stats{
        .total_logged = total_logged_.load(std::memory_order_relaxed),
        .total_written = total_written_.load(std::memory_order_relaxed),
        .dropped = dropped_.load(std::memory_order_relaxed),
        .flush_count = flush_count_.load(std::memory_order_relaxed),
        .sink_write_failures = sink_write_failures_.load(std::memory_order_relaxed),
        .active_sinks = sinks_.size()
    };
}

// ============================================================================
// Sink Helpers
// ============================================================================

void EventLogger::write_to_sinks(std::string_view line) {
    for (auto& sink : sinks_) {
        if (!sink->write(line)) {
            sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

void EventLogger::flush_sinks() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void EventLogger::shutdown_sinks() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
        sink->shutdown();
    }
}

// ============================================================================
// Background Writer Thread
// ============================================================================

void EventLogger::write_batch(std::vector<ShieldEvent>& batch) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    for (auto& event : batch) {
        event.sequence_num = next_sequence_++;
        if (config_.integrity_enabled) {
            event.previous_hash = previous_hash_;
            event.record_hash = compute_record_hash(event, previous_hash_);
            previous_hash_ = event.record_hash;
        }
        write_to_sinks(to_line(event));
    }
    total_written_.fetch_add(batch.size(), std::memory_order_relaxed);
    flush_count_.fetch_add(1, std::memory_order_relaxed);
}

void EventLogger::writer_thread_func() {
    std::vector<ShieldEvent> batch;
    batch.reserve(kMaxBatchSize);

    for (;;) {
        uint64_t target = 0;
        bool stopping = false;
        {
            std::unique_lock<std::mutex> lock(flush_mutex_);
            (void)flush_cv_.wait_for(lock, config_.flush_interval, [this] {
                return flush_requested_ > flush_completed_ ||
                       !running_.load(std::memory_order_acquire);
            });
            target = flush_requested_;
            stopping = !running_.load(std::memory_order_acquire);
        }

        // Everything published before `target` was requested is drained here
        bool wrote = false;
        for (;;) {
            batch.clear();
            if (ring_buffer_.drain(batch, kMaxBatchSize) == 0) break;
            write_batch(batch);
            wrote = true;
        }
        if (wrote || target > 0) {
            flush_sinks();
        }

        {
            std::lock_guard<std::mutex> lock(flush_mutex_);
            flush_completed_ = target;
        }
        flush_done_cv_.notify_all();

        if (stopping) break;
    }

    shutdown_sinks();
}

// ============================================================================
// Serialization
// ============================================================================

std::string EventLogger::to_json(const ShieldEvent& event) {
    std::string metadata = "{";
    bool first = true;
    for (const auto& [key, value] : event.metadata) {
        if (!first) metadata += ',';
        first = false;
        metadata += std::format("\"{}\":\"{}\"", utils::escape_json(key), utils::escape_json(value));
    }
    metadata += '}';

    std::string json = std::format(
        R"({{"sequence_num":{},"timestamp":"{}","event_type":"{}","preview":"{}","metadata":{})",
        event.sequence_num,
        utils::format_timestamp_utc(event.timestamp),
        event_type_to_string(event.event_type),
        utils::escape_json(event.preview),
        metadata);
    if (!event.record_hash.empty()) {
        json += std::format(R"(,"record_hash":"{}","previous_hash":"{}")",
                            event.record_hash, event.previous_hash);
    }
    json += '}';
    return json;
}

std::string EventLogger::to_line(const ShieldEvent& event) {
    std::string line(kLinePrefix);
    line += to_json(event);
    return line;
}

std::optional<ShieldEvent> EventLogger::parse_line(std::string_view line) {
    if (!line.starts_with(kLinePrefix)) return std::nullopt;
    line.remove_prefix(kLinePrefix.size());
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.remove_suffix(1);
    }

    const auto json = JsonValue::try_parse(line);
    if (!json || !json->is_object()) return std::nullopt;

    const auto timestamp = json->get_string("timestamp");
    const auto type = json->get_string("event_type");
    if (!timestamp || !type) return std::nullopt;

    const auto tp = utils::parse_timestamp_utc(*timestamp);
    const auto event_type = parse_event_type(*type);
    if (!tp || !event_type) return std::nullopt;

    ShieldEvent event;
    event.event_type = *event_type;
    event.timestamp = *tp;
    event.preview = json->get_string("preview").value_or("");
    if (const auto seq = json->get_number("sequence_num"); seq && *seq >= 0) {
        event.sequence_num = static_cast<uint64_t>(*seq);
    }
    (*json)["metadata"].for_each_member([&event](const std::string& key, const JsonValue& value) {
        if (value.is_string()) {
            event.metadata.emplace(key, value.get<std::string>());
        }
    });
    event.record_hash = json->get_string("record_hash").value_or("");
    event.previous_hash = json->get_string("previous_hash").value_or("");
    return event;
}

std::string EventLogger::compute_record_hash(const ShieldEvent& event,
                                             const std::string& prev_hash) {
    std::string input;
    input.reserve(256 + event.preview.size());
    input += std::format("{}", event.sequence_num);
    input += '|';
    input += utils::format_timestamp_utc(event.timestamp);
    input += '|';
    input += event_type_to_string(event.event_type);
    input += '|';
    input += event.preview;
    input += '|';
    for (const auto& [key, value] : event.metadata) {
        input += key;
        input += '=';
        input += value;
        input += ';';
    }
    input += '|';
    input += prev_hash;

    // SHA-256 via OpenSSL EVP
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, input.data(), input.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) return "";

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

} // namespace promptshield
