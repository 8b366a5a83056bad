#pragma once

#include "core/error.hpp"
#include "core/pipeline_builder.hpp"
#include "core/request_context.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace promptshield {

struct ShieldRequest {
    std::string request_id;         // generated when empty
    std::string prompt;
    std::chrono::system_clock::time_point received_at;

    ShieldRequest() : received_at(std::chrono::system_clock::now()) {}
};

enum class ShieldStatus : uint8_t {
    SUCCESS,
    BLOCKED,            // input screening blocked
    BLOCKED_RESPONSE,   // backend output (or the backend itself) blocked
    ERROR               // validation or internal failure
};

inline const char* shield_status_to_string(ShieldStatus s) {
    switch (s) {
        case ShieldStatus::SUCCESS:          return "success";
        case ShieldStatus::BLOCKED:          return "blocked";
        case ShieldStatus::BLOCKED_RESPONSE: return "blocked_response";
        case ShieldStatus::ERROR:            return "error";
        default: return "unknown";
    }
}

struct ShieldResponse {
    std::string request_id;
    ShieldStatus status = ShieldStatus::ERROR;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string reason;

    std::string original_prompt;
    std::string processed_prompt;
    std::string llm_response;           // SUCCESS only
    std::string llm_output_blocked;     // BLOCKED_RESPONSE only; never the withheld text

    std::vector<TraceStep> trace;
    PipelineState final_state = PipelineState::RECEIVED;
    uint64_t policy_version = 0;
};

/**
 * @brief Shield pipeline - explicit state machine over one request
 *
 *   RECEIVED -> INPUT_SCREENING -> BLOCKED_INPUT
 *                               -> REDACTING -> BACKEND_INVOCATION -> BLOCKED_OUTPUT
 *                                                                  -> OUTPUT_SCREENING -> BLOCKED_OUTPUT
 *                                                                                      -> COMPLETED
 *
 * The policy snapshot is pinned when the request enters and used for the
 * whole request, even if a reload lands meanwhile. Every terminal state
 * logs exactly one BLOCK or SUCCESS event; redaction in between logs a
 * REDACT event. Validation failures never reach INPUT_SCREENING and are
 * not logged as events.
 */
class Pipeline {
public:
    explicit Pipeline(PipelineComponents components);

    /**
     * @brief Run one request to a terminal state
     * @param stop Cancels backend calls and retry sleeps; the request then
     *             ends in BLOCKED_OUTPUT with reason "request_cancelled".
     * @throws ShieldError (INTERNAL_ERROR) on an illegal state transition
     */
    ShieldResponse execute(const ShieldRequest& request, std::stop_token stop = {});

    [[nodiscard]] static bool is_valid_transition(PipelineState from, PipelineState to);

    /// Throws ShieldError unless from -> to is in the transition table
    static void check_transition(PipelineState from, PipelineState to);

    [[nodiscard]] static bool is_terminal(PipelineState state) {
        return state == PipelineState::BLOCKED_INPUT ||
               state == PipelineState::BLOCKED_OUTPUT ||
               state == PipelineState::COMPLETED;
    }

    [[nodiscard]] std::shared_ptr<PolicyStore> get_policy_store() const { return c_.policy_store; }
    [[nodiscard]] std::shared_ptr<EventLogger> get_event_logger() const { return c_.event_logger; }

    struct Stats {
        uint64_t total_requests;
        uint64_t validation_errors;
        uint64_t blocked_input;
        uint64_t blocked_output;
        uint64_t completed;
        uint64_t backend_failures;
        uint64_t cancelled;
        uint64_t events_dropped;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .validation_errors = validation_errors_.load(std::memory_order_relaxed),
            .blocked_input = blocked_input_.load(std::memory_order_relaxed),
            .blocked_output = blocked_output_.load(std::memory_order_relaxed),
            .completed = completed_.load(std::memory_order_relaxed),
            .backend_failures = backend_failures_.load(std::memory_order_relaxed),
            .cancelled = cancelled_.load(std::memory_order_relaxed),
            .events_dropped = events_dropped_.load(std::memory_order_relaxed),
        };
    }

private:
    enum class BackendOutcome : uint8_t { OK, UNAVAILABLE, CANCELLED };

    /// Empty on success, else the caller-visible validation message
    [[nodiscard]] std::string validate_prompt(const std::string& prompt) const;

    void transition(RequestContext& ctx, PipelineState to) const;

    void screen_input(RequestContext& ctx);
    void redact_input(RequestContext& ctx);
    void invoke_backend(RequestContext& ctx);
    void screen_output(RequestContext& ctx);

    /// One call per attempt, bounded exponential backoff in between
    BackendOutcome call_backend_with_retry(RequestContext& ctx, std::string& content);

    void emit_event(const RequestContext& ctx, ShieldEventType type, const std::string& detector,
                    const std::string& status, const std::string& reason,
                    std::string_view preview_source) const;

    void emit_terminal_event(const RequestContext& ctx) const;

    [[nodiscard]] ShieldResponse build_response(const RequestContext& ctx) const;

    PipelineComponents c_;

    mutable std::atomic<uint64_t> total_requests_{0};
    mutable std::atomic<uint64_t> validation_errors_{0};
    mutable std::atomic<uint64_t> blocked_input_{0};
    mutable std::atomic<uint64_t> blocked_output_{0};
    mutable std::atomic<uint64_t> completed_{0};
    mutable std::atomic<uint64_t> backend_failures_{0};
    mutable std::atomic<uint64_t> cancelled_{0};
    mutable std::atomic<uint64_t> events_dropped_{0};
};

/// Sleep for `duration` unless `stop` fires first; false when cancelled
bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop);

} // namespace promptshield
