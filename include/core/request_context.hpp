#pragma once

#include "core/types.hpp"
#include "policy/policy.hpp"
#include "trace/trace_recorder.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

namespace promptshield {

/**
 * @brief Request context - carries state through the shield pipeline
 *
 * Each stage writes only its own slot and appends to the trace. Lives for
 * one request and is never persisted.
 */
struct RequestContext {
    // Input
    std::string request_id;
    std::string original_prompt;
    std::chrono::system_clock::time_point received_at;

    // Policy snapshot pinned for the whole request
    PolicySnapshot policy;

    // Stage outputs
    std::string processed_prompt;
    std::optional<RedactionResult> input_redaction;
    std::optional<std::string> backend_response;
    bool backend_fallback_used = false;
    std::optional<RedactionResult> output_redaction;

    // Decision record
    TraceRecorder trace;
    PipelineState state = PipelineState::RECEIVED;
    std::string terminal_reason;
    std::string blocking_step;

    // Cancellation
    std::stop_token stop;
};

} // namespace promptshield
