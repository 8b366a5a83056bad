#include "core/pipeline.hpp"
#include "audit/event_logger.hpp"
#include "core/llm_client.hpp"
#include "core/utils.hpp"
#include "detector/detection_orchestrator.hpp"
#include "detector/response_screening.hpp"
#include "policy/policy_store.hpp"
#include "redaction/redaction_engine.hpp"

#include <algorithm>
#include <condition_variable>
#include <format>
#include <mutex>

namespace promptshield {

namespace {

constexpr const char* kLlmStep = "llm_generation";
constexpr const char* kInputRedactionStep = "pii_redaction";
constexpr const char* kCancelledReason = "request_cancelled";
constexpr size_t kPreviewRedactionSlack = 512;

} // anonymous namespace

bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop) {
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mu);
    (void)cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

Pipeline::Pipeline(PipelineComponents components)
    : c_(std::move(components)) {}

// ============================================================================
// State Machine
// ============================================================================

bool Pipeline::is_valid_transition(PipelineState from, PipelineState to) {
    switch (from) {
        case PipelineState::RECEIVED:
            return to == PipelineState::INPUT_SCREENING;
        case PipelineState::INPUT_SCREENING:
            return to == PipelineState::BLOCKED_INPUT || to == PipelineState::REDACTING;
        case PipelineState::REDACTING:
            return to == PipelineState::BACKEND_INVOCATION;
        case PipelineState::BACKEND_INVOCATION:
            return to == PipelineState::OUTPUT_SCREENING || to == PipelineState::BLOCKED_OUTPUT;
        case PipelineState::OUTPUT_SCREENING:
            return to == PipelineState::BLOCKED_OUTPUT || to == PipelineState::COMPLETED;
        default:
            return false;   // terminal
    }
}

void Pipeline::check_transition(PipelineState from, PipelineState to) {
    if (!is_valid_transition(from, to)) {
        throw ShieldError(ErrorCategory::INTERNAL_ERROR,
            std::format("Illegal pipeline transition {} -> {}",
                        pipeline_state_to_string(from), pipeline_state_to_string(to)));
    }
}

void Pipeline::transition(RequestContext& ctx, PipelineState to) const {
    check_transition(ctx.state, to);
    ctx.state = to;
}

// ============================================================================
// Execute
// ============================================================================

ShieldResponse Pipeline::execute(const ShieldRequest& request, std::stop_token stop) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    RequestContext ctx;
    ctx.request_id = request.request_id.empty() ? utils::generate_uuid() : request.request_id;
    ctx.original_prompt = request.prompt;
    ctx.received_at = request.received_at;
    ctx.stop = std::move(stop);
    ctx.policy = c_.policy_store->current();

    if (!ctx.policy) {
        auto response = build_response(ctx);
        response.error_category = ErrorCategory::INTERNAL_ERROR;
        response.reason = "no active policy";
        return response;
    }

    if (auto error = validate_prompt(ctx.original_prompt); !error.empty()) {
        validation_errors_.fetch_add(1, std::memory_order_relaxed);
        auto response = build_response(ctx);
        response.error_category = ErrorCategory::VALIDATION_ERROR;
        response.reason = std::move(error);
        return response;
    }

    transition(ctx, PipelineState::INPUT_SCREENING);
    screen_input(ctx);
    if (ctx.state == PipelineState::BLOCKED_INPUT) {
        emit_terminal_event(ctx);
        return build_response(ctx);
    }

    transition(ctx, PipelineState::REDACTING);
    redact_input(ctx);

    transition(ctx, PipelineState::BACKEND_INVOCATION);
    invoke_backend(ctx);
    if (ctx.state == PipelineState::BLOCKED_OUTPUT) {
        emit_terminal_event(ctx);
        return build_response(ctx);
    }

    transition(ctx, PipelineState::OUTPUT_SCREENING);
    screen_output(ctx);
    if (ctx.state != PipelineState::BLOCKED_OUTPUT) {
        if (ctx.stop.stop_requested()) {
            // Cancelled after generation: the response is never released
            cancelled_.fetch_add(1, std::memory_order_relaxed);
            ctx.terminal_reason = kCancelledReason;
            ctx.blocking_step = kLlmStep;
            transition(ctx, PipelineState::BLOCKED_OUTPUT);
            blocked_output_.fetch_add(1, std::memory_order_relaxed);
        } else {
            transition(ctx, PipelineState::COMPLETED);
            completed_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    emit_terminal_event(ctx);
    return build_response(ctx);
}

std::string Pipeline::validate_prompt(const std::string& prompt) const {
    if (utils::trim(prompt).empty()) {
        return "prompt must be a non-empty string";
    }
    if (utils::count_code_points(prompt) > c_.max_prompt_length) {
        return std::format("prompt exceeds maximum length of {} characters", c_.max_prompt_length);
    }
    return {};
}

// ============================================================================
// Stages
// ============================================================================

void Pipeline::screen_input(RequestContext& ctx) {
    const auto& policy = *ctx.policy;

    DetectionOrchestrator::RunOptions options;
    options.order = policy.order;
    options.failure = policy.failure;
    options.parallel = policy.parallel_detection;

    const auto outcome = c_.detection->run(ctx.original_prompt, policy.input, options,
                                           ctx.trace, ctx.stop);
    if (outcome.blocked()) {
        ctx.terminal_reason = outcome.reason;
        ctx.blocking_step = outcome.blocking_step;
        transition(ctx, PipelineState::BLOCKED_INPUT);
        blocked_input_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Pipeline::redact_input(RequestContext& ctx) {
    const auto& pii = ctx.policy->input.get(DetectorKind::PII_REDACTION);
    if (!pii.enabled) {
        ctx.processed_prompt = ctx.original_prompt;
        return;
    }

    auto result = c_.redaction->redact(ctx.original_prompt, pii, ctx.stop);
    record_redaction_step(ctx.trace, kInputRedactionStep, pii, result);
    ctx.processed_prompt = result.redacted_text;

    if (result.changed()) {
        emit_event(ctx, ShieldEventType::REDACT, kInputRedactionStep, "redacted",
                   ctx.trace.last()->reason.value_or(""), ctx.processed_prompt);
    }
    ctx.input_redaction = std::move(result);
}

void Pipeline::invoke_backend(RequestContext& ctx) {
    std::string content;
    switch (call_backend_with_retry(ctx, content)) {
        case BackendOutcome::OK:
            ctx.trace.append(kLlmStep, StrategyVariant::BACKEND_ASSISTED, StepDecision::ALLOW, "ok");
            ctx.backend_response = std::move(content);
            ctx.terminal_reason = "ok";
            return;

        case BackendOutcome::CANCELLED:
            cancelled_.fetch_add(1, std::memory_order_relaxed);
            ctx.trace.append(kLlmStep, StrategyVariant::BACKEND_ASSISTED, StepDecision::BLOCK,
                             kCancelledReason);
            ctx.terminal_reason = kCancelledReason;
            ctx.blocking_step = kLlmStep;
            transition(ctx, PipelineState::BLOCKED_OUTPUT);
            blocked_output_.fetch_add(1, std::memory_order_relaxed);
            return;

        case BackendOutcome::UNAVAILABLE:
            break;
    }

    backend_failures_.fetch_add(1, std::memory_order_relaxed);
    const auto& failure = ctx.policy->failure;
    if (failure.backend_unavailable == FailureMode::CLOSED) {
        ctx.trace.append(kLlmStep, StrategyVariant::BACKEND_ASSISTED, StepDecision::BLOCK,
                         "backend_unavailable_fail_closed");
        ctx.terminal_reason = "backend_unavailable_fail_closed";
        ctx.blocking_step = kLlmStep;
        transition(ctx, PipelineState::BLOCKED_OUTPUT);
        blocked_output_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    ctx.trace.append(kLlmStep, StrategyVariant::BACKEND_ASSISTED, StepDecision::ALLOW,
                     "backend_unavailable_fail_open");
    ctx.terminal_reason = "backend_unavailable_fail_open";
    ctx.backend_response = failure.fallback_message;
    ctx.backend_fallback_used = true;
}

Pipeline::BackendOutcome Pipeline::call_backend_with_retry(RequestContext& ctx,
                                                           std::string& content) {
    if (!c_.backend) {
        utils::log::warn(std::format("Request {}: no backend configured", ctx.request_id));
        return BackendOutcome::UNAVAILABLE;
    }
    if (!c_.backend->is_available()) {
        utils::log::warn(std::format("Request {}: backend unavailable: {}",
                                     ctx.request_id, c_.backend->unavailable_reason()));
        return BackendOutcome::UNAVAILABLE;
    }

    const auto& retry = ctx.policy->retry;

    LlmRequest request;
    request.use_case = LlmUseCase::GENERATION;
    request.prompt = ctx.processed_prompt;
    request.model = ctx.policy->backend_model;
    request.timeout_ms = retry.timeout_ms;

    auto backoff = std::chrono::milliseconds(retry.initial_backoff_ms);
    const auto max_backoff = std::chrono::milliseconds(retry.max_backoff_ms);

    for (uint32_t attempt = 1; attempt <= retry.max_attempts; ++attempt) {
        if (ctx.stop.stop_requested()) return BackendOutcome::CANCELLED;

        auto response = c_.backend->complete(request, ctx.stop);
        if (response.success) {
            content = std::move(response.content);
            return BackendOutcome::OK;
        }
        if (response.cancelled || ctx.stop.stop_requested()) {
            return BackendOutcome::CANCELLED;
        }

        utils::log::warn(std::format("Request {}: backend attempt {}/{} failed: {}",
                                     ctx.request_id, attempt, retry.max_attempts, response.error));
        if (attempt == retry.max_attempts) break;

        if (!interruptible_sleep(backoff, ctx.stop)) {
            return BackendOutcome::CANCELLED;
        }
        backoff = std::min(backoff * 2, max_backoff);
    }
    return BackendOutcome::UNAVAILABLE;
}

void Pipeline::screen_output(RequestContext& ctx) {
    const auto& policy = *ctx.policy;
    if (!policy.response_screening.enabled || ctx.backend_fallback_used) {
        return;
    }

    auto outcome = c_.response_screening->run(*ctx.backend_response, policy, ctx.trace, ctx.stop);
    ctx.backend_response = outcome.text;

    if (outcome.blocked()) {
        ctx.terminal_reason = outcome.screening.reason;
        ctx.blocking_step = outcome.screening.blocking_step;
        transition(ctx, PipelineState::BLOCKED_OUTPUT);
        blocked_output_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    if (outcome.redaction && outcome.redaction->changed()) {
        emit_event(ctx, ShieldEventType::REDACT, "response_pii_redaction", "redacted_response",
                   ctx.trace.last()->reason.value_or(""), outcome.text);
    }
    ctx.output_redaction = std::move(outcome.redaction);
}

// ============================================================================
// Events + Response
// ============================================================================

void Pipeline::emit_event(const RequestContext& ctx, ShieldEventType type,
                          const std::string& detector, const std::string& status,
                          const std::string& reason, std::string_view preview_source) const {
    if (!c_.event_logger) return;

    ShieldEvent event;
    event.event_type = type;
    event.timestamp = utils::now();
    // Only the head of the text can reach the preview. The slack covers the
    // longest pattern match so an entity straddling the cut is still masked.
    const auto head = utils::truncate_code_points(preview_source,
                                                  c_.preview_length + kPreviewRedactionSlack);
    event.preview = utils::truncate_code_points(
        c_.redaction->redact_patterns_only(head).redacted_text, c_.preview_length);

    event.metadata["request_id"] = ctx.request_id;
    event.metadata["status"] = status;
    event.metadata["policy_version"] = std::to_string(ctx.policy->version);
    event.metadata["state"] = pipeline_state_to_string(ctx.state);
    if (!detector.empty()) event.metadata["detector"] = detector;
    if (!reason.empty()) event.metadata["reason"] = reason;

    if (!c_.event_logger->log(std::move(event))) {
        events_dropped_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Event '{}' for request {} was not accepted by the event logger",
                                      event_type_to_string(type), ctx.request_id));
    }
}

void Pipeline::emit_terminal_event(const RequestContext& ctx) const {
    switch (ctx.state) {
        case PipelineState::BLOCKED_INPUT:
            emit_event(ctx, ShieldEventType::BLOCK, ctx.blocking_step, "blocked",
                       ctx.terminal_reason, ctx.original_prompt);
            break;
        case PipelineState::BLOCKED_OUTPUT:
            emit_event(ctx, ShieldEventType::BLOCK, ctx.blocking_step, "blocked_response",
                       ctx.terminal_reason, ctx.processed_prompt);
            break;
        case PipelineState::COMPLETED:
            emit_event(ctx, ShieldEventType::SUCCESS, "", "success",
                       ctx.terminal_reason, ctx.processed_prompt);
            break;
        default:
            throw ShieldError(ErrorCategory::INTERNAL_ERROR,
                std::format("Terminal event requested in state {}",
                            pipeline_state_to_string(ctx.state)));
    }
}

ShieldResponse Pipeline::build_response(const RequestContext& ctx) const {
    ShieldResponse response;
    response.request_id = ctx.request_id;
    response.original_prompt = ctx.original_prompt;
    response.processed_prompt = ctx.processed_prompt;
    response.trace = ctx.trace.steps();
    response.final_state = ctx.state;
    response.policy_version = ctx.policy ? ctx.policy->version : 0;
    response.reason = ctx.terminal_reason;

    switch (ctx.state) {
        case PipelineState::BLOCKED_INPUT:
            response.status = ShieldStatus::BLOCKED;
            break;
        case PipelineState::BLOCKED_OUTPUT:
            response.status = ShieldStatus::BLOCKED_RESPONSE;
            response.llm_output_blocked = kWithheldResponse;
            break;
        case PipelineState::COMPLETED:
            response.status = ShieldStatus::SUCCESS;
            response.llm_response = ctx.backend_response.value_or("");
            break;
        default:
            response.status = ShieldStatus::ERROR;
            break;
    }
    return response;
}

} // namespace promptshield
