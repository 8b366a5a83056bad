#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>

namespace promptshield {

// ============================================================================
// Basic Enums
// ============================================================================

enum class DetectorKind : uint8_t {
    HARMFUL_CONTENT,
    PROMPT_INJECTION,
    PII_REDACTION
};

/**
 * @brief Closed set of detection strategies.
 *
 * Config strings: "heuristic", "ml", "llm", "hybrid".
 */
enum class StrategyVariant : uint8_t {
    HEURISTIC,
    MODEL_BASED,
    BACKEND_ASSISTED,
    HYBRID
};

enum class Decision : uint8_t {
    ALLOW,
    BLOCK,
    FLAG
};

enum class StepDecision : uint8_t {
    ALLOW,
    BLOCK,
    FLAG,
    REDACTED
};

enum class ShieldEventType : uint8_t {
    BLOCK,
    REDACT,
    SUCCESS
};

enum class PipelineState : uint8_t {
    RECEIVED,
    INPUT_SCREENING,
    BLOCKED_INPUT,
    REDACTING,
    BACKEND_INVOCATION,
    OUTPUT_SCREENING,
    BLOCKED_OUTPUT,
    COMPLETED
};

inline constexpr DetectorKind kAllDetectorKinds[] = {
    DetectorKind::HARMFUL_CONTENT,
    DetectorKind::PROMPT_INJECTION,
    DetectorKind::PII_REDACTION
};

// ============================================================================
// Detection Results
// ============================================================================

struct MatchedSpan {
    size_t start = 0;   // byte offset, inclusive
    size_t end = 0;     // byte offset, exclusive
    std::string label;

    bool operator==(const MatchedSpan&) const = default;
};

struct DetectionResult {
    Decision decision = Decision::ALLOW;
    std::optional<double> score;
    std::optional<std::string> reason;
    std::vector<MatchedSpan> matched_spans;

    [[nodiscard]] static DetectionResult allow() { return {}; }

    [[nodiscard]] static DetectionResult with(Decision d, std::string why,
                                              std::optional<double> s = std::nullopt) {
        DetectionResult r;
        r.decision = d;
        r.reason = std::move(why);
        r.score = s;
        return r;
    }
};

struct RedactedEntity {
    MatchedSpan original_span;  // offsets into the text before this redaction
    std::string label;
};

struct RedactionResult {
    std::string redacted_text;
    std::vector<RedactedEntity> entities_removed;
    std::vector<std::string> degraded_passes;

    [[nodiscard]] bool changed() const { return !entities_removed.empty(); }
};

// ============================================================================
// Trace + Events
// ============================================================================

struct TraceStep {
    std::string step_name;
    StrategyVariant strategy_used = StrategyVariant::HEURISTIC;
    StepDecision decision = StepDecision::ALLOW;
    std::optional<std::string> reason;
    uint32_t sequence_index = 0;
};

struct ShieldEvent {
    ShieldEventType event_type = ShieldEventType::SUCCESS;
    std::chrono::system_clock::time_point timestamp;
    std::string preview;
    std::map<std::string, std::string> metadata;

    // Assigned by the event log writer
    uint64_t sequence_num = 0;
    std::string record_hash;
    std::string previous_hash;
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* detector_kind_to_string(DetectorKind kind) {
    switch (kind) {
        case DetectorKind::HARMFUL_CONTENT:  return "harmful_content";
        case DetectorKind::PROMPT_INJECTION: return "prompt_injection";
        case DetectorKind::PII_REDACTION:    return "pii_redaction";
        default: return "unknown";
    }
}

inline std::optional<DetectorKind> parse_detector_kind(std::string_view s) {
    if (s == "harmful_content") return DetectorKind::HARMFUL_CONTENT;
    if (s == "prompt_injection") return DetectorKind::PROMPT_INJECTION;
    if (s == "pii_redaction") return DetectorKind::PII_REDACTION;
    return std::nullopt;
}

inline const char* strategy_to_string(StrategyVariant v) {
    switch (v) {
        case StrategyVariant::HEURISTIC:        return "heuristic";
        case StrategyVariant::MODEL_BASED:      return "ml";
        case StrategyVariant::BACKEND_ASSISTED: return "llm";
        case StrategyVariant::HYBRID:           return "hybrid";
        default: return "unknown";
    }
}

inline std::optional<StrategyVariant> parse_strategy(std::string_view s) {
    if (s == "heuristic") return StrategyVariant::HEURISTIC;
    if (s == "ml") return StrategyVariant::MODEL_BASED;
    if (s == "llm") return StrategyVariant::BACKEND_ASSISTED;
    if (s == "hybrid") return StrategyVariant::HYBRID;
    return std::nullopt;
}

inline const char* decision_to_string(Decision d) {
    switch (d) {
        case Decision::ALLOW: return "allow";
        case Decision::BLOCK: return "block";
        case Decision::FLAG:  return "flag";
        default: return "unknown";
    }
}

inline const char* step_decision_to_string(StepDecision d) {
    switch (d) {
        case StepDecision::ALLOW:    return "allow";
        case StepDecision::BLOCK:    return "block";
        case StepDecision::FLAG:     return "flag";
        case StepDecision::REDACTED: return "redacted";
        default: return "unknown";
    }
}

inline StepDecision to_step_decision(Decision d) {
    switch (d) {
        case Decision::BLOCK: return StepDecision::BLOCK;
        case Decision::FLAG:  return StepDecision::FLAG;
        default:              return StepDecision::ALLOW;
    }
}

inline const char* event_type_to_string(ShieldEventType t) {
    switch (t) {
        case ShieldEventType::BLOCK:   return "BLOCK";
        case ShieldEventType::REDACT:  return "REDACT";
        case ShieldEventType::SUCCESS: return "SUCCESS";
        default: return "UNKNOWN";
    }
}

inline std::optional<ShieldEventType> parse_event_type(std::string_view s) {
    if (s == "BLOCK") return ShieldEventType::BLOCK;
    if (s == "REDACT") return ShieldEventType::REDACT;
    if (s == "SUCCESS") return ShieldEventType::SUCCESS;
    return std::nullopt;
}

inline const char* pipeline_state_to_string(PipelineState s) {
    switch (s) {
        case PipelineState::RECEIVED:           return "RECEIVED";
        case PipelineState::INPUT_SCREENING:    return "INPUT_SCREENING";
        case PipelineState::BLOCKED_INPUT:      return "BLOCKED_INPUT";
        case PipelineState::REDACTING:          return "REDACTING";
        case PipelineState::BACKEND_INVOCATION: return "BACKEND_INVOCATION";
        case PipelineState::OUTPUT_SCREENING:   return "OUTPUT_SCREENING";
        case PipelineState::BLOCKED_OUTPUT:     return "BLOCKED_OUTPUT";
        case PipelineState::COMPLETED:          return "COMPLETED";
        default: return "UNKNOWN";
    }
}

} // namespace promptshield
