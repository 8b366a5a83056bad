#include "server/json_responses.hpp"
#include "audit/event_logger.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace promptshield::json_responses {

namespace {

std::string quoted(std::string_view s) {
    return std::format("\"{}\"", utils::escape_json(s));
}

std::string string_array(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += quoted(values[i]);
    }
    out += ']';
    return out;
}

std::string detector_set_to_json(const DetectorSet& set) {
    std::string out = "{";
    bool first = true;
    for (const auto kind : kAllDetectorKinds) {
        const auto& d = set.get(kind);
        if (!first) out += ',';
        first = false;
        out += std::format(
            R"("{}":{{"enabled":{},"strategy":"{}","threshold":{},"action":"{}","entity_types":{}}})",
            detector_kind_to_string(kind),
            utils::booltostr(d.enabled),
            strategy_to_string(d.strategy),
            d.threshold,
            decision_to_string(d.action),
            string_array(d.entity_types));
    }
    out += '}';
    return out;
}

} // anonymous namespace

std::string trace_to_json(const std::vector<TraceStep>& trace) {
    std::string out = "[";
    for (size_t i = 0; i < trace.size(); ++i) {
        const auto& step = trace[i];
        if (i > 0) out += ',';
        out += std::format(
            R"({{"step":"{}","strategy":"{}","decision":"{}","reason":{},"sequence_index":{}}})",
            utils::escape_json(step.step_name),
            strategy_to_string(step.strategy_used),
            step_decision_to_string(step.decision),
            step.reason ? quoted(*step.reason) : std::string("null"),
            step.sequence_index);
    }
    out += ']';
    return out;
}

std::string shield_response_to_json(const ShieldResponse& response) {
    switch (response.status) {
        case ShieldStatus::SUCCESS:
            return std::format(
                R"({{"status":"success","request_id":"{}","original_prompt":{},"processed_prompt":{},"llm_response":{},"trace":{}}})",
                response.request_id,
                quoted(response.original_prompt),
                quoted(response.processed_prompt),
                quoted(response.llm_response),
                trace_to_json(response.trace));

        case ShieldStatus::BLOCKED:
            return std::format(
                R"({{"status":"blocked","request_id":"{}","reason":{},"trace":{}}})",
                response.request_id,
                quoted(response.reason),
                trace_to_json(response.trace));

        case ShieldStatus::BLOCKED_RESPONSE:
            return std::format(
                R"({{"status":"blocked_response","request_id":"{}","reason":{},"llm_output_blocked":{},"trace":{}}})",
                response.request_id,
                quoted(response.reason),
                quoted(response.llm_output_blocked),
                trace_to_json(response.trace));

        case ShieldStatus::ERROR:
        default:
            return error_json(response.reason);
    }
}

int http_status_for(const ShieldResponse& response) {
    switch (response.status) {
        case ShieldStatus::SUCCESS:
            return 200;
        case ShieldStatus::BLOCKED:
        case ShieldStatus::BLOCKED_RESPONSE:
            return 403;
        case ShieldStatus::ERROR:
        default:
            return response.error_category == ErrorCategory::VALIDATION_ERROR ? 400 : 500;
    }
}

std::string policy_to_json(const Policy& policy) {
    std::string order = "[";
    for (size_t i = 0; i < policy.order.size(); ++i) {
        if (i > 0) order += ',';
        order += quoted(detector_kind_to_string(policy.order[i]));
    }
    order += ']';

    return std::format(
        R"({{"version":{},"order":{},"parallel":{},"detectors":{},)"
        R"("response_screening":{{"enabled":{},"detectors":{}}},)"
        R"("failure_policy":{{"detector_unavailable":"{}","backend_unavailable":"{}","fallback_message":{}}},)"
        R"("retry":{{"max_attempts":{},"initial_backoff_ms":{},"max_backoff_ms":{},"timeout_ms":{}}},)"
        R"("backend":{{"model":{}}}}})",
        policy.version,
        order,
        utils::booltostr(policy.parallel_detection),
        detector_set_to_json(policy.input),
        utils::booltostr(policy.response_screening.enabled),
        detector_set_to_json(policy.response_screening.detectors),
        failure_mode_to_string(policy.failure.detector_unavailable),
        failure_mode_to_string(policy.failure.backend_unavailable),
        quoted(policy.failure.fallback_message),
        policy.retry.max_attempts,
        policy.retry.initial_backoff_ms,
        policy.retry.max_backoff_ms,
        policy.retry.timeout_ms,
        quoted(policy.backend_model));
}

std::string events_to_json(const std::vector<ShieldEvent>& events) {
    std::string out = R"({"events":[)";
    for (size_t i = 0; i < events.size(); ++i) {
        if (i > 0) out += ',';
        out += EventLogger::to_json(events[i]);
    }
    out += "]}";
    return out;
}

std::string error_json(std::string_view reason) {
    return std::format(R"({{"status":"error","reason":{}}})", quoted(reason));
}

std::optional<size_t> parse_limit(std::string_view param) {
    if (param.empty()) return EventLogger::kDefaultQueryLimit;

    const auto value = utils::try_parse_int<int64_t>(param);
    if (!value || *value <= 0) return std::nullopt;
    return std::min(static_cast<size_t>(*value), EventLogger::kMaxQueryLimit);
}

std::optional<std::string> extract_prompt(std::string_view body) {
    const auto json = JsonValue::try_parse(body);
    if (!json || !json->is_object()) return std::nullopt;
    return json->get_string("prompt");
}

} // namespace promptshield::json_responses
