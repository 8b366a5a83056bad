#pragma once

#include "core/pipeline.hpp"
#include "policy/policy.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptshield {

/**
 * @brief Response bodies for the shield HTTP API
 *
 * Kept free of httplib so the wire format is testable on its own.
 */
namespace json_responses {

/// [{"step","strategy","decision","reason","sequence_index"}, ...]
[[nodiscard]] std::string trace_to_json(const std::vector<TraceStep>& trace);

/// Body for POST /shield_prompt, shaped by response.status
[[nodiscard]] std::string shield_response_to_json(const ShieldResponse& response);

/// 200 success, 403 blocked / blocked_response, 400 validation, 500 otherwise
[[nodiscard]] int http_status_for(const ShieldResponse& response);

/// Body for GET /api/policy
[[nodiscard]] std::string policy_to_json(const Policy& policy);

/// Body for GET /api/logs: {"events":[...]}
[[nodiscard]] std::string events_to_json(const std::vector<ShieldEvent>& events);

/// {"status":"error","reason":"..."}
[[nodiscard]] std::string error_json(std::string_view reason);

/**
 * @brief Parse the ?limit= query parameter
 *
 * Empty means the default (200). Values above the hard maximum (5000) are
 * clamped. Zero, negative or non-numeric values are invalid (nullopt).
 */
[[nodiscard]] std::optional<size_t> parse_limit(std::string_view param);

/// "prompt" from a request body; nullopt for malformed JSON or a non-string prompt
[[nodiscard]] std::optional<std::string> extract_prompt(std::string_view body);

} // namespace json_responses

} // namespace promptshield
