#pragma once

#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace promptshield {

/**
 * @brief Per-detector settings, shared by the input and response sides.
 */
struct DetectorPolicy {
    DetectorKind kind = DetectorKind::PROMPT_INJECTION;
    bool enabled = false;
    StrategyVariant strategy = StrategyVariant::HEURISTIC;
    double threshold = 0.5;
    Decision action = Decision::BLOCK;              // BLOCK or FLAG when triggered
    std::vector<std::string> entity_types;          // NER labels to mask (pii_redaction)
    std::vector<std::string> markers;               // literal phrases, case/space-insensitive
    std::vector<std::string> patterns;              // ECMAScript regexes, case-insensitive
    std::map<std::string, double> model_weights;    // lexical model overrides (ml strategy)
    std::optional<double> model_bias;
};

/**
 * @brief One slot per DetectorKind, indexed by the enum value.
 */
struct DetectorSet {
    std::array<DetectorPolicy, 3> detectors{};

    DetectorSet() {
        for (const auto kind : kAllDetectorKinds) {
            detectors[static_cast<size_t>(kind)].kind = kind;
        }
    }

    [[nodiscard]] const DetectorPolicy& get(DetectorKind kind) const {
        return detectors[static_cast<size_t>(kind)];
    }

    [[nodiscard]] DetectorPolicy& get(DetectorKind kind) {
        return detectors[static_cast<size_t>(kind)];
    }
};

struct ResponseScreeningPolicy {
    bool enabled = false;
    DetectorSet detectors;
};

enum class FailureMode : uint8_t { OPEN, CLOSED };

inline const char* failure_mode_to_string(FailureMode m) {
    return m == FailureMode::OPEN ? "open" : "closed";
}

struct FailurePolicy {
    FailureMode detector_unavailable = FailureMode::OPEN;
    FailureMode backend_unavailable = FailureMode::OPEN;
    std::string fallback_message =
        "The language model is currently unavailable. Please try again later.";
};

/**
 * @brief Backend call retry policy.
 *
 * max_attempts counts every call including the first one.
 */
struct RetryPolicy {
    uint32_t max_attempts = 2;
    uint32_t initial_backoff_ms = 200;
    uint32_t max_backoff_ms = 2000;
    uint32_t timeout_ms = 30000;
};

/**
 * @brief Immutable, versioned policy snapshot
 *
 * Built by PolicyLoader, validated and versioned by PolicyStore. Never
 * mutated after installation; readers hold a shared_ptr<const Policy>.
 */
struct Policy {
    uint64_t version = 0;
    std::vector<DetectorKind> order = {
        DetectorKind::PROMPT_INJECTION,
        DetectorKind::HARMFUL_CONTENT
    };
    DetectorSet input;
    ResponseScreeningPolicy response_screening;
    FailurePolicy failure;
    RetryPolicy retry;
    std::string backend_model = "gemini-2.5-flash";
    bool parallel_detection = false;
};

using PolicySnapshot = std::shared_ptr<const Policy>;

} // namespace promptshield
