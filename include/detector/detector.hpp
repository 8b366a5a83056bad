#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "policy/policy.hpp"

#include <stop_token>
#include <string>
#include <string_view>

namespace promptshield {

/**
 * @brief Capability report returned before a detector is invoked
 */
struct Availability {
    bool available = true;
    std::string reason;     // set when unavailable, e.g. "missing_credential"

    [[nodiscard]] static Availability yes() { return {}; }
    [[nodiscard]] static Availability no(std::string why) { return {false, std::move(why)}; }
};

/**
 * @brief Input to IDetector::detect
 *
 * `text` and `settings` must outlive the call.
 */
struct DetectionRequest {
    std::string_view text;
    const DetectorPolicy& settings;
    std::stop_token stop;
};

/**
 * @brief Detection strategy interface
 *
 * Implementations are stateless with respect to requests and safe to call
 * concurrently. The only side effects allowed are backend calls.
 */
class IDetector {
public:
    virtual ~IDetector() = default;

    [[nodiscard]] virtual DetectorKind kind() const = 0;
    [[nodiscard]] virtual StrategyVariant variant() const = 0;

    [[nodiscard]] virtual Availability availability() const = 0;

    /**
     * @brief Inspect text under the given settings
     * @return DetectionResult, or DETECTOR_UNAVAILABLE / EXTERNAL_SERVICE_ERROR
     */
    [[nodiscard]] virtual Result<DetectionResult> detect(const DetectionRequest& request) const = 0;
};

/// A score triggers when it reaches the threshold (inclusive)
[[nodiscard]] inline bool score_triggers(double score, double threshold) {
    return score >= threshold;
}

/**
 * @brief Map a score onto the configured action
 *
 * Returns the policy's action with `reason` when triggered, otherwise Allow.
 * The score is kept on the result either way.
 */
[[nodiscard]] inline DetectionResult apply_threshold(double score, const DetectorPolicy& settings,
                                                     std::string reason) {
    DetectionResult result;
    result.score = score;
    if (score_triggers(score, settings.threshold)) {
        result.decision = settings.action;
        result.reason = std::move(reason);
    }
    return result;
}

/// Reason string emitted by each screening detector when triggered
[[nodiscard]] inline std::string detection_reason(DetectorKind kind) {
    return std::string(detector_kind_to_string(kind)) + "_detected";
}

} // namespace promptshield
