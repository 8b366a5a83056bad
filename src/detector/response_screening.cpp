#include "detector/response_screening.hpp"

#include <format>

namespace promptshield {

void record_redaction_step(TraceRecorder& trace, const std::string& step_name,
                           const DetectorPolicy& settings, const RedactionResult& result) {
    std::string reason = result.changed()
        ? std::format("redacted_{}_entities", result.entities_removed.size())
        : std::string("no_pii_found");
    if (!result.degraded_passes.empty()) {
        reason += ";degraded:";
        for (size_t i = 0; i < result.degraded_passes.size(); ++i) {
            if (i > 0) reason += ",";
            reason += result.degraded_passes[i];
        }
    }
    trace.append(step_name, settings.strategy,
                 result.changed() ? StepDecision::REDACTED : StepDecision::ALLOW,
                 std::move(reason));
}

ResponseScreeningOrchestrator::ResponseScreeningOrchestrator(
    std::shared_ptr<const DetectionOrchestrator> detection,
    std::shared_ptr<const RedactionEngine> redaction)
    : detection_(std::move(detection)), redaction_(std::move(redaction)) {}

ResponseScreeningOutcome ResponseScreeningOrchestrator::run(const std::string& output,
                                                            const Policy& policy,
                                                            TraceRecorder& trace,
                                                            std::stop_token stop) const {
    ResponseScreeningOutcome outcome;
    const auto& detectors = policy.response_screening.detectors;

    DetectionOrchestrator::RunOptions options;
    options.order = policy.order;
    options.failure = policy.failure;
    options.parallel = policy.parallel_detection;
    options.step_prefix = "response_";

    outcome.screening = detection_->run(output, detectors, options, trace, stop);
    if (outcome.screening.blocked()) {
        outcome.text = kWithheldResponse;
        return outcome;
    }

    const auto& pii = detectors.get(DetectorKind::PII_REDACTION);
    if (pii.enabled && !stop.stop_requested()) {
        auto redacted = redaction_->redact(output, pii, stop);
        record_redaction_step(trace, "response_pii_redaction", pii, redacted);
        outcome.text = redacted.redacted_text;
        outcome.redaction = std::move(redacted);
    } else {
        outcome.text = output;
    }
    return outcome;
}

} // namespace promptshield
