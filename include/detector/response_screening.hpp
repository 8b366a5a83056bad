#pragma once

#include "detector/detection_orchestrator.hpp"
#include "redaction/redaction_engine.hpp"

#include <memory>
#include <optional>
#include <string>

namespace promptshield {

/// Placeholder returned instead of a withheld backend response
inline constexpr const char* kWithheldResponse = "[response withheld by policy]";

struct ResponseScreeningOutcome {
    ScreeningOutcome screening;
    std::string text;                           // screened (possibly redacted) output
    std::optional<RedactionResult> redaction;   // set when the PII pass ran

    [[nodiscard]] bool blocked() const { return screening.blocked(); }
};

/**
 * @brief Screens backend output with the input-side machinery
 *
 * Runs the detection orchestrator over the response-side detector set
 * (steps prefixed "response_"), then redacts PII from the output (step
 * "response_pii_redaction"). On Block the generated text is dropped and
 * only kWithheldResponse is returned.
 */
class ResponseScreeningOrchestrator {
public:
    ResponseScreeningOrchestrator(std::shared_ptr<const DetectionOrchestrator> detection,
                                  std::shared_ptr<const RedactionEngine> redaction);

    [[nodiscard]] ResponseScreeningOutcome run(const std::string& output, const Policy& policy,
                                               TraceRecorder& trace, std::stop_token stop) const;

private:
    std::shared_ptr<const DetectionOrchestrator> detection_;
    std::shared_ptr<const RedactionEngine> redaction_;
};

/**
 * @brief Append a pii_redaction trace step for a RedactionResult
 *
 * Redacted when entities were removed, else Allow. The reason lists the
 * entity count and any degraded passes.
 */
void record_redaction_step(TraceRecorder& trace, const std::string& step_name,
                           const DetectorPolicy& settings, const RedactionResult& result);

} // namespace promptshield
