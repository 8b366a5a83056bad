#pragma once

#include <cstddef>
#include <memory>

namespace promptshield {

// Forward declarations
class PolicyStore;
class DetectionOrchestrator;
class RedactionEngine;
class ResponseScreeningOrchestrator;
class ILlmBackend;
class EventLogger;
class Pipeline;

/**
 * @brief All components that Pipeline needs, grouped in a single struct.
 */
struct PipelineComponents {
    // Required
    std::shared_ptr<PolicyStore> policy_store;
    std::shared_ptr<DetectionOrchestrator> detection;
    std::shared_ptr<RedactionEngine> redaction;
    std::shared_ptr<ResponseScreeningOrchestrator> response_screening;

    // Optional (nullptr = backend unavailable / events not persisted)
    std::shared_ptr<ILlmBackend> backend;
    std::shared_ptr<EventLogger> event_logger;

    // Request limits
    size_t max_prompt_length = 32000;   // code points
    size_t preview_length = 200;        // code points, ellipsis included
};

/**
 * @brief Builder pattern for Pipeline construction.
 *
 * Usage:
 *   auto pipeline = PipelineBuilder()
 *       .with_policy_store(store)
 *       .with_detection(orchestrator)
 *       .with_redaction(engine)
 *       .with_response_screening(screening)
 *       .with_backend(llm_client)          // optional
 *       .with_event_logger(logger)         // optional
 *       .build();
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_policy_store(std::shared_ptr<PolicyStore> p)            { c_.policy_store = std::move(p); return *this; }
    PipelineBuilder& with_detection(std::shared_ptr<DetectionOrchestrator> p)     { c_.detection = std::move(p); return *this; }
    PipelineBuilder& with_redaction(std::shared_ptr<RedactionEngine> p)           { c_.redaction = std::move(p); return *this; }
    PipelineBuilder& with_response_screening(std::shared_ptr<ResponseScreeningOrchestrator> p) { c_.response_screening = std::move(p); return *this; }
    PipelineBuilder& with_backend(std::shared_ptr<ILlmBackend> p)                 { c_.backend = std::move(p); return *this; }
    PipelineBuilder& with_event_logger(std::shared_ptr<EventLogger> p)            { c_.event_logger = std::move(p); return *this; }
    PipelineBuilder& with_max_prompt_length(size_t n)                             { c_.max_prompt_length = n; return *this; }
    PipelineBuilder& with_preview_length(size_t n)                                { c_.preview_length = n; return *this; }

    /**
     * @brief Build the Pipeline from accumulated components.
     * @throws std::runtime_error if required components are missing.
     */
    [[nodiscard]] std::shared_ptr<Pipeline> build();

private:
    PipelineComponents c_;
};

} // namespace promptshield
