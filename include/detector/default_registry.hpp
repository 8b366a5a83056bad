#pragma once

#include "detector/entity_recognizer.hpp"
#include "detector/strategy_registry.hpp"

#include <memory>
#include <string>

namespace promptshield {

class ILlmBackend;

struct BuiltinDetectorOptions {
    std::shared_ptr<ILlmBackend> backend;   // nullptr = backend strategies report unavailable
    EntityRecognizer::Config ner;
    std::string classifier_model;           // empty = backend default
    uint32_t classifier_timeout_ms = 15000;
};

/**
 * @brief Registry with every built-in detector
 *
 *   prompt_injection / harmful_content:
 *     heuristic -> rule detector
 *     ml        -> lexical model
 *     llm       -> backend classifier
 *     hybrid    -> heuristic OR llm
 *   pii_redaction:
 *     heuristic -> PII patterns
 *     ml        -> entity recognizer
 *     llm       -> backend entity extraction
 *     (hybrid is composed by the RedactionEngine)
 */
[[nodiscard]] std::shared_ptr<StrategyRegistry> build_default_registry(
    const BuiltinDetectorOptions& options);

} // namespace promptshield
