#include "detector/default_registry.hpp"
#include "detector/backend_detector.hpp"
#include "detector/harmful_content_detector.hpp"
#include "detector/hybrid_detector.hpp"
#include "detector/injection_detector.hpp"
#include "detector/lexical_model_detector.hpp"
#include "detector/pii_pattern_detector.hpp"

namespace promptshield {

std::shared_ptr<StrategyRegistry> build_default_registry(const BuiltinDetectorOptions& options) {
    auto registry = std::make_shared<StrategyRegistry>();

    BackendSafetyDetector::Config classifier;
    classifier.model = options.classifier_model;
    classifier.timeout_ms = options.classifier_timeout_ms;

    const auto add_screening = [&](DetectorKind kind, std::shared_ptr<const IDetector> heuristic) {
        auto backend = std::make_shared<BackendSafetyDetector>(kind, options.backend, classifier);
        registry->register_detector(heuristic);
        registry->register_detector(std::make_shared<LexicalModelDetector>(
            kind, LexicalModelDetector::default_model(kind)));
        registry->register_detector(backend);
        registry->register_detector(std::make_shared<HybridDetector>(
            kind, std::vector<std::shared_ptr<const IDetector>>{heuristic, backend}));
    };

    add_screening(DetectorKind::PROMPT_INJECTION, std::make_shared<InjectionDetector>());
    add_screening(DetectorKind::HARMFUL_CONTENT, std::make_shared<HarmfulContentDetector>());

    registry->register_detector(std::make_shared<PiiPatternDetector>());
    registry->register_detector(std::make_shared<EntityRecognizer>(options.ner));
    registry->register_detector(std::make_shared<BackendPiiDetector>(options.backend, classifier));

    return registry;
}

} // namespace promptshield
