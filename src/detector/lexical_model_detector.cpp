#include "detector/lexical_model_detector.hpp"
#include "detector/text_matching.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace promptshield {

LexicalModelDetector::Model LexicalModelDetector::default_model(DetectorKind kind) {
    Model m;
    if (kind == DetectorKind::PROMPT_INJECTION) {
        m.bias = -3.0;
        m.weights = {
            {"ignore", 1.2},
            {"disregard", 1.4},
            {"previous instructions", 2.5},
            {"prior instructions", 2.5},
            {"system prompt", 2.0},
            {"reveal", 0.8},
            {"jailbreak", 3.0},
            {"developer mode", 3.0},
            {"no restrictions", 2.0},
            {"pretend", 0.8},
            {"act as", 0.6},
            {"bypass", 1.2},
            {"override", 1.0},
            {"unfiltered", 1.5},
        };
    } else {
        m.bias = -3.5;
        m.weights = {
            {"bomb", 2.0},
            {"explosive", 1.8},
            {"weapon", 1.2},
            {"kill", 1.5},
            {"murder", 1.8},
            {"poison", 1.8},
            {"suicide", 1.5},
            {"kill myself", 4.0},
            {"meth", 2.0},
            {"fentanyl", 1.8},
            {"make", 0.3},
            {"how to", 0.4},
            {"step by step", 0.5},
            {"untraceable", 1.5},
            {"genocide", 2.5},
        };
    }
    return m;
}

LexicalModelDetector::LexicalModelDetector(DetectorKind kind, Model model)
    : kind_(kind), model_(std::move(model)) {}

double LexicalModelDetector::sigmoid(double z) {
    return 1.0 / (1.0 + std::exp(-z));
}

Result<DetectionResult> LexicalModelDetector::detect(const DetectionRequest& request) const {
    const auto& settings = request.settings;
    const NormalizedText normalized(request.text);

    // Config overrides take precedence over built-in weights
    auto weights = model_.weights;
    for (const auto& [term, w] : settings.model_weights) {
        weights[utils::normalize_for_match(term)] = w;
    }
    const double bias = settings.model_bias.value_or(model_.bias);

    double z = bias;
    std::vector<MatchedSpan> spans;
    for (const auto& [term, w] : weights) {
        if (auto span = normalized.find_phrase(term, "feature")) {
            z += w;
            spans.push_back(std::move(*span));
        }
    }

    const double score = sigmoid(z);
    auto result = apply_threshold(score, settings, detection_reason(kind_));
    if (result.decision != Decision::ALLOW) {
        std::ranges::sort(spans, {}, &MatchedSpan::start);
        result.matched_spans = std::move(spans);
    }
    return Result<DetectionResult>::ok(std::move(result));
}

} // namespace promptshield
