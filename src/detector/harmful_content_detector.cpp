#include "detector/harmful_content_detector.hpp"
#include "detector/text_matching.hpp"

#include <algorithm>
#include <format>

namespace promptshield {

std::vector<HarmfulContentDetector::LexiconEntry> HarmfulContentDetector::default_lexicon() {
    return {
        // violence
        {"violence", "kill", 0.35},
        {"violence", "murder", 0.45},
        {"violence", "torture", 0.45},
        {"violence", "massacre", 0.6},
        {"violence", "hurt someone", 0.5},
        {"violence", "how to kill someone", 0.9},
        {"violence", "mass shooting", 0.8},
        // weapons
        {"weapons", "bomb", 0.4},
        {"weapons", "explosive", 0.4},
        {"weapons", "make a bomb", 0.95},
        {"weapons", "build a bomb", 0.95},
        {"weapons", "pipe bomb", 0.9},
        {"weapons", "nerve agent", 0.8},
        {"weapons", "untraceable gun", 0.85},
        {"weapons", "3d printed gun", 0.6},
        // self-harm
        {"self_harm", "suicide", 0.4},
        {"self_harm", "kill myself", 0.9},
        {"self_harm", "end my life", 0.9},
        {"self_harm", "self harm", 0.6},
        {"self_harm", "cut myself", 0.8},
        // hate
        {"hate", "ethnic cleansing", 0.9},
        {"hate", "genocide", 0.6},
        {"hate", "subhuman", 0.6},
        {"hate", "inferior race", 0.85},
        // illicit drugs
        {"illicit_drugs", "cook meth", 0.9},
        {"illicit_drugs", "synthesize fentanyl", 0.95},
        {"illicit_drugs", "make meth", 0.9},
        {"illicit_drugs", "buy cocaine", 0.7},
        {"illicit_drugs", "overdose", 0.3},
    };
}

HarmfulContentDetector::HarmfulContentDetector()
    : HarmfulContentDetector(default_lexicon()) {}

HarmfulContentDetector::HarmfulContentDetector(std::vector<LexiconEntry> lexicon)
    : lexicon_(std::move(lexicon)) {}

Result<DetectionResult> HarmfulContentDetector::detect(const DetectionRequest& request) const {
    const NormalizedText normalized(request.text);
    const std::string reason = detection_reason(kind());

    try {
        if (auto span = match_configured_rules(request.text, normalized, request.settings)) {
            auto result = apply_threshold(1.0, request.settings, reason);
            result.matched_spans.push_back(std::move(*span));
            return Result<DetectionResult>::ok(std::move(result));
        }
    } catch (const std::regex_error& e) {
        return Result<DetectionResult>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("pattern evaluation failed: {}", e.what()));
    }

    double keep = 1.0;
    std::vector<MatchedSpan> spans;
    for (const auto& entry : lexicon_) {
        if (request.stop.stop_requested()) break;
        if (auto span = normalized.find_phrase(entry.phrase, entry.category)) {
            keep *= (1.0 - std::clamp(entry.weight, 0.0, 1.0));
            spans.push_back(std::move(*span));
        }
    }

    const double score = 1.0 - keep;
    auto result = apply_threshold(score, request.settings, reason);
    if (result.decision != Decision::ALLOW) {
        std::ranges::sort(spans, {}, &MatchedSpan::start);
        result.matched_spans = std::move(spans);
    }
    return Result<DetectionResult>::ok(std::move(result));
}

} // namespace promptshield
