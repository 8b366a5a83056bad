#pragma once

#include "detector/detector.hpp"

#include <string>
#include <vector>

namespace promptshield {

/**
 * @brief Heuristic harmful-content detector
 *
 * Scores text against a weighted category lexicon (violence, weapons,
 * self-harm, hate, illicit drugs). Each distinct matched term contributes
 * its weight via noisy-OR: score = 1 - prod(1 - w). Configured markers and
 * patterns score 1.0 outright.
 */
class HarmfulContentDetector : public IDetector {
public:
    struct LexiconEntry {
        std::string category;
        std::string phrase;
        double weight;
    };

    HarmfulContentDetector();
    explicit HarmfulContentDetector(std::vector<LexiconEntry> lexicon);

    [[nodiscard]] DetectorKind kind() const override { return DetectorKind::HARMFUL_CONTENT; }
    [[nodiscard]] StrategyVariant variant() const override { return StrategyVariant::HEURISTIC; }
    [[nodiscard]] Availability availability() const override { return Availability::yes(); }

    [[nodiscard]] Result<DetectionResult> detect(const DetectionRequest& request) const override;

    [[nodiscard]] static std::vector<LexiconEntry> default_lexicon();

private:
    std::vector<LexiconEntry> lexicon_;
};

} // namespace promptshield
