#pragma once

#include "detector/detector.hpp"

#include <regex>
#include <string>
#include <vector>

namespace promptshield {

/**
 * @brief Rule-based named-entity recognizer (model-based PII strategy)
 *
 * Labels: PERSON, DATE, LOCATION, ORG. Recognition uses
 * - honorifics and cue phrases ("my name is", "Dr.", "patient") for PERSON
 * - numeric and month-name date shapes for DATE
 * - street-address shapes and "live in"/"born in" cues for LOCATION
 * - corporate and institutional suffixes for ORG
 * - an optional gazetteer file for known names of any label
 *
 * Policy entity types are matched after alias folding (GPE and LOC map to
 * LOCATION, PER to PERSON, ORGANIZATION to ORG). Only requested labels
 * are reported.
 */
class EntityRecognizer : public IDetector {
public:
    struct Config {
        bool enabled = true;
        std::string gazetteer_file;     // "LABEL<TAB>phrase" per line, '#' comments
    };

    struct GazetteerEntry {
        std::string label;
        std::string phrase;
    };

    EntityRecognizer() : EntityRecognizer(Config{}) {}
    explicit EntityRecognizer(const Config& config);

    [[nodiscard]] DetectorKind kind() const override { return DetectorKind::PII_REDACTION; }
    [[nodiscard]] StrategyVariant variant() const override { return StrategyVariant::MODEL_BASED; }
    [[nodiscard]] Availability availability() const override;

    [[nodiscard]] Result<DetectionResult> detect(const DetectionRequest& request) const override;

    /// Fold label aliases onto the canonical set
    [[nodiscard]] static std::string canonical_label(std::string_view label);

    [[nodiscard]] size_t gazetteer_size() const { return gazetteer_.size(); }

private:
    struct Rule {
        std::string label;
        std::regex re;
        int group = 0;      // capture group holding the entity
    };

    bool load_gazetteer(const std::string& path);

    Config config_;
    std::vector<Rule> rules_;
    std::vector<GazetteerEntry> gazetteer_;
    std::string unavailable_reason_;
};

} // namespace promptshield
