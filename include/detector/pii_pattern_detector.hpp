#pragma once

#include "detector/detector.hpp"

#include <regex>
#include <string>
#include <vector>

namespace promptshield {

/**
 * @brief Pattern PII recognizer (heuristic PII strategy)
 *
 * Labels: EMAIL, PHONE, SSN, CREDIT_CARD, IP_ADDRESS, plus one
 * "CUSTOM" label per configured pattern. SSNs must pass area/group/serial
 * rules and card numbers must pass the Luhn check. Overlapping matches
 * keep the earliest, then longest span.
 *
 * Emails are found by a linear scan anchored at each '@' (local part at
 * most kMaxLocalPart bytes, domain at most kMaxDomain). The numeric rules
 * only run inside windows of digits and separators, and every start
 * position in a window is tried, so a candidate rejected by its validator
 * does not hide a valid one overlapping it.
 */
class PiiPatternDetector : public IDetector {
public:
    PiiPatternDetector();

    [[nodiscard]] DetectorKind kind() const override { return DetectorKind::PII_REDACTION; }
    [[nodiscard]] StrategyVariant variant() const override { return StrategyVariant::HEURISTIC; }
    [[nodiscard]] Availability availability() const override { return Availability::yes(); }

    [[nodiscard]] Result<DetectionResult> detect(const DetectionRequest& request) const override;

    static constexpr size_t kMaxLocalPart = 64;
    static constexpr size_t kMaxDomain = 253;

    /// Email spans in `text`, in text order
    [[nodiscard]] static std::vector<MatchedSpan> find_emails(std::string_view text);

    [[nodiscard]] static bool luhn_validate(std::string_view number);
    [[nodiscard]] static bool validate_ssn(std::string_view value);

private:
    struct Rule {
        std::string label;
        std::regex re;
        bool (*validator)(std::string_view) = nullptr;
    };

    std::vector<Rule> rules_;
};

/**
 * @brief Resolve overlaps: sort by start, keep earliest then longest,
 *        drop anything overlapping a kept span.
 */
[[nodiscard]] std::vector<MatchedSpan> resolve_overlaps(std::vector<MatchedSpan> spans);

} // namespace promptshield
