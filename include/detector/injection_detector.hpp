#pragma once

#include "detector/detector.hpp"
#include "detector/text_matching.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace promptshield {

/**
 * @brief Heuristic prompt-injection detector
 *
 * Checks, in order:
 * 1. Configured marker phrases (case and whitespace insensitive)
 * 2. Configured regex patterns
 * 3. Built-in jailbreak patterns (role override, system-prompt
 *    exfiltration, developer/DAN mode, chat-template delimiter smuggling)
 * 4. Base64 tokens whose decoded text matches any of the above
 *
 * Any hit scores 1.0; the configured threshold and action then apply.
 */
class InjectionDetector : public IDetector {
public:
    struct Config {
        bool decode_base64 = true;
        size_t min_base64_length = 16;
    };

    InjectionDetector() : InjectionDetector(Config{}) {}
    explicit InjectionDetector(const Config& config);

    [[nodiscard]] DetectorKind kind() const override { return DetectorKind::PROMPT_INJECTION; }
    [[nodiscard]] StrategyVariant variant() const override { return StrategyVariant::HEURISTIC; }
    [[nodiscard]] Availability availability() const override { return Availability::yes(); }

    [[nodiscard]] Result<DetectionResult> detect(const DetectionRequest& request) const override;

private:
    struct BuiltinPattern {
        std::string label;
        std::regex re;
    };

    std::optional<MatchedSpan> scan(std::string_view text, const DetectorPolicy& settings) const;
    std::optional<MatchedSpan> scan_base64(std::string_view text,
                                           const DetectorPolicy& settings) const;

    Config config_;
    std::vector<BuiltinPattern> builtin_;
};

} // namespace promptshield
