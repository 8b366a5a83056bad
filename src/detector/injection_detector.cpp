#include "detector/injection_detector.hpp"
#include "core/base64.hpp"

#include <cctype>
#include <format>

namespace promptshield {

namespace {

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' ||
           c == '-' || c == '_' || c == '=';
}

/// Decoded payloads that are mostly binary are not smuggled text
bool looks_like_text(std::string_view s) {
    if (s.empty()) return false;
    size_t printable = 0;
    for (const char c : s) {
        const auto u = static_cast<unsigned char>(c);
        if ((u >= 0x20 && u < 0x7F) || c == '\n' || c == '\t' || u >= 0x80) ++printable;
    }
    return printable * 10 >= s.size() * 9;
}

} // anonymous namespace

InjectionDetector::InjectionDetector(const Config& config)
    : config_(config) {
    const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

    // Role override: "ignore all previous instructions", "disregard the above rules"
    builtin_.push_back({"role_override", std::regex(
        R"(\b(ignore|disregard|forget|override|bypass)\s{1,8}(all\s{1,8}|any\s{1,8}|every\s{1,8})?(of\s{1,8})?(the\s{1,8}|your\s{1,8}|my\s{1,8})?)"
        R"((previous|prior|above|earlier|preceding|original|initial)\s{1,8})"
        R"((instructions?|rules|directions|prompts?|guidelines|context|messages?)\b)", flags)});

    // System prompt exfiltration
    builtin_.push_back({"system_prompt_exfiltration", std::regex(
        R"(\b(reveal|show|print|repeat|output|display|leak|tell\s{1,8}me)\s{1,8}(me\s{1,8})?(your|the)\s{1,8})"
        R"((system|hidden|initial|original|secret)\s{1,8}(prompt|instructions|message|rules)\b)", flags)});

    // Developer / DAN / unrestricted persona
    builtin_.push_back({"mode_switch", std::regex(
        R"(\b(developer|dan|jailbreak|god|sudo)\s{1,8}mode\b|\bdo\s{1,8}anything\s{1,8}now\b)", flags)});
    builtin_.push_back({"persona_override", std::regex(
        R"(\byou\s{1,8}are\s{1,8}(now\s{1,8})?(no\s{1,8}longer\s{1,8}bound|free\s{1,8}from|an?\s{1,8}(unfiltered|unrestricted|uncensored)))"
        R"(|\bpretend\s{1,8}(that\s{1,8})?you\s{1,8}(have|are)\s{1,8}no\s{1,8}(rules|restrictions|filters|guidelines)\b)", flags)});

    // Chat-template delimiters smuggled into user content
    builtin_.push_back({"delimiter_smuggling", std::regex(
        R"(<\|(im_start|im_end|system|endoftext)\|>|\[/?INST\]|<</?SYS>>|###\s{0,8}(system|instruction)\s{0,8}:)",
        flags)});
}

std::optional<MatchedSpan> InjectionDetector::scan(std::string_view text,
                                                   const DetectorPolicy& settings) const {
    const NormalizedText normalized(text);
    if (auto span = match_configured_rules(text, normalized, settings)) return span;

    for (const auto& p : builtin_) {
        if (auto span = find_regex(text, p.re, p.label)) return span;
    }
    // Built-ins are written for single spaces; retry on the normalized form
    for (const auto& p : builtin_) {
        if (find_regex(normalized.text(), p.re, p.label)) {
            return MatchedSpan{0, text.size(), p.label};
        }
    }
    return std::nullopt;
}

std::optional<MatchedSpan> InjectionDetector::scan_base64(std::string_view text,
                                                          const DetectorPolicy& settings) const {
    size_t i = 0;
    while (i < text.size()) {
        if (!is_base64_char(text[i])) { ++i; continue; }
        const size_t start = i;
        while (i < text.size() && is_base64_char(text[i])) ++i;

        const std::string_view token = text.substr(start, i - start);
        if (token.size() < config_.min_base64_length) continue;

        const auto decoded = base64::decode(token);
        if (!decoded || !looks_like_text(*decoded)) continue;
        if (scan(*decoded, settings)) {
            return MatchedSpan{start, i, "base64_smuggling"};
        }
    }
    return std::nullopt;
}

Result<DetectionResult> InjectionDetector::detect(const DetectionRequest& request) const {
    std::optional<MatchedSpan> hit;
    try {
        hit = scan(request.text, request.settings);
        if (!hit && config_.decode_base64) {
            hit = scan_base64(request.text, request.settings);
        }
    } catch (const std::regex_error& e) {
        return Result<DetectionResult>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("pattern evaluation failed: {}", e.what()));
    }

    if (!hit) {
        auto result = DetectionResult::allow();
        result.score = 0.0;
        return Result<DetectionResult>::ok(std::move(result));
    }

    auto result = apply_threshold(1.0, request.settings, detection_reason(kind()));
    result.matched_spans.push_back(std::move(*hit));
    return Result<DetectionResult>::ok(std::move(result));
}

} // namespace promptshield
