#include "detector/pii_pattern_detector.hpp"
#include "detector/text_matching.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace promptshield {

namespace {

std::string digits_only(std::string_view s) {
    std::string digits;
    digits.reserve(s.size());
    for (const char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
    }
    return digits;
}

bool validate_ip(std::string_view value) {
    size_t start = 0;
    for (int octet = 0; octet < 4; ++octet) {
        const size_t dot = value.find('.', start);
        const auto part = value.substr(start, dot == std::string_view::npos ? std::string_view::npos
                                                                              : dot - start);
        if (part.empty() || part.size() > 3) return false;
        int n = 0;
        for (const char c : part) n = n * 10 + (c - '0');
        if (n > 255) return false;
        if (dot == std::string_view::npos) return octet == 3;
        start = dot + 1;
    }
    return false;
}

bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }
bool is_word(char c) { return is_alnum(c) || c == '_'; }

bool is_local_char(char c) {
    return is_alnum(c) || c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
}

bool is_domain_char(char c) { return is_alnum(c) || c == '.' || c == '-'; }

/// Characters the numeric rules can consume
bool is_numeric_char(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == ' ' || c == '-' || c == '.' ||
           c == '(' || c == ')' || c == '+';
}

/// Length of the letter run ending just before `end`, capped at cap + 1
size_t alpha_run_before(std::string_view text, size_t begin, size_t end, size_t cap) {
    size_t n = 0;
    while (n <= cap && end - n > begin && is_alpha(text[end - n - 1])) ++n;
    return n;
}

} // anonymous namespace

bool PiiPatternDetector::luhn_validate(std::string_view number) {
    const std::string digits = digits_only(number);
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) digit -= 9;
        }
        sum += digit;
        double_digit = !double_digit;
    }
    return (sum % 10) == 0;
}

bool PiiPatternDetector::validate_ssn(std::string_view value) {
    const std::string digits = digits_only(value);
    if (digits.size() != 9) {
        return false;
    }

    // Area cannot be 000, 666 or 9xx; group cannot be 00; serial cannot be 0000
    const int area = std::stoi(digits.substr(0, 3));
    const int group = std::stoi(digits.substr(3, 2));
    const int serial = std::stoi(digits.substr(5, 4));
    return area != 0 && area != 666 && area < 900 && group != 0 && serial != 0;
}

std::vector<MatchedSpan> PiiPatternDetector::find_emails(std::string_view text) {
    constexpr size_t kMaxTld = 24;
    std::vector<MatchedSpan> spans;

    for (size_t at = text.find('@'); at != std::string_view::npos; at = text.find('@', at + 1)) {
        if (at == 0 || !is_alnum(text[at - 1])) continue;
        if (at + 1 >= text.size() || !is_alnum(text[at + 1])) continue;

        // Local part: starts at the first alphanumeric of the run before '@'
        size_t start = at;
        while (start > 0 && is_local_char(text[start - 1])) {
            if (at - start == kMaxLocalPart) break;
            --start;
        }
        if (start > 0 && is_local_char(text[start - 1])) continue;    // over-long local part
        while (!is_alnum(text[start])) ++start;

        // Domain: longest prefix of the run that ends in ".<2-24 letters>"
        const size_t domain = at + 1;
        size_t run_end = domain;
        while (run_end < text.size() && is_domain_char(text[run_end])) {
            if (run_end - domain == kMaxDomain) break;
            ++run_end;
        }
        if (run_end < text.size() && is_domain_char(text[run_end])) continue;

        for (size_t end = run_end; end > domain; --end) {
            if (end < text.size() && is_word(text[end])) continue;
            const size_t tld = alpha_run_before(text, domain, end, kMaxTld);
            if (tld < 2 || tld > kMaxTld) continue;
            const size_t dot = end - tld - 1;
            if (dot <= domain || text[dot] != '.' || !is_alnum(text[dot - 1])) continue;
            spans.push_back({start, end, "EMAIL"});
            break;
        }
    }
    return spans;
}

PiiPatternDetector::PiiPatternDetector() {
    const auto flags = std::regex::ECMAScript | std::regex::optimize;

    rules_.push_back({"CREDIT_CARD", std::regex(
        R"(\b\d{4}[- ]?\d{4}[- ]?\d{4}[- ]?\d{1,7}\b)", flags), &PiiPatternDetector::luhn_validate});

    rules_.push_back({"SSN", std::regex(
        R"(\b\d{3}[- ]\d{2}[- ]\d{4}\b)", flags), &PiiPatternDetector::validate_ssn});

    rules_.push_back({"PHONE", std::regex(
        R"((?:\+\d{1,3}[-. ]?)?\(?\b\d{3}\)?[-. ]?\d{3}[-. ]\d{4}\b)", flags)});

    rules_.push_back({"IP_ADDRESS", std::regex(
        R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", flags), &validate_ip});
}

Result<DetectionResult> PiiPatternDetector::detect(const DetectionRequest& request) const {
    const std::string_view text = request.text;
    std::vector<MatchedSpan> spans = find_emails(text);

    // Numeric rules: one window per run of digits and separators
    size_t i = 0;
    while (i < text.size()) {
        if (!is_numeric_char(text[i])) { ++i; continue; }
        const size_t start = i;
        bool has_digit = false;
        while (i < text.size() && is_numeric_char(text[i])) {
            has_digit = has_digit || std::isdigit(static_cast<unsigned char>(text[i]));
            ++i;
        }
        if (!has_digit) continue;

        // One byte past the window so a trailing \b sees its neighbor
        const size_t search_end = std::min(i + 1, text.size());
        for (const auto& rule : rules_) {
            for_each_match(text, start, search_end, rule.re, [&](const RegexMatch& m) {
                const auto pos = static_cast<size_t>(m[0].first - text.begin());
                const std::string_view value = text.substr(pos, static_cast<size_t>(m.length(0)));
                if (rule.validator && !rule.validator(value)) return;
                spans.push_back({pos, pos + value.size(), rule.label});
            });
        }
    }

    try {
        for (const auto& pattern : request.settings.patterns) {
            const auto re = RegexCache::get(pattern);
            using It = std::string_view::const_iterator;
            for (std::regex_iterator<It> it(text.begin(), text.end(), *re), end; it != end; ++it) {
                if (it->length(0) == 0) continue;
                const auto start = static_cast<size_t>(it->position(0));
                spans.push_back({start, start + static_cast<size_t>(it->length(0)), "CUSTOM"});
            }
        }
    } catch (const std::regex_error& e) {
        return Result<DetectionResult>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("pattern evaluation failed: {}", e.what()));
    }

    DetectionResult result;
    result.matched_spans = resolve_overlaps(std::move(spans));
    if (!result.matched_spans.empty()) {
        result.decision = Decision::FLAG;
        result.reason = "pii_detected";
    }
    return Result<DetectionResult>::ok(std::move(result));
}

std::vector<MatchedSpan> resolve_overlaps(std::vector<MatchedSpan> spans) {
    std::ranges::sort(spans, [](const MatchedSpan& a, const MatchedSpan& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.end > b.end;
    });

    std::vector<MatchedSpan> kept;
    kept.reserve(spans.size());
    for (auto& span : spans) {
        if (span.end <= span.start) continue;
        if (!kept.empty() && span.start < kept.back().end) continue;
        kept.push_back(std::move(span));
    }
    return kept;
}

} // namespace promptshield
