#include "detector/text_matching.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace promptshield {

namespace {

bool is_word_char(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

} // anonymous namespace

// ============================================================================
// NormalizedText
// ============================================================================

NormalizedText::NormalizedText(std::string_view original) {
    norm_.reserve(original.size());
    begin_.reserve(original.size());
    end_.reserve(original.size());

    size_t i = 0;
    while (i < original.size()) {
        const char c = original[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            const size_t run_start = i;
            while (i < original.size() && std::isspace(static_cast<unsigned char>(original[i]))) {
                ++i;
            }
            if (!norm_.empty()) {
                norm_ += ' ';
                begin_.push_back(run_start);
                end_.push_back(i);
            }
            continue;
        }
        norm_ += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        begin_.push_back(i);
        end_.push_back(i + 1);
        ++i;
    }
}

template <typename Visit>
void NormalizedText::scan_phrase(std::string_view phrase, Visit&& visit) const {
    const std::string needle = utils::normalize_for_match(phrase);
    if (needle.empty() || needle.size() > norm_.size()) return;

    const bool check_front = is_word_char(needle.front());
    const bool check_back = is_word_char(needle.back());

    size_t pos = norm_.find(needle);
    while (pos != std::string::npos) {
        const size_t last = pos + needle.size() - 1;
        const bool front_ok = !check_front || pos == 0 || !is_word_char(norm_[pos - 1]);
        const bool back_ok = !check_back || last + 1 >= norm_.size() ||
                             !is_word_char(norm_[last + 1]);
        if (front_ok && back_ok && !visit(pos, last)) return;
        pos = norm_.find(needle, pos + 1);
    }
}

std::optional<MatchedSpan> NormalizedText::find_phrase(std::string_view phrase,
                                                       const std::string& label) const {
    std::optional<MatchedSpan> found;
    scan_phrase(phrase, [&](size_t first, size_t last) {
        found = MatchedSpan{begin_[first], end_[last], label};
        return false;
    });
    return found;
}

std::vector<MatchedSpan> NormalizedText::find_all_phrases(std::string_view phrase,
                                                          const std::string& label) const {
    std::vector<MatchedSpan> spans;
    scan_phrase(phrase, [&](size_t first, size_t last) {
        spans.push_back(MatchedSpan{begin_[first], end_[last], label});
        return true;
    });
    return spans;
}

// ============================================================================
// RegexCache
// ============================================================================

std::shared_mutex& RegexCache::mutex() {
    static std::shared_mutex m;
    return m;
}

std::unordered_map<std::string, std::shared_ptr<const std::regex>>& RegexCache::entries() {
    static std::unordered_map<std::string, std::shared_ptr<const std::regex>> map;
    return map;
}

std::shared_ptr<const std::regex> RegexCache::get(const std::string& pattern) {
    {
        std::shared_lock lock(mutex());
        if (const auto it = entries().find(pattern); it != entries().end()) {
            return it->second;
        }
    }

    auto compiled = std::make_shared<const std::regex>(
        pattern, std::regex::ECMAScript | std::regex::icase);

    std::unique_lock lock(mutex());
    return entries().try_emplace(pattern, std::move(compiled)).first->second;
}

void for_each_match(std::string_view text, size_t from, size_t to, const std::regex& re,
                    const std::function<void(const RegexMatch&)>& visit) {
    to = std::min(to, text.size());
    auto pos = text.begin() + static_cast<std::ptrdiff_t>(from);
    const auto last = text.begin() + static_cast<std::ptrdiff_t>(to);

    RegexMatch m;
    while (pos < last) {
        const auto flags = pos == text.begin() ? std::regex_constants::match_default
                                               : std::regex_constants::match_prev_avail;
        if (!std::regex_search(pos, last, m, re, flags)) break;
        if (m.length(0) > 0) visit(m);
        pos = m[0].first + 1;
    }
}

std::optional<MatchedSpan> find_regex(std::string_view text, const std::regex& re,
                                      const std::string& label) {
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(text.begin(), text.end(), m, re)) return std::nullopt;
    const auto start = static_cast<size_t>(m.position(0));
    return MatchedSpan{start, start + static_cast<size_t>(m.length(0)), label};
}

std::optional<MatchedSpan> match_configured_rules(std::string_view text,
                                                  const NormalizedText& normalized,
                                                  const DetectorPolicy& settings) {
    for (const auto& marker : settings.markers) {
        if (auto span = normalized.find_phrase(marker, "marker")) return span;
    }
    for (const auto& pattern : settings.patterns) {
        if (auto span = find_regex(text, *RegexCache::get(pattern), "pattern")) return span;
    }
    return std::nullopt;
}

} // namespace promptshield
