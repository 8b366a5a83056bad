#pragma once

#include "core/types.hpp"
#include "policy/policy.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptshield {

/**
 * @brief Lowercased, whitespace-collapsed view of a text with a byte map
 *        back to the original
 *
 * Phrase lookups run on the normalized form; matches are reported as spans
 * of the original text.
 */
class NormalizedText {
public:
    explicit NormalizedText(std::string_view original);

    /**
     * @brief Find a phrase at word boundaries
     * @param phrase Raw phrase; normalized before matching
     * @return Span in the original text, or nullopt
     */
    [[nodiscard]] std::optional<MatchedSpan> find_phrase(std::string_view phrase,
                                                         const std::string& label) const;

    /// Every word-bounded occurrence of a phrase, in text order
    [[nodiscard]] std::vector<MatchedSpan> find_all_phrases(std::string_view phrase,
                                                            const std::string& label) const;

    [[nodiscard]] bool contains_phrase(std::string_view phrase) const {
        return find_phrase(phrase, {}).has_value();
    }

    [[nodiscard]] const std::string& text() const { return norm_; }

private:
    /// Calls visit(norm_pos) for each word-bounded occurrence until it returns false
    template <typename Visit>
    void scan_phrase(std::string_view phrase, Visit&& visit) const;

    std::string norm_;
    std::vector<size_t> begin_;   // original offset of each normalized byte
    std::vector<size_t> end_;     // original end offset of each normalized byte
};

/**
 * @brief Process-wide cache of case-insensitive ECMAScript regexes
 *
 * Config patterns are compiled on first use and shared across requests.
 *
 * Thread-safety: shared_mutex (readers concurrent, first compile exclusive)
 */
class RegexCache {
public:
    /// @throws std::regex_error when the pattern does not compile
    [[nodiscard]] static std::shared_ptr<const std::regex> get(const std::string& pattern);

private:
    static std::shared_mutex& mutex();
    static std::unordered_map<std::string, std::shared_ptr<const std::regex>>& entries();
};

using RegexMatch = std::match_results<std::string_view::const_iterator>;

/**
 * @brief Visit every match of `re` that lies inside [from, to) of `text`
 *
 * Unlike std::regex_iterator, the search resumes one byte after each match
 * start, so a match that overlaps an earlier one is still reported. The
 * byte before `from` is visible to \b.
 * Positions in the visited match are relative to `text.begin()`.
 */
void for_each_match(std::string_view text, size_t from, size_t to, const std::regex& re,
                    const std::function<void(const RegexMatch&)>& visit);

/// First regex match as a span of `text`
[[nodiscard]] std::optional<MatchedSpan> find_regex(std::string_view text, const std::regex& re,
                                                    const std::string& label);

/**
 * @brief Check the configured markers, then the configured patterns
 * @return Span of the first rule that matched
 * @throws std::regex_error for a pattern that does not compile
 */
[[nodiscard]] std::optional<MatchedSpan> match_configured_rules(std::string_view text,
                                                                const NormalizedText& normalized,
                                                                const DetectorPolicy& settings);

} // namespace promptshield
