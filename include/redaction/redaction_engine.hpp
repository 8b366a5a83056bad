#pragma once

#include "detector/strategy_registry.hpp"

#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace promptshield {

/**
 * @brief Multi-pass PII redaction
 *
 * Passes, in order:
 * 1. Pattern pass (heuristic PII detector), always.
 * 2. Named-entity pass, for strategy ml/hybrid with non-empty entity_types.
 * 3. Backend pass, for strategy llm/hybrid.
 *
 * Each pass sees the output of the previous one. Mask tokens
 * ("[REDACTED_<LABEL>]"), whether produced here or already present in the
 * input, are never matched again, so redaction is idempotent and a later
 * pass cannot split an earlier mask. Entity offsets always refer to the
 * text passed to redact().
 *
 * An optional pass that is unregistered, unavailable or failing is skipped
 * and listed in RedactionResult::degraded_passes.
 */
class RedactionEngine {
public:
    explicit RedactionEngine(std::shared_ptr<const StrategyRegistry> registry);

    [[nodiscard]] RedactionResult redact(std::string_view text,
                                         const DetectorPolicy& settings,
                                         std::stop_token stop = {}) const;

    /// Pattern pass only; used for log previews
    [[nodiscard]] RedactionResult redact_patterns_only(std::string_view text) const;

    [[nodiscard]] static std::string mask_token(std::string_view label);

    /// Spans of every mask token already present in `text`
    [[nodiscard]] static std::vector<MatchedSpan> find_masks(std::string_view text);

private:
    struct Segment {
        size_t cur_start;
        size_t cur_end;
        size_t orig_start;
        bool is_mask;
    };

    struct WorkingText {
        std::string text;
        std::vector<Segment> segments;
    };

    static WorkingText make_working(std::string_view original);

    /// Apply one pass's spans to the working text; returns entities added
    static size_t apply_spans(WorkingText& work, std::vector<MatchedSpan> spans,
                              std::vector<RedactedEntity>& entities);

    bool run_pass(WorkingText& work, StrategyVariant variant, const DetectorPolicy& settings,
                  std::stop_token stop, RedactionResult& out) const;

    std::shared_ptr<const StrategyRegistry> registry_;
};

} // namespace promptshield
