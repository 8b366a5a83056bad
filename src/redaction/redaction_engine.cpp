#include "redaction/redaction_engine.hpp"
#include "detector/pii_pattern_detector.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <optional>
#include <regex>

namespace promptshield {

namespace {

constexpr size_t kMaxMaskLabel = 48;
constexpr size_t kMaxMaskToken = kMaxMaskLabel + 11;   // "[REDACTED_" + label + "]"

const std::regex& mask_regex() {
    static const std::regex re(R"(\[REDACTED_[A-Z0-9_]{1,48}\])", std::regex::ECMAScript);
    return re;
}

} // anonymous namespace

RedactionEngine::RedactionEngine(std::shared_ptr<const StrategyRegistry> registry)
    : registry_(std::move(registry)) {}

std::string RedactionEngine::mask_token(std::string_view label) {
    std::string token = "[REDACTED_";
    if (label.empty()) label = "ENTITY";
    for (const char c : label.substr(0, kMaxMaskLabel)) {
        const auto u = static_cast<unsigned char>(c);
        token += std::isalnum(u) ? static_cast<char>(std::toupper(u)) : '_';
    }
    token += ']';
    return token;
}

std::vector<MatchedSpan> RedactionEngine::find_masks(std::string_view text) {
    std::vector<MatchedSpan> masks;
    size_t pos = 0;
    while ((pos = text.find("[REDACTED_", pos)) != std::string_view::npos) {
        const size_t close = text.substr(pos, kMaxMaskToken).find(']');
        if (close == std::string_view::npos) { ++pos; continue; }
        const auto candidate = text.substr(pos, close + 1);
        if (std::regex_match(candidate.begin(), candidate.end(), mask_regex())) {
            masks.push_back({pos, pos + candidate.size(), "MASK"});
            pos += candidate.size();
        } else {
            ++pos;
        }
    }
    return masks;
}

RedactionEngine::WorkingText RedactionEngine::make_working(std::string_view original) {
    WorkingText work;
    work.text = std::string(original);

    size_t pos = 0;
    for (const auto& mask : find_masks(original)) {
        if (mask.start > pos) {
            work.segments.push_back({pos, mask.start, pos, false});
        }
        work.segments.push_back({mask.start, mask.end, mask.start, true});
        pos = mask.end;
    }
    if (pos < original.size()) {
        work.segments.push_back({pos, original.size(), pos, false});
    }
    return work;
}

size_t RedactionEngine::apply_spans(WorkingText& work, std::vector<MatchedSpan> spans,
                                    std::vector<RedactedEntity>& entities) {
    std::erase_if(spans, [&](const MatchedSpan& s) {
        if (s.end <= s.start || s.end > work.text.size()) return true;
        return std::ranges::any_of(work.segments, [&](const Segment& seg) {
            return seg.is_mask && s.start < seg.cur_end && seg.cur_start < s.end;
        });
    });
    spans = resolve_overlaps(std::move(spans));
    if (spans.empty()) return 0;

    WorkingText next;
    next.text.reserve(work.text.size());

    const auto append_plain = [&](const Segment& seg, size_t from, size_t to) {
        if (to <= from) return;
        next.segments.push_back({next.text.size(), next.text.size() + (to - from),
                                 seg.orig_start + (from - seg.cur_start), false});
        next.text.append(work.text, from, to - from);
    };

    size_t si = 0;
    for (const auto& seg : work.segments) {
        if (seg.is_mask) {
            next.segments.push_back({next.text.size(),
                                     next.text.size() + (seg.cur_end - seg.cur_start),
                                     seg.orig_start, true});
            next.text.append(work.text, seg.cur_start, seg.cur_end - seg.cur_start);
            continue;
        }

        size_t pos = seg.cur_start;
        while (si < spans.size() && spans[si].start < seg.cur_end) {
            const auto& span = spans[si];
            append_plain(seg, pos, span.start);

            const size_t orig_start = seg.orig_start + (span.start - seg.cur_start);
            const std::string mask = mask_token(span.label);
            next.segments.push_back({next.text.size(), next.text.size() + mask.size(),
                                     orig_start, true});
            next.text += mask;

            entities.push_back({MatchedSpan{orig_start, orig_start + (span.end - span.start),
                                            span.label}, span.label});
            pos = span.end;
            ++si;
        }
        append_plain(seg, pos, seg.cur_end);
    }

    const size_t applied = si;
    work = std::move(next);
    return applied;
}

bool RedactionEngine::run_pass(WorkingText& work, StrategyVariant variant,
                               const DetectorPolicy& settings, std::stop_token stop,
                               RedactionResult& out) const {
    const auto detector = registry_->resolve(DetectorKind::PII_REDACTION, variant);
    if (detector.is_error()) {
        out.degraded_passes.push_back(std::format("{}:not_registered", strategy_to_string(variant)));
        return false;
    }

    const auto degrade = [&](std::string_view why) {
        out.degraded_passes.push_back(std::format("{}:{}", strategy_to_string(variant), why));
        return false;
    };

    std::optional<Result<DetectionResult>> outcome;
    try {
        const auto avail = detector.value()->availability();
        if (!avail.available) return degrade(avail.reason);
        outcome.emplace(detector.value()->detect(DetectionRequest{work.text, settings, stop}));
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Redaction pass '{}' threw: {}",
                                     strategy_to_string(variant), e.what()));
        return degrade(e.what());
    }

    const auto& found = *outcome;
    if (found.is_error()) {
        utils::log::warn(std::format("Redaction pass '{}' failed: {}",
                                     strategy_to_string(variant), found.error_message()));
        out.degraded_passes.push_back(std::format("{}:{}", strategy_to_string(variant),
                                                  found.error_message()));
        return false;
    }

    apply_spans(work, found.value().matched_spans, out.entities_removed);
    return true;
}

RedactionResult RedactionEngine::redact(std::string_view text, const DetectorPolicy& settings,
                                        std::stop_token stop) const {
    RedactionResult out;
    WorkingText work = make_working(text);

    run_pass(work, StrategyVariant::HEURISTIC, settings, stop, out);

    const auto strategy = settings.strategy;
    const bool wants_ner = strategy == StrategyVariant::MODEL_BASED ||
                           strategy == StrategyVariant::HYBRID;
    const bool wants_backend = strategy == StrategyVariant::BACKEND_ASSISTED ||
                               strategy == StrategyVariant::HYBRID;

    if (wants_ner && !settings.entity_types.empty() && !stop.stop_requested()) {
        run_pass(work, StrategyVariant::MODEL_BASED, settings, stop, out);
    }
    if (wants_backend && !stop.stop_requested()) {
        run_pass(work, StrategyVariant::BACKEND_ASSISTED, settings, stop, out);
    }

    std::ranges::sort(out.entities_removed, {},
                      [](const RedactedEntity& e) { return e.original_span.start; });
    out.redacted_text = std::move(work.text);
    return out;
}

RedactionResult RedactionEngine::redact_patterns_only(std::string_view text) const {
    static const DetectorPolicy kPatternOnly = [] {
        DetectorPolicy p;
        p.kind = DetectorKind::PII_REDACTION;
        p.enabled = true;
        return p;
    }();

    RedactionResult out;
    WorkingText work = make_working(text);
    run_pass(work, StrategyVariant::HEURISTIC, kPatternOnly, {}, out);
    out.redacted_text = std::move(work.text);
    return out;
}

} // namespace promptshield
