#include "detector/hybrid_detector.hpp"

#include <algorithm>
#include <format>

namespace promptshield {

HybridDetector::HybridDetector(DetectorKind kind, std::vector<std::shared_ptr<const IDetector>> parts)
    : kind_(kind), parts_(std::move(parts)) {}

Decision HybridDetector::combine(Decision a, Decision b) {
    if (a == Decision::BLOCK || b == Decision::BLOCK) return Decision::BLOCK;
    if (a == Decision::FLAG || b == Decision::FLAG) return Decision::FLAG;
    return Decision::ALLOW;
}

Availability HybridDetector::availability() const {
    std::string reasons;
    for (const auto& part : parts_) {
        const auto avail = part->availability();
        if (avail.available) return Availability::yes();
        if (!reasons.empty()) reasons += ",";
        reasons += avail.reason;
    }
    return Availability::no(reasons.empty() ? "no_sub_strategies" : reasons);
}

Result<DetectionResult> HybridDetector::detect(const DetectionRequest& request) const {
    DetectionResult combined;
    std::vector<std::string> degraded;
    std::string last_error;
    size_t ran = 0;

    for (const auto& part : parts_) {
        if (request.stop.stop_requested()) break;

        const auto avail = part->availability();
        if (!avail.available) {
            degraded.emplace_back(strategy_to_string(part->variant()));
            last_error = avail.reason;
            continue;
        }

        auto sub = part->detect(request);
        if (sub.is_error()) {
            degraded.emplace_back(strategy_to_string(part->variant()));
            last_error = sub.error_message();
            continue;
        }
        ++ran;

        const auto& r = sub.value();
        if (r.score) {
            combined.score = std::max(combined.score.value_or(0.0), *r.score);
        }
        const Decision before = combined.decision;
        combined.decision = combine(combined.decision, r.decision);
        if (combined.decision != before && r.reason) {
            combined.reason = r.reason;
        }
        combined.matched_spans.insert(combined.matched_spans.end(),
                                      r.matched_spans.begin(), r.matched_spans.end());
    }

    if (ran == 0) {
        return Result<DetectionResult>::error(ErrorCategory::DETECTOR_UNAVAILABLE,
            last_error.empty() ? "no_sub_strategies" : last_error);
    }

    if (!degraded.empty()) {
        std::string note = "degraded:";
        for (size_t i = 0; i < degraded.size(); ++i) {
            if (i > 0) note += ",";
            note += degraded[i];
        }
        combined.reason = combined.reason ? std::format("{};{}", *combined.reason, note) : note;
    }

    std::ranges::sort(combined.matched_spans, {}, &MatchedSpan::start);
    return Result<DetectionResult>::ok(std::move(combined));
}

} // namespace promptshield
