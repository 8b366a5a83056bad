#pragma once

#include "detector/detector.hpp"

#include <memory>
#include <vector>

namespace promptshield {

/**
 * @brief OR-composition of sub-strategies ("hybrid" strategy)
 *
 * Every available sub-detector runs against the same settings.
 * - Decision: Block if any sub-decision is Block, else Flag if any is Flag,
 *   else Allow.
 * - Score: maximum over the sub-scores that were reported.
 * - Reason: the first triggering sub-detector's reason; when some
 *   sub-detectors were unavailable or failed, "degraded:<variants>" is
 *   appended.
 * The composite is available while at least one sub-detector is.
 */
class HybridDetector : public IDetector {
public:
    HybridDetector(DetectorKind kind, std::vector<std::shared_ptr<const IDetector>> parts);

    [[nodiscard]] DetectorKind kind() const override { return kind_; }
    [[nodiscard]] StrategyVariant variant() const override { return StrategyVariant::HYBRID; }
    [[nodiscard]] Availability availability() const override;

    [[nodiscard]] Result<DetectionResult> detect(const DetectionRequest& request) const override;

    /// Decision combination rule (Block > Flag > Allow)
    [[nodiscard]] static Decision combine(Decision a, Decision b);

private:
    DetectorKind kind_;
    std::vector<std::shared_ptr<const IDetector>> parts_;
};

} // namespace promptshield
