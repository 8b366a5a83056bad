#pragma once

#include "detector/detector.hpp"

#include <array>
#include <memory>
#include <string>
#include <vector>

namespace promptshield {

/**
 * @brief Maps (DetectorKind, StrategyVariant) to a detector instance
 *
 * Populated once at startup and read-only afterwards, so lookups need no
 * locking. PII redaction is composed by the RedactionEngine from the
 * single-capability entries (heuristic patterns, model-based recognizer,
 * backend extraction); validate() checks the capabilities each configured
 * PII strategy needs.
 */
class StrategyRegistry {
public:
    StrategyRegistry() = default;

    /// Replaces any detector already registered for the same pair
    void register_detector(std::shared_ptr<const IDetector> detector);

    [[nodiscard]] Result<std::shared_ptr<const IDetector>> resolve(
        DetectorKind kind, StrategyVariant variant) const;

    [[nodiscard]] bool has(DetectorKind kind, StrategyVariant variant) const;

    /**
     * @brief Check that every enabled detector in the policy resolves
     * @return One message per unresolvable pair (empty when valid)
     */
    [[nodiscard]] std::vector<std::string> validate(const Policy& policy) const;

    /// Variants a PII strategy is composed of
    [[nodiscard]] static std::vector<StrategyVariant> pii_components(StrategyVariant variant);

private:
    static constexpr size_t kKinds = 3;
    static constexpr size_t kVariants = 4;

    void validate_set(const DetectorSet& set, const std::string& side,
                      std::vector<std::string>& errors) const;

    std::array<std::array<std::shared_ptr<const IDetector>, kVariants>, kKinds> table_{};
};

} // namespace promptshield
