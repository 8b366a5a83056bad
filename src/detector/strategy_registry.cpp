#include "detector/strategy_registry.hpp"

#include <format>

namespace promptshield {

void StrategyRegistry::register_detector(std::shared_ptr<const IDetector> detector) {
    if (!detector) return;
    const auto k = static_cast<size_t>(detector->kind());
    const auto v = static_cast<size_t>(detector->variant());
    table_[k][v] = std::move(detector);
}

Result<std::shared_ptr<const IDetector>> StrategyRegistry::resolve(
    DetectorKind kind, StrategyVariant variant) const {
    const auto& entry = table_[static_cast<size_t>(kind)][static_cast<size_t>(variant)];
    if (!entry) {
        return Result<std::shared_ptr<const IDetector>>::error(
            ErrorCategory::UNSUPPORTED_STRATEGY,
            std::format("No '{}' strategy registered for {}",
                        strategy_to_string(variant), detector_kind_to_string(kind)));
    }
    return Result<std::shared_ptr<const IDetector>>::ok(entry);
}

bool StrategyRegistry::has(DetectorKind kind, StrategyVariant variant) const {
    return table_[static_cast<size_t>(kind)][static_cast<size_t>(variant)] != nullptr;
}

std::vector<StrategyVariant> StrategyRegistry::pii_components(StrategyVariant variant) {
    switch (variant) {
        case StrategyVariant::HEURISTIC:
            return {StrategyVariant::HEURISTIC};
        case StrategyVariant::MODEL_BASED:
            return {StrategyVariant::HEURISTIC, StrategyVariant::MODEL_BASED};
        case StrategyVariant::BACKEND_ASSISTED:
            return {StrategyVariant::HEURISTIC, StrategyVariant::BACKEND_ASSISTED};
        case StrategyVariant::HYBRID:
            return {StrategyVariant::HEURISTIC, StrategyVariant::MODEL_BASED,
                    StrategyVariant::BACKEND_ASSISTED};
    }
    return {StrategyVariant::HEURISTIC};
}

void StrategyRegistry::validate_set(const DetectorSet& set, const std::string& side,
                                    std::vector<std::string>& errors) const {
    for (const auto kind : kAllDetectorKinds) {
        const auto& d = set.get(kind);
        if (!d.enabled) continue;

        if (kind == DetectorKind::PII_REDACTION) {
            for (const auto component : pii_components(d.strategy)) {
                if (!has(kind, component)) {
                    errors.push_back(std::format(
                        "{}.{}: strategy '{}' needs the '{}' capability, which is not registered",
                        side, detector_kind_to_string(kind), strategy_to_string(d.strategy),
                        strategy_to_string(component)));
                }
            }
        } else if (!has(kind, d.strategy)) {
            errors.push_back(std::format("{}.{}: unsupported strategy '{}'",
                                         side, detector_kind_to_string(kind),
                                         strategy_to_string(d.strategy)));
        }
    }
}

std::vector<std::string> StrategyRegistry::validate(const Policy& policy) const {
    std::vector<std::string> errors;
    validate_set(policy.input, "detectors", errors);
    if (policy.response_screening.enabled) {
        validate_set(policy.response_screening.detectors, "response_screening.detectors", errors);
    }
    return errors;
}

} // namespace promptshield
