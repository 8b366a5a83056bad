#pragma once

#include "core/json.hpp"
#include "core/llm_client.hpp"
#include "detector/detector.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace promptshield {

/**
 * @brief Extract the JSON object from a backend answer
 *
 * Models often wrap JSON in ```json fences or add prose around it; the
 * outermost {...} is taken.
 */
[[nodiscard]] std::optional<JsonValue> extract_json_object(std::string_view content);

/**
 * @brief Backend-assisted screening detector ("llm" strategy)
 *
 * Asks the backend to classify the text and answer with
 * {"score": <0..1>, "reason": "<short>"}. The score goes through the
 * usual threshold rule. Unavailable when the backend has no credential.
 */
class BackendSafetyDetector : public IDetector {
public:
    struct Config {
        std::string model;              // empty = backend default
        uint32_t timeout_ms = 15000;
    };

    BackendSafetyDetector(DetectorKind kind, std::shared_ptr<ILlmBackend> backend);
    BackendSafetyDetector(DetectorKind kind, std::shared_ptr<ILlmBackend> backend, Config config);

    [[nodiscard]] DetectorKind kind() const override { return kind_; }
    [[nodiscard]] StrategyVariant variant() const override { return StrategyVariant::BACKEND_ASSISTED; }
    [[nodiscard]] Availability availability() const override;

    [[nodiscard]] Result<DetectionResult> detect(const DetectionRequest& request) const override;

    [[nodiscard]] static std::string system_prompt(DetectorKind kind);

private:
    DetectorKind kind_;
    std::shared_ptr<ILlmBackend> backend_;
    Config config_;
};

/**
 * @brief Backend-assisted PII extraction
 *
 * Asks the backend for {"entities":[{"text":"...","label":"..."}]} and
 * maps every occurrence of each returned substring to a span. Labels are
 * filtered by entity_types when that list is non-empty.
 */
class BackendPiiDetector : public IDetector {
public:
    BackendPiiDetector(std::shared_ptr<ILlmBackend> backend,
                       BackendSafetyDetector::Config config = {});

    [[nodiscard]] DetectorKind kind() const override { return DetectorKind::PII_REDACTION; }
    [[nodiscard]] StrategyVariant variant() const override { return StrategyVariant::BACKEND_ASSISTED; }
    [[nodiscard]] Availability availability() const override;

    [[nodiscard]] Result<DetectionResult> detect(const DetectionRequest& request) const override;

private:
    std::shared_ptr<ILlmBackend> backend_;
    BackendSafetyDetector::Config config_;
};

} // namespace promptshield
