#pragma once

#include "detector/detector.hpp"

#include <map>
#include <string>

namespace promptshield {

/**
 * @brief Local weighted lexical model ("ml" strategy)
 *
 * Logistic regression over phrase-presence features:
 *   score = sigmoid(bias + sum(weight[f] for each phrase f present))
 * Weights and bias ship with the binary and can be overridden per detector
 * through `model_weights` / `model_bias` in the policy. Runs in-process,
 * so it is always available.
 */
class LexicalModelDetector : public IDetector {
public:
    struct Model {
        std::map<std::string, double> weights;
        double bias = -3.0;
    };

    LexicalModelDetector(DetectorKind kind, Model model);

    /// Built-in model for prompt injection or harmful content
    [[nodiscard]] static Model default_model(DetectorKind kind);

    [[nodiscard]] DetectorKind kind() const override { return kind_; }
    [[nodiscard]] StrategyVariant variant() const override { return StrategyVariant::MODEL_BASED; }
    [[nodiscard]] Availability availability() const override { return Availability::yes(); }

    [[nodiscard]] Result<DetectionResult> detect(const DetectionRequest& request) const override;

    [[nodiscard]] static double sigmoid(double z);

private:
    DetectorKind kind_;
    Model model_;
};

} // namespace promptshield
