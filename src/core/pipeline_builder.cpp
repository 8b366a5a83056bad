#include "core/pipeline_builder.hpp"
#include "core/pipeline.hpp"
#include <stdexcept>

namespace promptshield {

std::shared_ptr<Pipeline> PipelineBuilder::build() {
    if (!c_.policy_store) throw std::runtime_error("PipelineBuilder: policy_store is required");
    if (!c_.detection) throw std::runtime_error("PipelineBuilder: detection is required");
    if (!c_.redaction) throw std::runtime_error("PipelineBuilder: redaction is required");
    if (!c_.response_screening) throw std::runtime_error("PipelineBuilder: response_screening is required");
    if (c_.preview_length == 0) throw std::runtime_error("PipelineBuilder: preview_length must be > 0");

    return std::make_shared<Pipeline>(std::move(c_));
}

} // namespace promptshield
