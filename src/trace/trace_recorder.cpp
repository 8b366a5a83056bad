#include "trace/trace_recorder.hpp"

namespace promptshield {

const TraceStep& TraceRecorder::append(std::string step_name, StrategyVariant strategy,
                                       StepDecision decision, std::optional<std::string> reason) {
    TraceStep step;
    step.step_name = std::move(step_name);
    step.strategy_used = strategy;
    step.decision = decision;
    step.reason = std::move(reason);
    step.sequence_index = static_cast<uint32_t>(steps_.size());
    steps_.push_back(std::move(step));
    return steps_.back();
}

} // namespace promptshield
