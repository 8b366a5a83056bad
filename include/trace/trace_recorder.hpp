#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace promptshield {

/**
 * @brief Per-request, append-only list of decision steps
 *
 * sequence_index is assigned on append (0, 1, 2, ...), so trace order is
 * execution order. Steps cannot be modified or removed once appended.
 *
 * Not thread-safe: one recorder belongs to one request. Concurrent
 * detectors report back to the orchestrator, which appends.
 */
class TraceRecorder {
public:
    const TraceStep& append(std::string step_name, StrategyVariant strategy,
                            StepDecision decision, std::optional<std::string> reason = std::nullopt);

    [[nodiscard]] const std::vector<TraceStep>& steps() const { return steps_; }

    [[nodiscard]] size_t size() const { return steps_.size(); }
    [[nodiscard]] bool empty() const { return steps_.empty(); }

    /// Most recent step, or nullptr
    [[nodiscard]] const TraceStep* last() const {
        return steps_.empty() ? nullptr : &steps_.back();
    }

private:
    std::vector<TraceStep> steps_;
};

} // namespace promptshield
