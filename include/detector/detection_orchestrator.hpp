#pragma once

#include "detector/strategy_registry.hpp"
#include "trace/trace_recorder.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace promptshield {

/**
 * @brief Terminal outcome of one screening run
 */
struct ScreeningOutcome {
    Decision decision = Decision::ALLOW;    // ALLOW or BLOCK
    std::string reason;                     // reason of the blocking step
    std::string blocking_step;
    size_t flagged = 0;                     // FLAG steps recorded

    [[nodiscard]] bool blocked() const { return decision == Decision::BLOCK; }
};

/**
 * @brief Runs the screening detectors (prompt injection, harmful content)
 *
 * Sequential mode evaluates detectors in policy order and stops at the
 * first Block. Parallel mode starts all of them at once, appends steps in
 * completion order and cancels the rest on the first Block; cancelled
 * results are discarded.
 *
 * Unavailable detectors follow FailurePolicy::detector_unavailable:
 * - open:   step Allow, reason "detector_unavailable:<detail>"
 * - closed: step Block, reason "detector_unavailable_fail_closed:<detail>"
 *
 * The same instance serves the input and the response side; only the
 * detector set and the step-name prefix differ.
 */
class DetectionOrchestrator {
public:
    explicit DetectionOrchestrator(std::shared_ptr<const StrategyRegistry> registry);

    struct RunOptions {
        std::vector<DetectorKind> order;
        FailurePolicy failure;
        bool parallel = false;
        std::string step_prefix;            // "" on input, "response_" on output
    };

    [[nodiscard]] ScreeningOutcome run(std::string_view text,
                                       const DetectorSet& detectors,
                                       const RunOptions& options,
                                       TraceRecorder& trace,
                                       std::stop_token stop) const;

    /// Enabled screening kinds: the configured order first, then any
    /// remaining enabled kinds in their default order
    [[nodiscard]] static std::vector<DetectorKind> effective_order(
        const std::vector<DetectorKind>& order, const DetectorSet& detectors);

    struct Stats {
        uint64_t runs;
        uint64_t blocks;
        uint64_t unavailable;
        uint64_t cancelled;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            runs_.load(std::memory_order_relaxed),
            blocks_.load(std::memory_order_relaxed),
            unavailable_.load(std::memory_order_relaxed),
            cancelled_.load(std::memory_order_relaxed)
        };
    }

private:
    /// One evaluated detector, ready to be appended to the trace
    struct StepOutcome {
        std::string step_name;
        StrategyVariant strategy = StrategyVariant::HEURISTIC;
        StepDecision decision = StepDecision::ALLOW;
        std::optional<std::string> reason;
    };

    [[nodiscard]] StepOutcome evaluate(DetectorKind kind, const DetectorPolicy& settings,
                                       std::string_view text, const RunOptions& options,
                                       std::stop_token stop) const;

    ScreeningOutcome run_sequential(std::string_view text, const DetectorSet& detectors,
                                    const std::vector<DetectorKind>& order,
                                    const RunOptions& options, TraceRecorder& trace,
                                    std::stop_token stop) const;

    ScreeningOutcome run_parallel(std::string_view text, const DetectorSet& detectors,
                                  const std::vector<DetectorKind>& order,
                                  const RunOptions& options, TraceRecorder& trace,
                                  std::stop_token stop) const;

    /// Append to the trace and fold into the outcome; true when terminal
    bool record(StepOutcome step, TraceRecorder& trace, ScreeningOutcome& outcome) const;

    std::shared_ptr<const StrategyRegistry> registry_;

    mutable std::atomic<uint64_t> runs_{0};
    mutable std::atomic<uint64_t> blocks_{0};
    mutable std::atomic<uint64_t> unavailable_{0};
    mutable std::atomic<uint64_t> cancelled_{0};
};

} // namespace promptshield
