#include "detector/detection_orchestrator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <format>
#include <future>
#include <mutex>
#include <optional>

namespace promptshield {

DetectionOrchestrator::DetectionOrchestrator(std::shared_ptr<const StrategyRegistry> registry)
    : registry_(std::move(registry)) {}

std::vector<DetectorKind> DetectionOrchestrator::effective_order(
    const std::vector<DetectorKind>& order, const DetectorSet& detectors) {
    std::vector<DetectorKind> result;
    const auto add = [&](DetectorKind kind) {
        if (kind == DetectorKind::PII_REDACTION) return;
        if (!detectors.get(kind).enabled) return;
        if (std::ranges::find(result, kind) != result.end()) return;
        result.push_back(kind);
    };
    for (const auto kind : order) add(kind);
    add(DetectorKind::PROMPT_INJECTION);
    add(DetectorKind::HARMFUL_CONTENT);
    return result;
}

DetectionOrchestrator::StepOutcome DetectionOrchestrator::evaluate(
    DetectorKind kind, const DetectorPolicy& settings, std::string_view text,
    const RunOptions& options, std::stop_token stop) const {

    StepOutcome step;
    step.step_name = options.step_prefix + detector_kind_to_string(kind);
    step.strategy = settings.strategy;

    const auto unavailable = [&](const std::string& detail) {
        unavailable_.fetch_add(1, std::memory_order_relaxed);
        if (options.failure.detector_unavailable == FailureMode::CLOSED) {
            step.decision = StepDecision::BLOCK;
            step.reason = std::format("detector_unavailable_fail_closed:{}", detail);
        } else {
            step.decision = StepDecision::ALLOW;
            step.reason = std::format("detector_unavailable:{}", detail);
        }
        return step;
    };

    const auto detector = registry_->resolve(kind, settings.strategy);
    if (detector.is_error()) {
        return unavailable("unsupported_strategy");
    }

    // A throwing detector counts as unavailable; nothing escapes to the caller
    std::optional<Result<DetectionResult>> outcome;
    try {
        const auto avail = detector.value()->availability();
        if (!avail.available) {
            return unavailable(avail.reason);
        }
        outcome.emplace(detector.value()->detect(DetectionRequest{text, settings, stop}));
    } catch (const std::exception& e) {
        utils::log::warn(std::format("{} detector threw: {}", step.step_name, e.what()));
        return unavailable(e.what());
    }

    const auto& result = *outcome;
    if (result.is_error()) {
        utils::log::warn(std::format("{} detector error: {}", step.step_name, result.error_message()));
        return unavailable(result.error_message());
    }

    const auto& r = result.value();
    step.decision = to_step_decision(r.decision);
    step.reason = r.reason;
    return step;
}

bool DetectionOrchestrator::record(StepOutcome step, TraceRecorder& trace,
                                   ScreeningOutcome& outcome) const {
    const bool is_block = step.decision == StepDecision::BLOCK;
    if (step.decision == StepDecision::FLAG) ++outcome.flagged;

    const auto& appended = trace.append(std::move(step.step_name), step.strategy,
                                        step.decision, std::move(step.reason));
    if (!is_block) return false;

    blocks_.fetch_add(1, std::memory_order_relaxed);
    outcome.decision = Decision::BLOCK;
    outcome.reason = appended.reason.value_or(appended.step_name);
    outcome.blocking_step = appended.step_name;
    return true;
}

ScreeningOutcome DetectionOrchestrator::run(std::string_view text, const DetectorSet& detectors,
                                            const RunOptions& options, TraceRecorder& trace,
                                            std::stop_token stop) const {
    runs_.fetch_add(1, std::memory_order_relaxed);
    const auto order = effective_order(options.order, detectors);

    if (options.parallel && order.size() > 1) {
        return run_parallel(text, detectors, order, options, trace, std::move(stop));
    }
    return run_sequential(text, detectors, order, options, trace, std::move(stop));
}

ScreeningOutcome DetectionOrchestrator::run_sequential(
    std::string_view text, const DetectorSet& detectors, const std::vector<DetectorKind>& order,
    const RunOptions& options, TraceRecorder& trace, std::stop_token stop) const {

    ScreeningOutcome outcome;
    for (const auto kind : order) {
        if (stop.stop_requested()) {
            cancelled_.fetch_add(1, std::memory_order_relaxed);
            break;
        }
        if (record(evaluate(kind, detectors.get(kind), text, options, stop), trace, outcome)) {
            break;
        }
    }
    return outcome;
}

ScreeningOutcome DetectionOrchestrator::run_parallel(
    std::string_view text, const DetectorSet& detectors, const std::vector<DetectorKind>& order,
    const RunOptions& options, TraceRecorder& trace, std::stop_token stop) const {

    // Siblings share one stop source, linked to the request's own token
    std::stop_source siblings;
    std::stop_callback forward(stop, [&siblings] { siblings.request_stop(); });

    std::mutex mu;
    std::condition_variable cv;
    std::deque<StepOutcome> completed;

    std::vector<std::future<void>> tasks;
    tasks.reserve(order.size());
    for (const auto kind : order) {
        tasks.push_back(std::async(std::launch::async, [&, kind] {
            auto step = evaluate(kind, detectors.get(kind), text, options, siblings.get_token());
            {
                std::lock_guard<std::mutex> lock(mu);
                completed.push_back(std::move(step));
            }
            cv.notify_one();
        }));
    }

    ScreeningOutcome outcome;
    bool terminal = false;
    for (size_t received = 0; received < order.size(); ++received) {
        StepOutcome step;
        {
            std::unique_lock<std::mutex> lock(mu);
            cv.wait(lock, [&] { return !completed.empty(); });
            step = std::move(completed.front());
            completed.pop_front();
        }
        if (terminal) continue;     // finished after the block: discarded
        if (siblings.stop_requested()) {
            cancelled_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        if (record(std::move(step), trace, outcome)) {
            terminal = true;
            siblings.request_stop();
        }
    }

    for (auto& task : tasks) task.get();
    return outcome;
}

} // namespace promptshield
