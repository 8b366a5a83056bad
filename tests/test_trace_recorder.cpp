#include <catch2/catch_test_macros.hpp>
#include "trace/trace_recorder.hpp"

using namespace promptshield;

TEST_CASE("TraceRecorder: sequence indices follow append order", "[trace]") {
    TraceRecorder trace;
    CHECK(trace.empty());
    CHECK(trace.last() == nullptr);

    trace.append("prompt_injection", StrategyVariant::HEURISTIC, StepDecision::ALLOW);
    trace.append("harmful_content", StrategyVariant::MODEL_BASED, StepDecision::FLAG,
                 "harmful_content_detected");
    trace.append("pii_redaction", StrategyVariant::HEURISTIC, StepDecision::REDACTED,
                 "redacted_1_entities");

    REQUIRE(trace.size() == 3);
    for (size_t i = 0; i < trace.size(); ++i) {
        CHECK(trace.steps()[i].sequence_index == i);
    }

    CHECK(trace.steps()[0].step_name == "prompt_injection");
    CHECK_FALSE(trace.steps()[0].reason.has_value());
    CHECK(trace.steps()[1].strategy_used == StrategyVariant::MODEL_BASED);
    CHECK(trace.last()->decision == StepDecision::REDACTED);
}

TEST_CASE("TraceRecorder: append returns the stored step", "[trace]") {
    TraceRecorder trace;
    const auto& step = trace.append("llm_generation", StrategyVariant::BACKEND_ASSISTED,
                                    StepDecision::BLOCK, "backend_unavailable_fail_closed");
    CHECK(step.sequence_index == 0);
    CHECK(step.reason == "backend_unavailable_fail_closed");
    CHECK(step_decision_to_string(step.decision) == std::string("block"));
}
