#pragma once

#include "core/llm_client.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace promptshield::testing {

/**
 * @brief Scripted ILlmBackend for pipeline and detector tests
 *
 * Each complete() call pops the next scripted response; when the script
 * is empty the default response is returned. A configured delay is spent
 * in stop-aware slices so cancellation tests finish quickly.
 */
class MockLlmBackend : public ILlmBackend {
public:
    explicit MockLlmBackend(std::string default_content = "mock completion")
        : default_response_(success(std::move(default_content))) {}

    [[nodiscard]] LlmResponse complete(const LlmRequest& request,
                                       std::stop_token stop) override {
        call_count_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(request);
        }

        const auto deadline = std::chrono::steady_clock::now() + delay_;
        while (std::chrono::steady_clock::now() < deadline) {
            if (stop.stop_requested()) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        if (stop.stop_requested()) {
            LlmResponse cancelled;
            cancelled.error = "Request cancelled";
            cancelled.cancelled = true;
            return cancelled;
        }

        std::lock_guard lock(mutex_);
        if (script_.empty()) return default_response_;
        auto next = std::move(script_.front());
        script_.pop_front();
        return next;
    }

    [[nodiscard]] bool is_available() const override { return available_; }

    [[nodiscard]] std::string unavailable_reason() const override {
        return available_ ? "" : "missing_credential";
    }

    // ---- Scripting ----

    void push(LlmResponse response) {
        std::lock_guard lock(mutex_);
        script_.push_back(std::move(response));
    }

    void push_success(std::string content) { push(success(std::move(content))); }
    void push_failure(std::string error) { push(failure(std::move(error))); }

    void set_default(LlmResponse response) {
        std::lock_guard lock(mutex_);
        default_response_ = std::move(response);
    }

    /// Every call fails as a timeout would
    void fail_always() { set_default(failure("timeout")); }

    void set_available(bool available) { available_ = available; }
    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    [[nodiscard]] uint64_t call_count() const {
        return call_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::vector<LlmRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] static LlmResponse success(std::string content) {
        LlmResponse r;
        r.success = true;
        r.content = std::move(content);
        r.model_used = "mock-model";
        return r;
    }

    [[nodiscard]] static LlmResponse failure(std::string error) {
        LlmResponse r;
        r.error = std::move(error);
        r.model_used = "mock-model";
        return r;
    }

private:
    mutable std::mutex mutex_;
    std::deque<LlmResponse> script_;
    LlmResponse default_response_;
    std::vector<LlmRequest> requests_;
    bool available_ = true;
    std::chrono::milliseconds delay_{0};
    std::atomic<uint64_t> call_count_{0};
};

} // namespace promptshield::testing
