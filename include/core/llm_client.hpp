#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>

namespace promptshield {

// LLM use case types
enum class LlmUseCase : uint8_t {
    GENERATION,
    SAFETY_CLASSIFICATION,
    PII_EXTRACTION
};

[[nodiscard]] inline const char* llm_use_case_to_string(LlmUseCase uc) {
    switch (uc) {
        case LlmUseCase::GENERATION:            return "generation";
        case LlmUseCase::SAFETY_CLASSIFICATION: return "safety_classification";
        case LlmUseCase::PII_EXTRACTION:        return "pii_extraction";
        default:                                return "unknown";
    }
}

struct LlmRequest {
    LlmUseCase use_case = LlmUseCase::GENERATION;
    std::string system_prompt;
    std::string prompt;
    std::string model;              // empty = client default
    double temperature = 0.3;
    int max_tokens = 2048;
    uint32_t timeout_ms = 0;        // 0 = client default
};

struct LlmResponse {
    bool success = false;
    std::string content;
    std::string error;
    std::string model_used;
    bool cancelled = false;
    std::chrono::milliseconds latency{0};
};

/**
 * @brief Narrow interface to the generative backend.
 *
 * One call is one attempt. Retries, backoff and fail-open/fail-closed
 * decisions belong to the caller. Implementations must honor the stop
 * token by aborting any in-flight network I/O.
 */
class ILlmBackend {
public:
    virtual ~ILlmBackend() = default;

    [[nodiscard]] virtual LlmResponse complete(const LlmRequest& request,
                                               std::stop_token stop) = 0;

    /// Capability check: false when no credential or endpoint is configured.
    [[nodiscard]] virtual bool is_available() const = 0;

    /// Human-readable reason when is_available() is false.
    [[nodiscard]] virtual std::string unavailable_reason() const = 0;
};

/**
 * @brief HTTP client for Gemini, OpenAI-compatible and Anthropic APIs.
 *
 * Features:
 * - Provider-specific request/response formats
 * - Rate limiting on outbound calls
 * - Cooperative cancellation through std::stop_token
 */
class LlmClient : public ILlmBackend {
public:
    struct Config {
        bool enabled = true;
        std::string provider = "gemini";   // gemini | openai | anthropic
        std::string endpoint = "https://generativelanguage.googleapis.com";
        std::string api_key;
        std::string default_model = "gemini-2.5-flash";
        uint32_t timeout_ms = 30000;
        uint32_t max_requests_per_minute = 60;
    };

    LlmClient();
    explicit LlmClient(Config config);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    [[nodiscard]] LlmResponse complete(const LlmRequest& request,
                                       std::stop_token stop) override;

    [[nodiscard]] bool is_available() const override;
    [[nodiscard]] std::string unavailable_reason() const override;

    // Request body / response parsing (exposed for testing)
    [[nodiscard]] static std::string build_request_body(const std::string& provider,
                                                        const std::string& model,
                                                        const LlmRequest& request);
    [[nodiscard]] static std::string extract_content(const std::string& body,
                                                     const std::string& provider);

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
        uint64_t rate_limited = 0;
        uint64_t cancelled = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] LlmResponse call_api(const LlmRequest& request,
                                       const std::string& model,
                                       std::stop_token stop);

    [[nodiscard]] bool check_rate_limit();

    Config config_;

    // Rate limiting
    std::atomic<uint32_t> requests_this_minute_{0};
    std::chrono::steady_clock::time_point minute_start_ =
        std::chrono::steady_clock::now();
    std::mutex rate_mutex_;

    // Stats
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> cancelled_{0};
};

} // namespace promptshield
