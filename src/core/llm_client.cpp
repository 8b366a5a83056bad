#include "core/llm_client.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace promptshield {

// ============================================================================
// Construction
// ============================================================================

LlmClient::LlmClient() = default;

LlmClient::LlmClient(Config config)
    : config_(std::move(config)) {}

bool LlmClient::is_available() const {
    return config_.enabled && !config_.api_key.empty() && !config_.endpoint.empty();
}

std::string LlmClient::unavailable_reason() const {
    if (!config_.enabled) return "backend_disabled";
    if (config_.api_key.empty()) return "missing_credential";
    if (config_.endpoint.empty()) return "missing_endpoint";
    return "";
}

// ============================================================================
// Rate Limiting
// ============================================================================

bool LlmClient::check_rate_limit() {
    std::lock_guard lock(rate_mutex_);
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - minute_start_);

    if (elapsed.count() >= 60) {
        minute_start_ = now;
        requests_this_minute_.store(0, std::memory_order_relaxed);
    }

    const uint32_t current = requests_this_minute_.load(std::memory_order_relaxed);
    if (current >= config_.max_requests_per_minute) {
        return false;
    }

    requests_this_minute_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

// ============================================================================
// Core API
// ============================================================================

LlmResponse LlmClient::complete(const LlmRequest& request, std::stop_token stop) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    const auto model = request.model.empty() ? config_.default_model : request.model;

    if (!config_.enabled) {
        return {false, "", "LLM client is disabled", model, false, {}};
    }

    if (stop.stop_requested()) {
        cancelled_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "Request cancelled", model, true, {}};
    }

    if (!check_rate_limit()) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "Rate limited: too many LLM API requests", model, false, {}};
    }

    return call_api(request, model, std::move(stop));
}

// ============================================================================
// Request / Response Formats
// ============================================================================

std::string LlmClient::build_request_body(const std::string& provider,
                                          const std::string& model,
                                          const LlmRequest& request) {
    if (provider == "gemini") {
        std::string body = "{";
        if (!request.system_prompt.empty()) {
            body += std::format(R"("system_instruction":{{"parts":[{{"text":"{}"}}]}},)",
                                utils::escape_json(request.system_prompt));
        }
        body += std::format(
            R"("contents":[{{"role":"user","parts":[{{"text":"{}"}}]}}],)"
            R"("generationConfig":{{"temperature":{},"maxOutputTokens":{}}}}})",
            utils::escape_json(request.prompt), request.temperature, request.max_tokens);
        return body;
    }

    if (provider == "anthropic") {
        return std::format(
            R"({{"model":"{}","max_tokens":{},"system":"{}","messages":[{{"role":"user","content":"{}"}}]}})",
            utils::escape_json(model), request.max_tokens,
            utils::escape_json(request.system_prompt),
            utils::escape_json(request.prompt));
    }

    // OpenAI-compatible
    std::string messages;
    if (!request.system_prompt.empty()) {
        messages = std::format(R"({{"role":"system","content":"{}"}},)",
                               utils::escape_json(request.system_prompt));
    }
    messages += std::format(R"({{"role":"user","content":"{}"}})",
                            utils::escape_json(request.prompt));
    return std::format(
        R"({{"model":"{}","temperature":{},"max_tokens":{},"messages":[{}]}})",
        utils::escape_json(model), request.temperature, request.max_tokens, messages);
}

std::string LlmClient::extract_content(const std::string& body, const std::string& provider) {
    const auto parsed = JsonValue::try_parse(body);
    if (!parsed) return "";
    const auto& root = *parsed;

    JsonValue text;
    if (provider == "gemini") {
        // {"candidates":[{"content":{"parts":[{"text":"..."}]}}]}
        const auto parts = root["candidates"][size_t{0}]["content"]["parts"];
        std::string joined;
        parts.for_each_element([&joined](const JsonValue& part) {
            if (auto t = part.get_string("text")) joined += *t;
        });
        return joined;
    } else if (provider == "anthropic") {
        // {"content":[{"type":"text","text":"..."}]}
        text = root["content"][size_t{0}]["text"];
    } else {
        // {"choices":[{"message":{"content":"..."}}]}
        text = root["choices"][size_t{0}]["message"]["content"];
    }
    return text.is_string() ? text.get<std::string>() : "";
}

// ============================================================================
// API Call
// ============================================================================

LlmResponse LlmClient::call_api(const LlmRequest& request,
                                const std::string& model,
                                std::stop_token stop) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);
    utils::Timer timer;

    if (config_.api_key.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "No API key configured", model, false, {}};
    }

    if (config_.endpoint.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "No endpoint configured", model, false, {}};
    }

    const std::string json_body = build_request_body(config_.provider, model, request);

    httplib::Client cli(config_.endpoint);
    const auto timeout = std::chrono::milliseconds(
        request.timeout_ms > 0 ? request.timeout_ms : config_.timeout_ms);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    httplib::Headers headers;
    std::string path;

    if (config_.provider == "gemini") {
        headers = {{"x-goog-api-key", config_.api_key}};
        path = std::format("/v1beta/models/{}:generateContent", model);
    } else if (config_.provider == "anthropic") {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"}
        };
        path = "/v1/messages";
    } else {
        headers = {{"Authorization", "Bearer " + config_.api_key}};
        path = "/v1/chat/completions";
    }

    // Abort the socket if the request is cancelled mid-flight
    std::stop_callback on_stop(stop, [&cli] { cli.stop(); });

    const auto res = cli.Post(path, headers, json_body, "application/json");

    if (stop.stop_requested()) {
        cancelled_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "Request cancelled", model, true, timer.elapsed_ms()};
    }

    if (!res) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "",
                std::format("HTTP request failed: {}", httplib::to_string(res.error())),
                model, false, timer.elapsed_ms()};
    }

    if (res->status != httplib::StatusCode::OK_200) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("LLM API error: HTTP {} - {}", res->status,
                                     res->body.substr(0, 200)));
        return {false, "", std::format("API error: HTTP {}", res->status),
                model, false, timer.elapsed_ms()};
    }

    auto content = extract_content(res->body, config_.provider);
    if (content.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "API response contained no text", model, false, timer.elapsed_ms()};
    }

    return {true, std::move(content), "", model, false, timer.elapsed_ms()};
}

// ============================================================================
// Stats
// ============================================================================

LlmClient::Stats LlmClient::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        rate_limited_.load(std::memory_order_relaxed),
        cancelled_.load(std::memory_order_relaxed)
    };
}

} // namespace promptshield
