#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/json_responses.hpp"
#include "server/shutdown_coordinator.hpp"
#include "audit/event_logger.hpp"
#include "core/utils.hpp"
#include "policy/policy_store.hpp"

#include <openssl/crypto.h>

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <optional>
#include <string_view>

namespace promptshield {

namespace {

/// Constant-time string comparison to prevent timing attacks on secret tokens.
bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        // Still do a dummy comparison to avoid leaking length via timing.
        volatile unsigned char dummy = 0;
        for (size_t i = 0; i < b.size(); ++i) dummy |= b[i];
        (void)dummy;
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void send_json(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_content(body, http::kJsonContentType);
}

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<Pipeline> pipeline,
                       ServerConfig config,
                       std::string config_path)
    : pipeline_(std::move(pipeline)),
      config_(std::move(config)),
      config_path_(std::move(config_path)) {}

HttpServer::~HttpServer() = default;

// ============================================================================
// start(): creates server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    httplib::Server* svr = nullptr;
    {
        std::lock_guard lock(server_mutex_);
        server_ = std::make_unique<httplib::Server>();
        svr = server_.get();
    }

    // Configure thread pool size
    const size_t pool_size = config_.threads;
    svr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr->set_payload_max_length(config_.max_body_bytes);

    svr->set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                  std::exception_ptr ep) {
        std::string what = "unknown";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        utils::log::error(std::format("Unhandled error on {} {}: {}", req.method, req.path, what));
        send_json(res, httplib::StatusCode::InternalServerError_500,
                  json_responses::error_json("internal error"));
    });

    register_routes(*svr);

    utils::log::info(std::format("Starting Prompt Shield on {}:{} ({} threads)",
        config_.host, config_.port, config_.threads));

    if (!svr->listen(config_.host, config_.port)) {
        throw std::runtime_error(std::format("Failed to listen on {}:{}", config_.host, config_.port));
    }
}

void HttpServer::stop() {
    std::lock_guard lock(server_mutex_);
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Post(http::kShieldPromptRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_shield_prompt(req, res);
    });
    svr.Get(http::kPolicyRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_policy(req, res);
    });
    svr.Get(http::kLogsRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_logs(req, res);
    });
    svr.Get(http::kHealthRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Post(http::kPolicyReloadRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_policy_reload(req, res);
    });
}

bool HttpServer::require_admin(const httplib::Request& req, httplib::Response& res) {
    if (config_.admin_token.empty()) return true;
    const auto auth = req.get_header_value(http::kAuthorizationHeader);
    if (auth.size() <= http::kBearerPrefix.size() ||
        std::string_view(auth).substr(0, http::kBearerPrefix.size()) != http::kBearerPrefix ||
        !constant_time_equals(std::string_view(auth).substr(http::kBearerPrefix.size()),
                              config_.admin_token)) {
        auth_rejects_.fetch_add(1, std::memory_order_relaxed);
        send_json(res, httplib::StatusCode::Unauthorized_401,
                  json_responses::error_json("unauthorized"));
        return false;
    }
    return true;
}

// ============================================================================
// Handler: POST /shield_prompt
// ============================================================================

void HttpServer::handle_shield_prompt(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_coordinator_ && !shutdown_coordinator_->try_enter_request()) {
        shutdown_rejects_.fetch_add(1, std::memory_order_relaxed);
        send_json(res, httplib::StatusCode::ServiceUnavailable_503,
                  json_responses::error_json("server shutting down"));
        return;
    }
    ShutdownGuard shutdown_guard{shutdown_coordinator_.get()};

    try {
        const auto prompt = json_responses::extract_prompt(req.body);
        if (!prompt) {
            bad_requests_.fetch_add(1, std::memory_order_relaxed);
            send_json(res, httplib::StatusCode::BadRequest_400,
                      json_responses::error_json("request body must be a JSON object with a string \"prompt\""));
            return;
        }

        ShieldRequest request;
        request.request_id = utils::generate_uuid();
        request.prompt = *prompt;

        // Cancelled on its own when this client disconnects, or with the rest at shutdown
        std::optional<ShutdownCoordinator::RequestScope> scope;
        if (shutdown_coordinator_) {
            scope.emplace(*shutdown_coordinator_, [&req] { return req.is_connection_closed(); });
        }
        const auto response = pipeline_->execute(request,
                                                  scope ? scope->stop_token() : std::stop_token{});

        if (response.status == ShieldStatus::ERROR &&
            response.error_category == ErrorCategory::VALIDATION_ERROR) {
            bad_requests_.fetch_add(1, std::memory_order_relaxed);
        }
        send_json(res, json_responses::http_status_for(response),
                  json_responses::shield_response_to_json(response));

    } catch (const std::exception& e) {
        // Details stay in the process log
        utils::log::error(std::format("shield_prompt failed: {}", e.what()));
        send_json(res, httplib::StatusCode::InternalServerError_500,
                  json_responses::error_json("internal error"));
    }
}

// ============================================================================
// Handler: GET /api/policy
// ============================================================================

void HttpServer::handle_policy(const httplib::Request&, httplib::Response& res) {
    const auto policy = pipeline_->get_policy_store()->current();
    if (!policy) {
        send_json(res, httplib::StatusCode::ServiceUnavailable_503,
                  json_responses::error_json("no active policy"));
        return;
    }
    send_json(res, httplib::StatusCode::OK_200, json_responses::policy_to_json(*policy));
}

// ============================================================================
// Handler: GET /api/logs
// ============================================================================

void HttpServer::handle_logs(const httplib::Request& req, httplib::Response& res) {
    const auto limit = json_responses::parse_limit(req.get_param_value("limit"));
    if (!limit) {
        bad_requests_.fetch_add(1, std::memory_order_relaxed);
        send_json(res, httplib::StatusCode::BadRequest_400,
                  json_responses::error_json("limit must be a positive integer"));
        return;
    }

    const auto logger = pipeline_->get_event_logger();
    if (!logger) {
        send_json(res, httplib::StatusCode::OK_200, json_responses::events_to_json({}));
        return;
    }

    try {
        send_json(res, httplib::StatusCode::OK_200,
                  json_responses::events_to_json(logger->query(*limit)));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Event log query failed: {}", e.what()));
        send_json(res, httplib::StatusCode::InternalServerError_500,
                  json_responses::error_json("failed to read event log"));
    }
}

// ============================================================================
// Handler: GET /health
// ============================================================================

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    const auto version = pipeline_->get_policy_store()->version();
    send_json(res, httplib::StatusCode::OK_200,
              std::format(R"({{"status":"ok","policy_version":{}}})", version));
}

// ============================================================================
// Handler: POST /api/policy/reload
// ============================================================================

void HttpServer::handle_policy_reload(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(req, res)) return;

    const auto result = pipeline_->get_policy_store()->reload(config_path_);
    if (result.is_error()) {
        send_json(res, httplib::StatusCode::BadRequest_400,
                  json_responses::error_json(result.error_message()));
        return;
    }

    send_json(res, httplib::StatusCode::OK_200,
              std::format(R"({{"status":"ok","policy_version":{}}})", result.value()->version));
}

} // namespace promptshield
