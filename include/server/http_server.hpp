#pragma once

#include "core/pipeline.hpp"
#include "config/config_types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace promptshield {

class ShutdownCoordinator;

/**
 * @brief HTTP front end for the shield
 *
 * Routes:
 *   POST /shield_prompt       run one prompt through the pipeline
 *   GET  /api/policy          active policy snapshot
 *   GET  /api/logs?limit=N    recent events, most recent first
 *   GET  /health              liveness + policy version
 *   POST /api/policy/reload   re-read the policy (Bearer admin token)
 *
 * One request per httplib worker thread; handlers share nothing but the
 * pipeline's PolicyStore and EventLogger.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<Pipeline> pipeline,
               ServerConfig config,
               std::string config_path);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Blocks in listen() until stop()
    void start();
    void stop();

    void set_shutdown_coordinator(std::shared_ptr<ShutdownCoordinator> sc) {
        shutdown_coordinator_ = std::move(sc);
    }

    struct HttpStats {
        uint64_t requests;
        uint64_t auth_rejects;
        uint64_t bad_requests;
        uint64_t shutdown_rejects;
    };

    [[nodiscard]] HttpStats get_http_stats() const {
        return {
            requests_.load(std::memory_order_relaxed),
            auth_rejects_.load(std::memory_order_relaxed),
            bad_requests_.load(std::memory_order_relaxed),
            shutdown_rejects_.load(std::memory_order_relaxed)
        };
    }

private:
    // ── Route registration (called from start()) ────────────────────────
    void register_routes(httplib::Server& svr);

    // ── Handler methods (one per endpoint) ──────────────────────────────
    void handle_shield_prompt(const httplib::Request& req, httplib::Response& res);
    void handle_policy(const httplib::Request& req, httplib::Response& res);
    void handle_logs(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_policy_reload(const httplib::Request& req, httplib::Response& res);

    [[nodiscard]] bool require_admin(const httplib::Request& req, httplib::Response& res);

    // ── Members ─────────────────────────────────────────────────────────
    std::shared_ptr<Pipeline> pipeline_;
    const ServerConfig config_;
    const std::string config_path_;

    std::shared_ptr<ShutdownCoordinator> shutdown_coordinator_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> auth_rejects_{0};
    std::atomic<uint64_t> bad_requests_{0};
    std::atomic<uint64_t> shutdown_rejects_{0};
};

} // namespace promptshield
