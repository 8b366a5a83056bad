#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace promptshield {

/**
 * @brief Drains in-flight requests on shutdown and owns per-request cancellation
 *
 * Requests enter and leave through try_enter_request()/leave_request().
 * Each request runs under its own RequestScope, whose stop token fires when
 * the request is cancelled on its own (client went away, explicit cancel) or
 * when cancel_in_flight() trips every scope at once during shutdown.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{10000};
        std::chrono::milliseconds disconnect_poll_interval{50};
    };

    /**
     * @brief Cancellation scope of one request
     *
     * Linked to the coordinator's shutdown token. When a disconnect check is
     * supplied, the coordinator's monitor thread polls it and cancels this
     * scope alone once it reports true. Must not outlive its coordinator.
     */
    class RequestScope {
    public:
        using DisconnectCheck = std::function<bool()>;

        explicit RequestScope(ShutdownCoordinator& owner, DisconnectCheck disconnected = {});
        ~RequestScope();

        RequestScope(const RequestScope&) = delete;
        RequestScope& operator=(const RequestScope&) = delete;

        [[nodiscard]] std::stop_token stop_token() const { return source_.get_token(); }
        [[nodiscard]] bool cancelled() const { return source_.stop_requested(); }
        void cancel() { source_.request_stop(); }

    private:
        friend class ShutdownCoordinator;

        struct Forward {
            std::stop_source* target;
            void operator()() const noexcept { target->request_stop(); }
        };

        ShutdownCoordinator& owner_;
        DisconnectCheck disconnected_;
        std::stop_source source_;
        std::stop_callback<Forward> forward_;
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);
    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    /// Called by signal handler to initiate shutdown
    void initiate_shutdown();

    /// Called at start of each request. Returns false if shutting down.
    [[nodiscard]] bool try_enter_request();

    /// Called when request completes.
    void leave_request();

    /// Blocks until all in-flight requests complete or timeout.
    /// Returns true if drained cleanly, false if timed out.
    [[nodiscard]] bool wait_for_drain();

    /// Cancel every outstanding request (backend calls, backoff sleeps)
    void cancel_in_flight() { shutdown_source_.request_stop(); }

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_relaxed);
    }

    /// Requests cancelled because their client disconnected
    [[nodiscard]] uint64_t disconnect_cancellations() const {
        return disconnects_.load(std::memory_order_relaxed);
    }

private:
    void register_scope(RequestScope* scope);
    void unregister_scope(RequestScope* scope);
    void monitor_loop(std::stop_token stop);

    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::atomic<uint64_t> disconnects_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
    std::stop_source shutdown_source_;

    std::mutex scopes_mutex_;
    std::condition_variable_any scopes_cv_;
    std::vector<RequestScope*> watched_;
    std::jthread monitor_;
};

/// Scoped leave_request()
struct ShutdownGuard {
    ShutdownCoordinator* sc;
    ~ShutdownGuard() { if (sc) sc->leave_request(); }
};

} // namespace promptshield
