#include "server/shutdown_coordinator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace promptshield {

// ============================================================================
// RequestScope
// ============================================================================

ShutdownCoordinator::RequestScope::RequestScope(ShutdownCoordinator& owner,
                                                DisconnectCheck disconnected)
    : owner_(owner),
      disconnected_(std::move(disconnected)),
      forward_(owner.shutdown_source_.get_token(), Forward{&source_}) {
    owner_.register_scope(this);
}

ShutdownCoordinator::RequestScope::~RequestScope() {
    owner_.unregister_scope(this);
}

// ============================================================================
// Coordinator
// ============================================================================

ShutdownCoordinator::ShutdownCoordinator() = default;

ShutdownCoordinator::ShutdownCoordinator(const Config& config)
    : config_(config) {}

ShutdownCoordinator::~ShutdownCoordinator() {
    if (monitor_.joinable()) {
        monitor_.request_stop();
        monitor_.join();
    }
}

void ShutdownCoordinator::initiate_shutdown() {
    shutting_down_.store(true, std::memory_order_release);
    std::lock_guard lock(drain_mutex_);
    drain_cv_.notify_all();
}

bool ShutdownCoordinator::try_enter_request() {
    if (shutting_down_.load(std::memory_order_acquire)) {
        return false;
    }
    in_flight_.fetch_add(1, std::memory_order_acq_rel);
    // Re-check after the increment; initiate_shutdown may have run in between
    if (shutting_down_.load(std::memory_order_acquire)) {
        leave_request();
        return false;
    }
    return true;
}

void ShutdownCoordinator::leave_request() {
    const uint32_t prev = in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    if (prev == 1 && shutting_down_.load(std::memory_order_acquire)) {
        std::lock_guard lock(drain_mutex_);
        drain_cv_.notify_all();
    }
}

bool ShutdownCoordinator::wait_for_drain() {
    std::unique_lock lock(drain_mutex_);
    return drain_cv_.wait_for(lock, config_.shutdown_timeout, [this] {
        return in_flight_.load(std::memory_order_acquire) == 0;
    });
}

// ============================================================================
// Disconnect monitor
// ============================================================================

void ShutdownCoordinator::register_scope(RequestScope* scope) {
    if (!scope->disconnected_) return;

    std::lock_guard lock(scopes_mutex_);
    watched_.push_back(scope);
    if (!monitor_.joinable()) {
        monitor_ = std::jthread([this](std::stop_token stop) { monitor_loop(stop); });
    }
}

void ShutdownCoordinator::unregister_scope(RequestScope* scope) {
    if (!scope->disconnected_) return;

    std::lock_guard lock(scopes_mutex_);
    std::erase(watched_, scope);
}

void ShutdownCoordinator::monitor_loop(std::stop_token stop) {
    std::unique_lock lock(scopes_mutex_);
    while (!stop.stop_requested()) {
        for (auto* scope : watched_) {
            if (scope->cancelled()) continue;
            bool gone = false;
            try {
                gone = scope->disconnected_();
            } catch (const std::exception& e) {
                utils::log::warn(std::format("Disconnect check failed: {}", e.what()));
            }
            if (gone) {
                scope->cancel();
                disconnects_.fetch_add(1, std::memory_order_relaxed);
            }
        }
        // Scopes only unregister while this lock is released
        scopes_cv_.wait_for(lock, stop, config_.disconnect_poll_interval, [] { return false; });
    }
}

} // namespace promptshield
