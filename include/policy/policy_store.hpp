#pragma once

#include "core/error.hpp"
#include "policy/policy.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace promptshield {

/**
 * @brief Holds the active policy snapshot
 *
 * Readers take a PolicySnapshot once per request and use it for the whole
 * request. Writers validate a candidate policy, stamp a new version and
 * swap it in. A failed load never replaces the previous snapshot.
 *
 * Thread-safety: Hot-reloadable via RCU (atomic shared_ptr). Loads and
 * reloads are serialized by reload_mutex_.
 */
class PolicyStore {
public:
    /// Extra validation run before installation (e.g. strategy registration)
    using Validator = std::function<std::vector<std::string>(const Policy&)>;

    PolicyStore() = default;

    void set_validator(Validator validator);

    [[nodiscard]] Result<PolicySnapshot> load(const std::string& config_path);

    [[nodiscard]] Result<PolicySnapshot> load_from_string(const std::string& toml_content);

    /// Same as load(); logged as a reload
    [[nodiscard]] Result<PolicySnapshot> reload(const std::string& config_path);

    /// Validate and install an already-extracted policy
    [[nodiscard]] Result<PolicySnapshot> apply(Policy policy);

    /// Current snapshot, or nullptr before the first successful load
    [[nodiscard]] PolicySnapshot current() const {
        return snapshot_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t version() const;

    struct Stats {
        uint64_t loads_succeeded;
        uint64_t loads_failed;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            loads_succeeded_.load(std::memory_order_relaxed),
            loads_failed_.load(std::memory_order_relaxed)
        };
    }

private:
    Result<PolicySnapshot> install_locked(Policy policy);
    Result<PolicySnapshot> fail_locked(std::string message);

    std::atomic<std::shared_ptr<const Policy>> snapshot_;
    mutable std::mutex reload_mutex_;
    Validator validator_;
    uint64_t next_version_ = 0;

    std::atomic<uint64_t> loads_succeeded_{0};
    std::atomic<uint64_t> loads_failed_{0};
};

} // namespace promptshield
