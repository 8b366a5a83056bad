#include "policy/policy_store.hpp"
#include "policy/policy_loader.hpp"
#include "core/utils.hpp"

#include <format>

namespace promptshield {

void PolicyStore::set_validator(Validator validator) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    validator_ = std::move(validator);
}

Result<PolicySnapshot> PolicyStore::load(const std::string& config_path) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    auto result = PolicyLoader::load_from_file(config_path);
    if (!result.success) {
        return fail_locked(std::move(result.error_message));
    }
    return install_locked(std::move(result.policy));
}

Result<PolicySnapshot> PolicyStore::load_from_string(const std::string& toml_content) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    auto result = PolicyLoader::load_from_string(toml_content);
    if (!result.success) {
        return fail_locked(std::move(result.error_message));
    }
    return install_locked(std::move(result.policy));
}

Result<PolicySnapshot> PolicyStore::reload(const std::string& config_path) {
    auto result = load(config_path);
    if (result.is_ok()) {
        utils::log::info(std::format("Policy reloaded: version={}", result.value()->version));
    } else {
        utils::log::warn(std::format("Policy reload rejected, keeping version {}", version()));
    }
    return result;
}

Result<PolicySnapshot> PolicyStore::apply(Policy policy) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    auto errors = PolicyLoader::validate(policy);
    if (!errors.empty()) {
        std::string combined = "Policy validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return fail_locked(std::move(combined));
    }
    return install_locked(std::move(policy));
}

uint64_t PolicyStore::version() const {
    const auto snap = current();
    return snap ? snap->version : 0;
}

Result<PolicySnapshot> PolicyStore::install_locked(Policy policy) {
    if (validator_) {
        const auto errors = validator_(policy);
        if (!errors.empty()) {
            std::string combined = "Policy validation failed:";
            for (const auto& err : errors) { combined += "\n  - "; combined += err; }
            return fail_locked(std::move(combined));
        }
    }

    policy.version = ++next_version_;
    PolicySnapshot snap = std::make_shared<const Policy>(std::move(policy));
    snapshot_.store(snap, std::memory_order_release);
    loads_succeeded_.fetch_add(1, std::memory_order_relaxed);
    return Result<PolicySnapshot>::ok(std::move(snap));
}

Result<PolicySnapshot> PolicyStore::fail_locked(std::string message) {
    loads_failed_.fetch_add(1, std::memory_order_relaxed);
    utils::log::error(message);
    return Result<PolicySnapshot>::error(ErrorCategory::CONFIG_ERROR, std::move(message));
}

} // namespace promptshield
