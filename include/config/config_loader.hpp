#pragma once

#include "config/config_types.hpp"
#include "policy/policy.hpp"

#include <string>

namespace promptshield {

// ============================================================================
// ShieldConfig - Complete parsed configuration
// ============================================================================

struct ShieldConfig {
    ServerConfig server;
    LoggingConfig logging;
    BackendConfig backend;
    NerConfig ner;
    ConfigWatcherConfig config_watcher;
    Policy policy;      // version is assigned by PolicyStore on installation
};

// ============================================================================
// ConfigLoader - Extract typed config from shield.toml
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        ShieldConfig config;

        static LoadResult ok(ShieldConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load the full configuration from a TOML file
     *
     * Resolves includes and ${VAR} references, extracts every section and
     * validates the policy portion.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);
};

} // namespace promptshield
