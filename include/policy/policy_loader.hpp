#pragma once

#include "policy/policy.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace promptshield {

/**
 * @brief Policy loader from TOML configuration
 *
 * Reads the [detection], [detectors.*], [response_screening],
 * [failure_policy], [retry] and [backend] sections of shield.toml.
 * Validates:
 * - Strategy names (heuristic | ml | llm | hybrid)
 * - Thresholds within [0, 1]
 * - Actions (block | flag) and failure modes (open | closed)
 * - Detection order entries
 * - Entity types present when named-entity redaction is configured
 * - Regex patterns compile
 * - Retry bounds
 *
 * Cross-checks against registered strategies happen in PolicyStore.
 */
class PolicyLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        Policy policy;

        static LoadResult ok(Policy p) {
            LoadResult result;
            result.success = true;
            result.policy = std::move(p);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Extract and validate a policy from an already-parsed document
    [[nodiscard]] static LoadResult from_table(const toml::table& root);

    /// Structural validation; returns one message per problem
    [[nodiscard]] static std::vector<std::string> validate(const Policy& policy);

private:
    static void extract_detector(const toml::table& tbl, DetectorPolicy& out,
                                 const std::string& path, std::vector<std::string>& errors);
    static void extract_detector_set(const toml::table* tbl, DetectorSet& out,
                                     const std::string& path, std::vector<std::string>& errors);

    static std::optional<Decision> parse_action(const std::string& action_str);
    static std::optional<FailureMode> parse_failure_mode(const std::string& mode_str);
};

} // namespace promptshield
