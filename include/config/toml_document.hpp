#pragma once

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace promptshield::config {

/**
 * @brief Parse a TOML file, resolving `include = "..."` directives and
 *        expanding ${VAR} environment references in every string value.
 *
 * Included files are merged underneath the including file (the including
 * file wins on conflicts). Circular includes and nesting deeper than 10
 * levels are rejected.
 *
 * @throws toml::parse_error or std::runtime_error on failure
 */
[[nodiscard]] toml::table parse_toml_file(const std::string& file_path);

/**
 * @brief Parse TOML content with ${VAR} expansion (no include support).
 * @throws toml::parse_error or std::runtime_error on failure
 */
[[nodiscard]] toml::table parse_toml_string(const std::string& content);

/// Expand ${VAR} references; unset variables expand to the empty string.
[[nodiscard]] std::string expand_env_vars(const std::string& input);

// ---- Extraction helpers ----------------------------------------------------

[[nodiscard]] std::vector<std::string> string_array(const toml::table& tbl, std::string_view key);

[[nodiscard]] std::optional<std::string> optional_string(const toml::table& tbl, std::string_view key);

/// Reads an integer or floating-point value as double.
[[nodiscard]] std::optional<double> optional_number(const toml::table& tbl, std::string_view key);

} // namespace promptshield::config
