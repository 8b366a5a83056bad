#include "config/config_loader.hpp"
#include "config/toml_document.hpp"
#include "policy/policy_loader.hpp"

#include <format>
#include <limits>

namespace promptshield {

namespace {

template <typename T>
void read_unsigned(const toml::table& tbl, std::string_view key, T& out,
                   const std::string& section, std::vector<std::string>& errors) {
    if (!tbl.contains(key)) return;
    const auto v = tbl[key].value<int64_t>();
    if (!v || *v < 0 || static_cast<uint64_t>(*v) > std::numeric_limits<T>::max()) {
        errors.push_back(std::format("{}.{} must be a non-negative integer in range", section, key));
        return;
    }
    out = static_cast<T>(*v);
}

void extract_server(const toml::table& root, ServerConfig& cfg, std::vector<std::string>& errors) {
    const auto* tbl = root["server"].as_table();
    if (!tbl) return;
    cfg.host = (*tbl)["host"].value_or(cfg.host);
    read_unsigned(*tbl, "port", cfg.port, "server", errors);
    read_unsigned(*tbl, "threads", cfg.threads, "server", errors);
    read_unsigned(*tbl, "max_prompt_length", cfg.max_prompt_length, "server", errors);
    read_unsigned(*tbl, "max_body_bytes", cfg.max_body_bytes, "server", errors);
    read_unsigned(*tbl, "shutdown_timeout_ms", cfg.shutdown_timeout_ms, "server", errors);
    read_unsigned(*tbl, "disconnect_poll_ms", cfg.disconnect_poll_ms, "server", errors);
    cfg.admin_token = (*tbl)["admin_token"].value_or(cfg.admin_token);

    if (cfg.threads == 0) errors.emplace_back("server.threads must be > 0");
    if (cfg.disconnect_poll_ms == 0) errors.emplace_back("server.disconnect_poll_ms must be > 0");
    if (cfg.max_prompt_length == 0) errors.emplace_back("server.max_prompt_length must be > 0");
}

void extract_logging(const toml::table& root, LoggingConfig& cfg, std::vector<std::string>& errors) {
    const auto* tbl = root["logging"].as_table();
    if (!tbl) return;
    cfg.event_log = (*tbl)["event_log"].value_or(cfg.event_log);
    read_unsigned(*tbl, "preview_length", cfg.preview_length, "logging", errors);
    cfg.integrity_enabled = (*tbl)["integrity"].value_or(cfg.integrity_enabled);
    read_unsigned(*tbl, "max_file_size_mb", cfg.max_file_size_mb, "logging", errors);
    cfg.max_files = static_cast<int>((*tbl)["max_files"].value_or(int64_t{cfg.max_files}));
    read_unsigned(*tbl, "rotation_interval_hours", cfg.rotation_interval_hours, "logging", errors);
    cfg.mirror_to_stderr = (*tbl)["mirror_to_stderr"].value_or(cfg.mirror_to_stderr);
    read_unsigned(*tbl, "buffer_capacity", cfg.buffer_capacity, "logging", errors);
    read_unsigned(*tbl, "flush_interval_ms", cfg.flush_interval_ms, "logging", errors);

    if (cfg.event_log.empty()) errors.emplace_back("logging.event_log must not be empty");
    if (cfg.preview_length == 0) errors.emplace_back("logging.preview_length must be > 0");
    if (cfg.max_files < 1) errors.emplace_back("logging.max_files must be >= 1");
    if (cfg.buffer_capacity < 2) errors.emplace_back("logging.buffer_capacity must be >= 2");
}

void extract_backend(const toml::table& root, BackendConfig& cfg, std::vector<std::string>& errors) {
    const auto* tbl = root["backend"].as_table();
    if (!tbl) return;
    cfg.enabled = (*tbl)["enabled"].value_or(cfg.enabled);
    cfg.provider = (*tbl)["provider"].value_or(cfg.provider);
    cfg.endpoint = (*tbl)["endpoint"].value_or(cfg.endpoint);
    cfg.api_key = (*tbl)["api_key"].value_or(cfg.api_key);
    cfg.model = (*tbl)["model"].value_or(cfg.model);
    read_unsigned(*tbl, "timeout_ms", cfg.timeout_ms, "backend", errors);
    read_unsigned(*tbl, "max_requests_per_minute", cfg.max_requests_per_minute, "backend", errors);

    if (cfg.provider != "gemini" && cfg.provider != "openai" && cfg.provider != "anthropic") {
        errors.push_back(std::format(
            "backend.provider: expected gemini, openai or anthropic, got '{}'", cfg.provider));
    }
}

ConfigLoader::LoadResult extract_config(const toml::table& root, const std::string& origin) {
    ShieldConfig cfg;
    std::vector<std::string> errors;
    extract_server(root, cfg.server, errors);
    extract_logging(root, cfg.logging, errors);
    extract_backend(root, cfg.backend, errors);

    if (const auto* ner = root["ner"].as_table()) {
        cfg.ner.enabled = (*ner)["enabled"].value_or(cfg.ner.enabled);
        cfg.ner.gazetteer_file = (*ner)["gazetteer_file"].value_or(cfg.ner.gazetteer_file);
    }
    if (const auto* watcher = root["config_watcher"].as_table()) {
        cfg.config_watcher.enabled = (*watcher)["enabled"].value_or(cfg.config_watcher.enabled);
        cfg.config_watcher.poll_interval_seconds = static_cast<int>(
            (*watcher)["poll_interval_seconds"].value_or(
                int64_t{cfg.config_watcher.poll_interval_seconds}));
        if (cfg.config_watcher.poll_interval_seconds <= 0) {
            errors.emplace_back("config_watcher.poll_interval_seconds must be > 0");
        }
    }

    auto policy_result = PolicyLoader::from_table(root);
    if (!policy_result.success) {
        errors.push_back(policy_result.error_message);
    } else {
        cfg.policy = std::move(policy_result.policy);
    }

    if (!errors.empty()) {
        std::string combined = std::format("Invalid configuration in {}:", origin);
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(cfg));
}

} // anonymous namespace

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        return extract_config(config::parse_toml_file(config_path), config_path);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error in {}: {}",
                                             config_path, e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config {}: {}",
                                             config_path, e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        return extract_config(config::parse_toml_string(toml_content), "<string>");
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

} // namespace promptshield
