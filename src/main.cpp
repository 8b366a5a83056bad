#include "audit/event_logger.hpp"
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "core/llm_client.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "detector/default_registry.hpp"
#include "detector/detection_orchestrator.hpp"
#include "detector/response_screening.hpp"
#include "policy/policy_store.hpp"
#include "redaction/redaction_engine.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"

#include <memory>
#include <csignal>
#include <cstdlib>
#include <format>

using namespace promptshield;

// Global instances for signal handling and config watcher
std::shared_ptr<HttpServer> g_server;
std::shared_ptr<ConfigWatcher> g_config_watcher;
std::shared_ptr<ShutdownCoordinator> g_shutdown;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Stop accepting new requests
    if (g_shutdown) {
        g_shutdown->initiate_shutdown();
    }

    if (g_config_watcher) {
        g_config_watcher->stop();
    }

    // Wait for in-flight requests to drain, then cancel whatever is left
    if (g_shutdown) {
        if (g_shutdown->wait_for_drain()) {
            utils::log::info("All in-flight requests drained");
        } else {
            utils::log::warn(std::format("Shutdown timeout: cancelling {} in-flight requests",
                g_shutdown->in_flight_count()));
            g_shutdown->cancel_in_flight();
        }
    }

    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Prompt Shield starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Configuration
        std::string config_file = "config/shield.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/7] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const ShieldConfig& cfg = config_result.config;

        // [2/7] Backend client
        std::shared_ptr<LlmClient> llm_client;
        if (cfg.backend.enabled) {
            LlmClient::Config llm_cfg;
            llm_cfg.enabled = cfg.backend.enabled;
            llm_cfg.provider = cfg.backend.provider;
            llm_cfg.endpoint = cfg.backend.endpoint;
            llm_cfg.api_key = cfg.backend.api_key;
            llm_cfg.default_model = cfg.backend.model;
            llm_cfg.timeout_ms = cfg.backend.timeout_ms;
            llm_cfg.max_requests_per_minute = cfg.backend.max_requests_per_minute;
            llm_client = std::make_shared<LlmClient>(llm_cfg);
            utils::log::info(std::format("[2/7] Backend: {} ({}){}", cfg.backend.provider,
                cfg.backend.model,
                llm_client->is_available() ? "" : std::format(" unavailable: {}",
                                                              llm_client->unavailable_reason())));
        } else {
            utils::log::info("[2/7] Backend: disabled");
        }

        // [3/7] Detectors
        BuiltinDetectorOptions detector_options;
        detector_options.backend = llm_client;
        detector_options.ner.enabled = cfg.ner.enabled;
        detector_options.ner.gazetteer_file = cfg.ner.gazetteer_file;
        detector_options.classifier_model = cfg.backend.model;
        const auto registry = build_default_registry(detector_options);
        utils::log::info("[3/7] Detector registry ready");

        // [4/7] Policy
        auto policy_store = std::make_shared<PolicyStore>();
        policy_store->set_validator([registry](const Policy& policy) {
            return registry->validate(policy);
        });
        const auto installed = policy_store->apply(cfg.policy);
        if (installed.is_error()) {
            utils::log::error(installed.error_message());
            return 1;
        }
        utils::log::info(std::format("[4/7] Policy v{} active ({} detection)",
            installed.value()->version,
            cfg.policy.parallel_detection ? "parallel" : "sequential"));

        // [5/7] Event log
        EventLogger::Config log_cfg;
        log_cfg.output_file = cfg.logging.event_log;
        log_cfg.max_file_size_bytes = cfg.logging.max_file_size_mb * 1024ULL * 1024;
        log_cfg.max_files = cfg.logging.max_files;
        log_cfg.rotation_interval = std::chrono::hours(cfg.logging.rotation_interval_hours);
        log_cfg.integrity_enabled = cfg.logging.integrity_enabled;
        log_cfg.mirror_to_stderr = cfg.logging.mirror_to_stderr;
        log_cfg.buffer_capacity = cfg.logging.buffer_capacity;
        log_cfg.flush_interval = std::chrono::milliseconds(cfg.logging.flush_interval_ms);
        auto event_logger = std::make_shared<EventLogger>(log_cfg);
        utils::log::info(std::format("[5/7] Event log: {} (integrity {})",
            cfg.logging.event_log, cfg.logging.integrity_enabled ? "on" : "off"));

        // [6/7] Pipeline + server
        auto detection = std::make_shared<DetectionOrchestrator>(registry);
        auto redaction = std::make_shared<RedactionEngine>(registry);
        auto response_screening = std::make_shared<ResponseScreeningOrchestrator>(detection, redaction);

        auto pipeline = PipelineBuilder()
            .with_policy_store(policy_store)
            .with_detection(detection)
            .with_redaction(redaction)
            .with_response_screening(response_screening)
            .with_backend(llm_client)
            .with_event_logger(event_logger)
            .with_max_prompt_length(cfg.server.max_prompt_length)
            .with_preview_length(cfg.logging.preview_length)
            .build();

        ShutdownCoordinator::Config shutdown_cfg;
        shutdown_cfg.shutdown_timeout = std::chrono::milliseconds(cfg.server.shutdown_timeout_ms);
        shutdown_cfg.disconnect_poll_interval = std::chrono::milliseconds(cfg.server.disconnect_poll_ms);
        g_shutdown = std::make_shared<ShutdownCoordinator>(shutdown_cfg);

        g_server = std::make_shared<HttpServer>(pipeline, cfg.server, config_file);
        g_server->set_shutdown_coordinator(g_shutdown);
        utils::log::info("[6/7] Pipeline ready");

        // [7/7] Config watcher - hot-reload the policy
        if (cfg.config_watcher.enabled) {
            g_config_watcher = std::make_shared<ConfigWatcher>(
                config_file, std::chrono::seconds(cfg.config_watcher.poll_interval_seconds));
            g_config_watcher->set_callback([policy_store](const ShieldConfig& new_config) {
                const auto result = policy_store->apply(new_config.policy);
                if (result.is_error()) {
                    throw std::runtime_error(result.error_message());
                }
                utils::log::info(std::format("Policy hot-reloaded: v{}", result.value()->version));
            });
            g_config_watcher->start();
            utils::log::info(std::format("[7/7] Config watcher: polling every {}s",
                cfg.config_watcher.poll_interval_seconds));
        } else {
            utils::log::info("[7/7] Config watcher: disabled");
        }

        utils::log::info(std::format("Server ready on http://{}:{}", cfg.server.host, cfg.server.port));

        // Start HTTP server (blocking until stop())
        g_server->start();

        if (g_config_watcher) {
            g_config_watcher->stop();
        }
        event_logger->shutdown();
        const auto stats = event_logger->get_stats();
        utils::log::info(std::format("Event log closed: {} written, {} dropped",
            stats.total_written, stats.dropped));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
