#include "policy/policy_loader.hpp"
#include "config/toml_document.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <regex>

using namespace std::string_literals;

namespace promptshield {

// Constexpr config keys (used 2+ times in policy parsing)
static constexpr std::string_view kDetectors   = "detectors";
static constexpr std::string_view kEnabled     = "enabled";
static constexpr std::string_view kStrategy    = "strategy";
static constexpr std::string_view kThreshold   = "threshold";
static constexpr std::string_view kAction      = "action";
static constexpr std::string_view kEntityTypes = "entity_types";
static constexpr std::string_view kMarkers     = "markers";
static constexpr std::string_view kPatterns    = "patterns";

// ============================================================================
// Helpers
// ============================================================================

std::optional<Decision> PolicyLoader::parse_action(const std::string& action_str) {
    const std::string lower = utils::to_lower(action_str);
    if (lower == "block") return Decision::BLOCK;
    if (lower == "flag") return Decision::FLAG;
    return std::nullopt;
}

std::optional<FailureMode> PolicyLoader::parse_failure_mode(const std::string& mode_str) {
    const std::string lower = utils::to_lower(mode_str);
    if (lower == "open") return FailureMode::OPEN;
    if (lower == "closed") return FailureMode::CLOSED;
    return std::nullopt;
}

// ============================================================================
// Section extractors
// ============================================================================

void PolicyLoader::extract_detector(const toml::table& tbl, DetectorPolicy& out,
                                    const std::string& path, std::vector<std::string>& errors) {
    if (auto v = tbl[kEnabled].value<bool>()) {
        out.enabled = *v;
    }

    if (auto s = config::optional_string(tbl, kStrategy)) {
        if (auto strategy = parse_strategy(utils::to_lower(*s))) {
            out.strategy = *strategy;
        } else {
            errors.push_back(std::format(
                "{}.strategy: unknown strategy '{}' (expected heuristic, ml, llm or hybrid)",
                path, *s));
        }
    }

    if (tbl.contains(kThreshold)) {
        if (auto t = config::optional_number(tbl, kThreshold)) {
            out.threshold = *t;
        } else {
            errors.push_back(std::format("{}.threshold must be a number", path));
        }
    }

    if (auto a = config::optional_string(tbl, kAction)) {
        if (auto action = parse_action(*a)) {
            out.action = *action;
        } else {
            errors.push_back(std::format("{}.action: expected 'block' or 'flag', got '{}'",
                                         path, *a));
        }
    }

    if (tbl.contains(kEntityTypes)) {
        out.entity_types.clear();
        for (const auto& label : config::string_array(tbl, kEntityTypes)) {
            out.entity_types.push_back(utils::to_upper(label));
        }
    }
    if (tbl.contains(kMarkers)) {
        out.markers = config::string_array(tbl, kMarkers);
    }
    if (tbl.contains(kPatterns)) {
        out.patterns = config::string_array(tbl, kPatterns);
    }

    if (const auto* weights = tbl["model_weights"].as_table()) {
        for (const auto& [term, node] : *weights) {
            if (const auto* f = node.as_floating_point()) {
                out.model_weights[std::string(term.str())] = f->get();
            } else if (const auto* i = node.as_integer()) {
                out.model_weights[std::string(term.str())] = static_cast<double>(i->get());
            } else {
                errors.push_back(std::format("{}.model_weights.{} must be a number",
                                             path, term.str()));
            }
        }
    }
    if (auto bias = config::optional_number(tbl, "model_bias")) {
        out.model_bias = *bias;
    }
}

void PolicyLoader::extract_detector_set(const toml::table* tbl, DetectorSet& out,
                                        const std::string& path,
                                        std::vector<std::string>& errors) {
    if (!tbl) return;
    for (const auto& [name, node] : *tbl) {
        const auto kind = parse_detector_kind(name.str());
        if (!kind) {
            errors.push_back(std::format("{}: unknown detector '{}'", path, name.str()));
            continue;
        }
        const auto* section = node.as_table();
        if (!section) {
            errors.push_back(std::format("{}.{} must be a table", path, name.str()));
            continue;
        }
        extract_detector(*section, out.get(*kind),
                         std::format("{}.{}", path, name.str()), errors);
    }
}

// ============================================================================
// Public API
// ============================================================================

PolicyLoader::LoadResult PolicyLoader::load_from_file(const std::string& config_path) {
    try {
        return from_table(config::parse_toml_file(config_path));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load policy from {}: {}",
                                             config_path, e.what()));
    }
}

PolicyLoader::LoadResult PolicyLoader::load_from_string(const std::string& toml_content) {
    try {
        return from_table(config::parse_toml_string(toml_content));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse policy: {}", e.what()));
    }
}

PolicyLoader::LoadResult PolicyLoader::from_table(const toml::table& root) {
    Policy policy;
    std::vector<std::string> errors;

    // Built-in defaults: every detector on with the local heuristic strategy
    for (const auto kind : kAllDetectorKinds) {
        policy.input.get(kind).enabled = true;
    }

    extract_detector_set(root[kDetectors].as_table(), policy.input,
                         std::string(kDetectors), errors);

    // [detection]
    if (const auto* detection = root["detection"].as_table()) {
        if (detection->contains("order")) {
            policy.order.clear();
            for (const auto& name : config::string_array(*detection, "order")) {
                if (auto kind = parse_detector_kind(name)) {
                    policy.order.push_back(*kind);
                } else {
                    errors.push_back(std::format("detection.order: unknown detector '{}'", name));
                }
            }
        }
        policy.parallel_detection = (*detection)["parallel"].value_or(false);
    }

    // [response_screening]: harmful content and PII inherit the input-side
    // settings; prompt injection on output must be configured explicitly.
    policy.response_screening.detectors = policy.input;
    policy.response_screening.detectors.get(DetectorKind::PROMPT_INJECTION).enabled = false;
    if (const auto* rs = root["response_screening"].as_table()) {
        policy.response_screening.enabled = (*rs)["enabled"].value_or(false);
        extract_detector_set((*rs)[kDetectors].as_table(), policy.response_screening.detectors,
                             "response_screening.detectors", errors);
    }

    // [failure_policy]
    if (const auto* fp = root["failure_policy"].as_table()) {
        for (const auto key : {"detector_unavailable", "backend_unavailable"}) {
            const auto value = config::optional_string(*fp, key);
            if (!value) continue;
            const auto mode = parse_failure_mode(*value);
            if (!mode) {
                errors.push_back(std::format("failure_policy.{}: expected 'open' or 'closed', got '{}'",
                                             key, *value));
                continue;
            }
            if (std::string_view(key) == "detector_unavailable") {
                policy.failure.detector_unavailable = *mode;
            } else {
                policy.failure.backend_unavailable = *mode;
            }
        }
        if (auto msg = config::optional_string(*fp, "fallback_message")) {
            policy.failure.fallback_message = *msg;
        }
    }

    // [retry]
    if (const auto* retry = root["retry"].as_table()) {
        const auto read_u32 = [&](std::string_view key, uint32_t& out) {
            if (!retry->contains(key)) return;
            const auto v = (*retry)[key].value<int64_t>();
            if (!v || *v < 0) {
                errors.push_back(std::format("retry.{} must be a non-negative integer", key));
                return;
            }
            out = static_cast<uint32_t>(*v);
        };
        read_u32("max_attempts", policy.retry.max_attempts);
        read_u32("initial_backoff_ms", policy.retry.initial_backoff_ms);
        read_u32("max_backoff_ms", policy.retry.max_backoff_ms);
        read_u32("timeout_ms", policy.retry.timeout_ms);
    }

    // [backend] model identifier is part of the policy snapshot
    if (const auto* backend = root["backend"].as_table()) {
        policy.backend_model = (*backend)["model"].value_or(policy.backend_model);
    }

    auto validation = validate(policy);
    errors.insert(errors.end(), validation.begin(), validation.end());

    if (!errors.empty()) {
        std::string combined = "Policy validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(policy));
}

// ============================================================================
// Validation
// ============================================================================

namespace {

void validate_detector(const DetectorPolicy& d, const std::string& path,
                       std::vector<std::string>& errors) {
    if (!(d.threshold >= 0.0 && d.threshold <= 1.0)) {
        errors.push_back(std::format("{}.threshold must be within [0, 1], got {}",
                                     path, d.threshold));
    }

    for (const auto& pattern : d.patterns) {
        try {
            std::regex re(pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            errors.push_back(std::format("{}.patterns: invalid regex '{}': {}",
                                         path, pattern, e.what()));
        }
    }

    if (d.kind == DetectorKind::PII_REDACTION && d.enabled &&
        (d.strategy == StrategyVariant::MODEL_BASED || d.strategy == StrategyVariant::HYBRID) &&
        d.entity_types.empty()) {
        errors.push_back(std::format(
            "{}.entity_types must not be empty when strategy is '{}'",
            path, strategy_to_string(d.strategy)));
    }
}

} // anonymous namespace

std::vector<std::string> PolicyLoader::validate(const Policy& policy) {
    std::vector<std::string> errors;

    for (const auto kind : kAllDetectorKinds) {
        validate_detector(policy.input.get(kind),
                          std::format("detectors.{}", detector_kind_to_string(kind)), errors);
        if (policy.response_screening.enabled) {
            validate_detector(policy.response_screening.detectors.get(kind),
                              std::format("response_screening.detectors.{}",
                                          detector_kind_to_string(kind)), errors);
        }
    }

    std::vector<DetectorKind> seen;
    for (const auto kind : policy.order) {
        if (kind == DetectorKind::PII_REDACTION) {
            errors.push_back("detection.order: pii_redaction is not a screening detector");
        }
        if (std::ranges::find(seen, kind) != seen.end()) {
            errors.push_back(std::format("detection.order: duplicate entry '{}'",
                                         detector_kind_to_string(kind)));
        }
        seen.push_back(kind);
    }

    if (policy.retry.max_attempts < 1) {
        errors.push_back("retry.max_attempts must be >= 1");
    }
    if (policy.retry.initial_backoff_ms > policy.retry.max_backoff_ms) {
        errors.push_back(std::format("retry.initial_backoff_ms ({}) > retry.max_backoff_ms ({})",
                                     policy.retry.initial_backoff_ms,
                                     policy.retry.max_backoff_ms));
    }
    if (policy.retry.timeout_ms == 0) {
        errors.push_back("retry.timeout_ms must be > 0");
    }

    if (policy.backend_model.empty()) {
        errors.push_back("backend.model must not be empty");
    }

    return errors;
}

} // namespace promptshield
