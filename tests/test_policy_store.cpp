#include <catch2/catch_test_macros.hpp>
#include "detector/default_registry.hpp"
#include "policy/policy_store.hpp"

#include <atomic>
#include <filesystem>
#include <format>
#include <fstream>
#include <thread>
#include <vector>

using namespace promptshield;

namespace {

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

} // anonymous namespace

TEST_CASE("PolicyStore: empty before first load", "[policy][store]") {
    PolicyStore store;
    CHECK(store.current() == nullptr);
    CHECK(store.version() == 0);
}

TEST_CASE("PolicyStore: versions increase on every install", "[policy][store]") {
    PolicyStore store;

    auto first = store.load_from_string("[detectors.harmful_content]\nthreshold = 0.4\n");
    REQUIRE(first.is_ok());
    CHECK(first.value()->version == 1);

    auto second = store.load_from_string("[detectors.harmful_content]\nthreshold = 0.6\n");
    REQUIRE(second.is_ok());
    CHECK(second.value()->version == 2);
    CHECK(store.version() == 2);
    CHECK(store.current()->input.get(DetectorKind::HARMFUL_CONTENT).threshold == 0.6);

    // A snapshot held by a reader is unaffected by later installs
    CHECK(first.value()->input.get(DetectorKind::HARMFUL_CONTENT).threshold == 0.4);
    CHECK(store.get_stats().loads_succeeded == 2);
}

TEST_CASE("PolicyStore: failed reload keeps the previous snapshot", "[policy][store]") {
    const auto dir = std::filesystem::temp_directory_path() / "promptshield_policy_store";
    std::filesystem::create_directories(dir);
    const auto path = dir / "shield.toml";

    write_file(path, "[detectors.harmful_content]\nthreshold = 0.3\n");

    PolicyStore store;
    REQUIRE(store.load(path.string()).is_ok());
    const auto before = store.current();

    write_file(path, "[detectors.harmful_content]\nthreshold = 7\n");
    const auto failed = store.reload(path.string());
    CHECK(failed.is_error());
    CHECK(failed.error_category() == ErrorCategory::CONFIG_ERROR);
    CHECK(failed.error_message().find("threshold must be within") != std::string::npos);
    CHECK(store.current() == before);
    CHECK(store.version() == 1);

    write_file(path, "[detectors.harmful_content]\nthreshold = 0.8\n");
    const auto ok = store.reload(path.string());
    REQUIRE(ok.is_ok());
    CHECK(store.version() == 2);
    CHECK(store.current()->input.get(DetectorKind::HARMFUL_CONTENT).threshold == 0.8);

    const auto stats = store.get_stats();
    CHECK(stats.loads_succeeded == 2);
    CHECK(stats.loads_failed == 1);

    std::filesystem::remove_all(dir);
}

TEST_CASE("PolicyStore: missing file is a config error", "[policy][store]") {
    PolicyStore store;
    const auto result = store.load("/nonexistent/promptshield/shield.toml");
    CHECK(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
    CHECK(store.current() == nullptr);
}

TEST_CASE("PolicyStore: registry validator rejects unregistered strategies", "[policy][store]") {
    auto registry = std::make_shared<StrategyRegistry>();
    PolicyStore store;
    store.set_validator([registry](const Policy& p) { return registry->validate(p); });

    const auto result = store.load_from_string("");
    CHECK(result.is_error());
    CHECK(result.error_message().find("detectors.prompt_injection: unsupported strategy 'heuristic'")
          != std::string::npos);

    auto full = build_default_registry({});
    store.set_validator([full](const Policy& p) { return full->validate(p); });
    CHECK(store.load_from_string("").is_ok());
}

TEST_CASE("PolicyStore: apply validates extracted policies", "[policy][store]") {
    PolicyStore store;

    Policy bad;
    bad.retry.max_attempts = 0;
    const auto rejected = store.apply(bad);
    CHECK(rejected.is_error());
    CHECK(rejected.error_message().find("retry.max_attempts") != std::string::npos);

    Policy good;
    good.input.get(DetectorKind::PROMPT_INJECTION).enabled = true;
    const auto accepted = store.apply(good);
    REQUIRE(accepted.is_ok());
    CHECK(accepted.value()->version == 1);
}

TEST_CASE("PolicyStore: readers see whole snapshots during reloads", "[policy][store][concurrency]") {
    PolicyStore store;
    REQUIRE(store.load_from_string(
        "[detectors.harmful_content]\nthreshold = 0.1\n[detectors.pii_redaction]\nthreshold = 0.1\n").is_ok());

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!done.load()) {
                const auto snap = store.current();
                const auto& harmful = snap->input.get(DetectorKind::HARMFUL_CONTENT);
                const auto& pii = snap->input.get(DetectorKind::PII_REDACTION);
                // Both thresholds are written together in every version
                if (harmful.threshold != pii.threshold) torn.fetch_add(1);
            }
        });
    }

    for (int v = 1; v <= 50; ++v) {
        const double t = v / 100.0;
        const auto toml = std::format(
            "[detectors.harmful_content]\nthreshold = {}\n[detectors.pii_redaction]\nthreshold = {}\n", t, t);
        REQUIRE(store.load_from_string(toml).is_ok());
    }
    done.store(true);
    for (auto& t : readers) t.join();

    CHECK(torn.load() == 0);
    CHECK(store.version() == 51);
}
