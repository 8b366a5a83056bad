#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "detector/backend_detector.hpp"
#include "detector/entity_recognizer.hpp"
#include "detector/pii_pattern_detector.hpp"
#include "redaction/redaction_engine.hpp"
#include "mocks/mock_llm_backend.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

using namespace promptshield;
using promptshield::testing::MockLlmBackend;

namespace {

struct Fixture {
    std::shared_ptr<MockLlmBackend> llm = std::make_shared<MockLlmBackend>();
    std::shared_ptr<StrategyRegistry> registry = std::make_shared<StrategyRegistry>();
    std::shared_ptr<RedactionEngine> engine;

    explicit Fixture(bool with_ner = true, EntityRecognizer::Config ner = {}) {
        registry->register_detector(std::make_shared<PiiPatternDetector>());
        if (with_ner) registry->register_detector(std::make_shared<EntityRecognizer>(ner));
        registry->register_detector(std::make_shared<BackendPiiDetector>(llm));
        engine = std::make_shared<RedactionEngine>(registry);
    }
};

DetectorPolicy pii(StrategyVariant strategy, std::vector<std::string> entity_types = {}) {
    DetectorPolicy p;
    p.kind = DetectorKind::PII_REDACTION;
    p.enabled = true;
    p.strategy = strategy;
    p.entity_types = std::move(entity_types);
    return p;
}

/// Gazetteer file removed on scope exit
struct TempGazetteer {
    std::filesystem::path path;

    explicit TempGazetteer(const std::string& name) {
        path = std::filesystem::temp_directory_path() / ("promptshield_" + name + ".tsv");
        std::ofstream out(path, std::ios::trunc);
        out << "LOCATION\tSpringfield\n";
        out << "PERSON\tJane Roe\n";
    }
    ~TempGazetteer() { std::filesystem::remove(path); }
};

/// Throws from detect(), for containment tests
class ThrowingPiiDetector : public IDetector {
public:
    [[nodiscard]] DetectorKind kind() const override { return DetectorKind::PII_REDACTION; }
    [[nodiscard]] StrategyVariant variant() const override { return StrategyVariant::MODEL_BASED; }
    [[nodiscard]] Availability availability() const override { return Availability::yes(); }
    [[nodiscard]] Result<DetectionResult> detect(const DetectionRequest&) const override {
        throw std::runtime_error("recognizer crashed");
    }
};

} // anonymous namespace

TEST_CASE("RedactionEngine: email example yields one EMAIL entity", "[redaction]") {
    Fixture f;
    const std::string text = "My email is john.doe@example.com";
    const auto r = f.engine->redact(text, pii(StrategyVariant::HEURISTIC));

    CHECK(r.redacted_text == "My email is [REDACTED_EMAIL]");
    REQUIRE(r.entities_removed.size() == 1);
    CHECK(r.entities_removed[0].label == "EMAIL");
    CHECK(r.entities_removed[0].original_span.start == text.find("john"));
    CHECK(r.entities_removed[0].original_span.end == text.size());
    CHECK(r.degraded_passes.empty());
    CHECK(r.changed());
}

TEST_CASE("RedactionEngine: redaction is idempotent", "[redaction]") {
    Fixture f;
    const auto settings = pii(StrategyVariant::MODEL_BASED, {"PERSON", "LOCATION", "DATE"});

    const std::string inputs[] = {
        "My email is john.doe@example.com",
        "My name is John Smith, call 555-123-4567, I live in Denver",
        "card 4111 1111 1111 1111 and ssn 123-45-6789 on 2024-01-02",
        "nothing to see here",
        "[REDACTED_EMAIL] was already masked, but bob@example.org was not",
    };

    for (const auto& input : inputs) {
        const auto once = f.engine->redact(input, settings);
        const auto twice = f.engine->redact(once.redacted_text, settings);
        CHECK(twice.redacted_text == once.redacted_text);
        CHECK(twice.entities_removed.empty());
    }
}

TEST_CASE("RedactionEngine: candidates next to masked or rejected text", "[redaction]") {
    Fixture f;
    const auto settings = pii(StrategyVariant::HEURISTIC);

    SECTION("Card after an unrelated digit group") {
        const auto once = f.engine->redact("Order 1234 4111 1111 1111 1111 please", settings);
        CHECK(once.redacted_text == "Order 1234 [REDACTED_CREDIT_CARD] please");
        const auto twice = f.engine->redact(once.redacted_text, settings);
        CHECK(twice.redacted_text == once.redacted_text);
        CHECK(twice.entities_removed.empty());
    }

    SECTION("Phone followed by a card") {
        const auto once = f.engine->redact("Reach me at 555-123-4567 4111 1111 1111 1111", settings);
        CHECK(once.redacted_text == "Reach me at [REDACTED_PHONE] [REDACTED_CREDIT_CARD]");
        const auto twice = f.engine->redact(once.redacted_text, settings);
        CHECK(twice.redacted_text == once.redacted_text);
        CHECK(twice.entities_removed.empty());
    }
}

TEST_CASE("RedactionEngine: repeated gazetteer phrases are all masked", "[redaction][ner]") {
    TempGazetteer gazetteer("redaction_repeated_gazetteer");
    Fixture f(true, EntityRecognizer::Config{.enabled = true, .gazetteer_file = gazetteer.path.string()});
    const auto settings = pii(StrategyVariant::MODEL_BASED, {"LOCATION"});

    const auto once = f.engine->redact("Springfield Springfield, then back to springfield", settings);
    CHECK(once.redacted_text ==
          "[REDACTED_LOCATION] [REDACTED_LOCATION], then back to [REDACTED_LOCATION]");
    CHECK(once.entities_removed.size() == 3);

    const auto twice = f.engine->redact(once.redacted_text, settings);
    CHECK(twice.redacted_text == once.redacted_text);
    CHECK(twice.entities_removed.empty());
}

TEST_CASE("RedactionEngine: random PII streams redact idempotently", "[redaction][idempotence]") {
    const auto strategy = GENERATE(StrategyVariant::HEURISTIC, StrategyVariant::MODEL_BASED);
    TempGazetteer gazetteer("redaction_stream_gazetteer");
    Fixture f(true, EntityRecognizer::Config{.enabled = true, .gazetteer_file = gazetteer.path.string()});
    const auto settings = pii(strategy, {"PERSON", "LOCATION", "DATE"});

    const std::vector<std::string> entities = {
        "john.doe@example.com", "a@b.co", "first.last+tag@mail.example.org",
        "555-123-4567", "(555) 123-4567", "+1 555-123-4567",
        "4111 1111 1111 1111", "4111-1111-1111-1111", "5500000000000004",
        "123-45-6789", "192.168.1.20", "10.0.0.1",
        "My name is John Smith", "I live in Denver", "Dr. Jane Roe", "Springfield",
        "2024-01-02", "Jan 5, 2024", "12/31/2024",
    };
    const std::vector<std::string> filler = {
        "order", "please", "1234", "7", "call", "me", "at", "and", "-", "ref#42",
        "2024", "x", "Springfield", "Hall", "New", "York",
    };

    std::mt19937 rng(20240102);
    std::uniform_int_distribution<size_t> length(3, 12);
    std::bernoulli_distribution pick_entity(0.5);

    for (int i = 0; i < 300; ++i) {
        std::string text;
        const size_t tokens = length(rng);
        for (size_t t = 0; t < tokens; ++t) {
            const auto& pool = pick_entity(rng) ? entities : filler;
            if (!text.empty()) text += ' ';
            text += pool[std::uniform_int_distribution<size_t>(0, pool.size() - 1)(rng)];
        }

        const auto once = f.engine->redact(text, settings);
        const auto twice = f.engine->redact(once.redacted_text, settings);
        INFO(text);
        CHECK(twice.redacted_text == once.redacted_text);
        CHECK(twice.entities_removed.empty());
    }
}

TEST_CASE("RedactionEngine: existing mask tokens are left alone", "[redaction]") {
    Fixture f;
    const auto r = f.engine->redact("[REDACTED_EMAIL] and a@b.co", pii(StrategyVariant::HEURISTIC));
    CHECK(r.redacted_text == "[REDACTED_EMAIL] and [REDACTED_EMAIL]");
    REQUIRE(r.entities_removed.size() == 1);
    CHECK(r.entities_removed[0].original_span.start == 21);

    const auto masks = RedactionEngine::find_masks(r.redacted_text);
    CHECK(masks.size() == 2);
}

TEST_CASE("RedactionEngine: model-based pass adds named entities", "[redaction]") {
    Fixture f;
    const std::string text = "My name is John Smith, email john@x.org";
    const auto r = f.engine->redact(text, pii(StrategyVariant::MODEL_BASED, {"PERSON"}));

    CHECK(r.redacted_text == "My name is [REDACTED_PERSON], email [REDACTED_EMAIL]");
    REQUIRE(r.entities_removed.size() == 2);

    // Offsets refer to the original text, sorted by position
    CHECK(r.entities_removed[0].label == "PERSON");
    CHECK(r.entities_removed[0].original_span.start == 11);
    CHECK(r.entities_removed[0].original_span.end == 21);
    CHECK(r.entities_removed[1].label == "EMAIL");
    CHECK(r.entities_removed[1].original_span.start == text.find("john@"));
    CHECK(f.llm->call_count() == 0);
}

TEST_CASE("RedactionEngine: backend pass", "[redaction][backend]") {
    Fixture f;

    SECTION("Backend entities are masked") {
        f.llm->push_success(R"({"entities":[{"text":"Project Zeus","label":"codename"}]})");
        const auto r = f.engine->redact("Status of Project Zeus?", pii(StrategyVariant::BACKEND_ASSISTED));
        CHECK(r.redacted_text == "Status of [REDACTED_CODENAME]?");
        CHECK(f.llm->call_count() == 1);
        CHECK(f.llm->requests()[0].use_case == LlmUseCase::PII_EXTRACTION);
    }

    SECTION("Backend cannot split an earlier mask") {
        f.llm->push_success(R"({"entities":[{"text":"REDACTED_EMAIL","label":"X"}]})");
        const auto r = f.engine->redact("mail a@b.co", pii(StrategyVariant::BACKEND_ASSISTED));
        CHECK(r.redacted_text == "mail [REDACTED_EMAIL]");
        CHECK(r.entities_removed.size() == 1);
    }

    SECTION("Unavailable backend degrades to the other passes") {
        f.llm->set_available(false);
        const auto r = f.engine->redact("I am Jane Doe, jane@doe.com",
                                        pii(StrategyVariant::HYBRID, {"PERSON"}));
        CHECK(r.redacted_text == "I am [REDACTED_PERSON], [REDACTED_EMAIL]");
        REQUIRE(r.degraded_passes.size() == 1);
        CHECK(r.degraded_passes[0] == "llm:missing_credential");
    }

    SECTION("Failing backend degrades") {
        f.llm->push_failure("timeout");
        const auto r = f.engine->redact("x@y.org", pii(StrategyVariant::BACKEND_ASSISTED));
        CHECK(r.redacted_text == "[REDACTED_EMAIL]");
        REQUIRE(r.degraded_passes.size() == 1);
        CHECK(r.degraded_passes[0] == "llm:backend_error: timeout");
    }
}

TEST_CASE("RedactionEngine: a throwing recognizer degrades its pass", "[redaction]") {
    auto registry = std::make_shared<StrategyRegistry>();
    registry->register_detector(std::make_shared<PiiPatternDetector>());
    registry->register_detector(std::make_shared<ThrowingPiiDetector>());
    RedactionEngine engine(registry);

    const auto r = engine.redact("My name is John Smith, email john@x.org",
                                 pii(StrategyVariant::MODEL_BASED, {"PERSON"}));
    CHECK(r.redacted_text == "My name is John Smith, email [REDACTED_EMAIL]");
    REQUIRE(r.degraded_passes.size() == 1);
    CHECK(r.degraded_passes[0] == "ml:recognizer crashed");
}

TEST_CASE("RedactionEngine: unregistered recognizer is reported", "[redaction]") {
    Fixture f(false);
    const auto r = f.engine->redact("My name is John Smith", pii(StrategyVariant::MODEL_BASED, {"PERSON"}));
    CHECK(r.redacted_text == "My name is John Smith");
    REQUIRE(r.degraded_passes.size() == 1);
    CHECK(r.degraded_passes[0] == "ml:not_registered");
}

TEST_CASE("RedactionEngine: pattern-only redaction for previews", "[redaction]") {
    Fixture f;
    const auto r = f.engine->redact_patterns_only("My name is John Smith, email john@x.org");
    CHECK(r.redacted_text == "My name is John Smith, email [REDACTED_EMAIL]");
    CHECK(f.llm->call_count() == 0);
}

TEST_CASE("RedactionEngine: mask tokens", "[redaction]") {
    CHECK(RedactionEngine::mask_token("EMAIL") == "[REDACTED_EMAIL]");
    CHECK(RedactionEngine::mask_token("ip-address") == "[REDACTED_IP_ADDRESS]");
    CHECK(RedactionEngine::find_masks("no masks").empty());

    SECTION("Labels are capped so every token stays recognizable") {
        const auto token = RedactionEngine::mask_token(std::string(200, 'x'));
        CHECK(token == "[REDACTED_" + std::string(48, 'X') + "]");
        CHECK(RedactionEngine::find_masks(token).size() == 1);
        CHECK(RedactionEngine::mask_token("") == "[REDACTED_ENTITY]");
    }

    SECTION("Unterminated or oversized tokens are plain text") {
        const std::string open = "[REDACTED_" + std::string(30000, 'A');
        CHECK(RedactionEngine::find_masks(open).empty());
        CHECK(RedactionEngine::find_masks(open + "]").empty());
        CHECK(RedactionEngine::find_masks("[REDACTED_] and [REDACTED_EMAIL]").size() == 1);
    }
}
