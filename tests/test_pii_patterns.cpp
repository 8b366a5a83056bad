#include <catch2/catch_test_macros.hpp>
#include "detector/pii_pattern_detector.hpp"

#include <string>

using namespace promptshield;

namespace {

DetectorPolicy pii_settings() {
    DetectorPolicy p;
    p.kind = DetectorKind::PII_REDACTION;
    p.enabled = true;
    return p;
}

std::vector<MatchedSpan> spans_in(const PiiPatternDetector& detector, std::string_view text,
                                  const DetectorPolicy& settings = pii_settings()) {
    auto result = detector.detect(DetectionRequest{text, settings, {}});
    REQUIRE(result.is_ok());
    return result.value().matched_spans;
}

std::string covered(std::string_view text, const MatchedSpan& span) {
    return std::string(text.substr(span.start, span.end - span.start));
}

} // anonymous namespace

TEST_CASE("PiiPatternDetector: email", "[detector][pii]") {
    PiiPatternDetector detector;
    const std::string text = "My email is john.doe@example.com";
    const auto spans = spans_in(detector, text);
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].label == "EMAIL");
    CHECK(covered(text, spans[0]) == "john.doe@example.com");
}

TEST_CASE("PiiPatternDetector: email boundaries", "[detector][pii]") {
    PiiPatternDetector detector;

    SECTION("Trailing sentence punctuation is not part of the address") {
        const std::string text = "Write to a@b.co.";
        const auto spans = spans_in(detector, text);
        REQUIRE(spans.size() == 1);
        CHECK(covered(text, spans[0]) == "a@b.co");
    }

    SECTION("Subdomains and tagged local parts") {
        const std::string text = "mail first.last+tag@mail.example.org today";
        const auto spans = spans_in(detector, text);
        REQUIRE(spans.size() == 1);
        CHECK(covered(text, spans[0]) == "first.last+tag@mail.example.org");
    }

    SECTION("Leading punctuation is trimmed from the local part") {
        const std::string text = "(-.john@example.com)";
        const auto spans = spans_in(detector, text);
        REQUIRE(spans.size() == 1);
        CHECK(covered(text, spans[0]) == "john@example.com");
    }

    SECTION("Not addresses") {
        CHECK(spans_in(detector, "john@localhost").empty());
        CHECK(spans_in(detector, "john@example.com_backup").empty());
        CHECK(spans_in(detector, "@example.com").empty());
        CHECK(spans_in(detector, "john@ example.com").empty());
    }
}

TEST_CASE("PiiPatternDetector: long word runs", "[detector][pii]") {
    PiiPatternDetector detector;
    const std::string run(32000, 'a');

    CHECK(spans_in(detector, run).empty());

    // A local part longer than any real mailbox is not an address
    CHECK(spans_in(detector, run + "@example.com").empty());
    CHECK(spans_in(detector, "x@" + run + ".com").empty());

    const std::string text = run + " y@example.com";
    const auto spans = spans_in(detector, text);
    REQUIRE(spans.size() == 1);
    CHECK(covered(text, spans[0]) == "y@example.com");

    const std::string digits(20000, '7');
    CHECK(spans_in(detector, digits).empty());
}

TEST_CASE("PiiPatternDetector: rejected candidates do not hide later ones", "[detector][pii]") {
    PiiPatternDetector detector;

    SECTION("Card after an unrelated digit group") {
        const std::string text = "Order 1234 4111 1111 1111 1111 please";
        const auto spans = spans_in(detector, text);
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].label == "CREDIT_CARD");
        CHECK(covered(text, spans[0]) == "4111 1111 1111 1111");
    }

    SECTION("Card after a phone number") {
        const std::string text = "Reach me at 555-123-4567 4111 1111 1111 1111";
        const auto spans = spans_in(detector, text);
        REQUIRE(spans.size() == 2);
        CHECK(spans[0].label == "PHONE");
        CHECK(covered(text, spans[0]) == "555-123-4567");
        CHECK(spans[1].label == "CREDIT_CARD");
        CHECK(covered(text, spans[1]) == "4111 1111 1111 1111");
    }

    SECTION("Invalid SSN followed by a valid one") {
        const std::string text = "ids 000-12-3456 123-45-6789";
        const auto spans = spans_in(detector, text);
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].label == "SSN");
        CHECK(covered(text, spans[0]) == "123-45-6789");
    }
}

TEST_CASE("PiiPatternDetector: phone numbers", "[detector][pii]") {
    PiiPatternDetector detector;

    const std::string a = "Call 555-123-4567 tomorrow";
    auto spans = spans_in(detector, a);
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].label == "PHONE");
    CHECK(covered(a, spans[0]) == "555-123-4567");

    const std::string b = "Office: (555) 123-4567";
    spans = spans_in(detector, b);
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].label == "PHONE");
}

TEST_CASE("PiiPatternDetector: SSN validation", "[detector][pii]") {
    PiiPatternDetector detector;

    const std::string valid = "SSN 123-45-6789 on file";
    auto spans = spans_in(detector, valid);
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].label == "SSN");
    CHECK(covered(valid, spans[0]) == "123-45-6789");

    CHECK(spans_in(detector, "SSN 000-12-3456").empty());
    CHECK(spans_in(detector, "SSN 666-12-3456").empty());
    CHECK(spans_in(detector, "SSN 900-12-3456").empty());

    CHECK(PiiPatternDetector::validate_ssn("123-45-6789"));
    CHECK_FALSE(PiiPatternDetector::validate_ssn("123-00-6789"));
    CHECK_FALSE(PiiPatternDetector::validate_ssn("123-45-0000"));
    CHECK_FALSE(PiiPatternDetector::validate_ssn("12-345-678"));
}

TEST_CASE("PiiPatternDetector: credit cards need a valid Luhn checksum", "[detector][pii]") {
    PiiPatternDetector detector;

    const std::string valid = "card 4111 1111 1111 1111 exp 12/29";
    auto spans = spans_in(detector, valid);
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].label == "CREDIT_CARD");
    CHECK(covered(valid, spans[0]) == "4111 1111 1111 1111");

    CHECK(spans_in(detector, "card 4111 1111 1111 1112").empty());

    CHECK(PiiPatternDetector::luhn_validate("4111111111111111"));
    CHECK(PiiPatternDetector::luhn_validate("5500-0000-0000-0004"));
    CHECK_FALSE(PiiPatternDetector::luhn_validate("1234567812345678"));
    CHECK_FALSE(PiiPatternDetector::luhn_validate("4111"));
}

TEST_CASE("PiiPatternDetector: IPv4 addresses", "[detector][pii]") {
    PiiPatternDetector detector;
    const std::string text = "server at 192.168.1.20 responded";
    auto spans = spans_in(detector, text);
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].label == "IP_ADDRESS");
    CHECK(covered(text, spans[0]) == "192.168.1.20");

    CHECK(spans_in(detector, "version 999.1.1.1").empty());
}

TEST_CASE("PiiPatternDetector: multiple entities in order", "[detector][pii]") {
    PiiPatternDetector detector;
    const std::string text = "a@b.io or 555-987-6543, ip 10.0.0.1";
    const auto spans = spans_in(detector, text);
    REQUIRE(spans.size() == 3);
    CHECK(spans[0].label == "EMAIL");
    CHECK(spans[1].label == "PHONE");
    CHECK(spans[2].label == "IP_ADDRESS");
    CHECK(spans[0].end <= spans[1].start);
    CHECK(spans[1].end <= spans[2].start);
}

TEST_CASE("PiiPatternDetector: configured patterns yield CUSTOM spans", "[detector][pii]") {
    PiiPatternDetector detector;
    auto settings = pii_settings();
    settings.patterns = {R"(emp-\d{5})"};

    const std::string text = "badge EMP-12345 issued";
    const auto spans = spans_in(detector, text, settings);
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].label == "CUSTOM");
    CHECK(covered(text, spans[0]) == "EMP-12345");
}

TEST_CASE("PiiPatternDetector: clean text", "[detector][pii]") {
    PiiPatternDetector detector;
    const auto r = detector.detect(DetectionRequest{"Nothing personal here.", pii_settings(), {}});
    REQUIRE(r.is_ok());
    CHECK(r.value().matched_spans.empty());
    CHECK(r.value().decision == Decision::ALLOW);
}

TEST_CASE("resolve_overlaps: earliest then longest wins", "[detector][pii]") {
    const auto kept = resolve_overlaps({
        {10, 15, "B"},
        {0, 5, "A"},
        {10, 20, "C"},
        {18, 25, "D"},
        {25, 30, "E"},
        {7, 7, "EMPTY"},
    });
    REQUIRE(kept.size() == 3);
    CHECK(kept[0].label == "A");
    CHECK(kept[1].label == "C");
    CHECK(kept[2].label == "E");
}
