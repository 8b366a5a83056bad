#include "detector/entity_recognizer.hpp"
#include "detector/pii_pattern_detector.hpp"
#include "detector/text_matching.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <fstream>

namespace promptshield {

namespace {

constexpr const char* kCapitalized = R"([A-Z][a-z]{1,40}\b(?:[- ][A-Z][a-z]{1,40}\b){0,2})";
constexpr const char* kMonths =
    "(?:Jan(?:uary)?|Feb(?:ruary)?|Mar(?:ch)?|Apr(?:il)?|May|Jun(?:e)?|Jul(?:y)?|"
    "Aug(?:ust)?|Sep(?:t(?:ember)?)?|Oct(?:ober)?|Nov(?:ember)?|Dec(?:ember)?)";

} // anonymous namespace

std::string EntityRecognizer::canonical_label(std::string_view label) {
    const std::string upper = utils::to_upper(utils::trim(label));
    if (upper == "GPE" || upper == "LOC") return "LOCATION";
    if (upper == "PER") return "PERSON";
    if (upper == "ORGANIZATION") return "ORG";
    return upper;
}

EntityRecognizer::EntityRecognizer(const Config& config)
    : config_(config) {
    const auto flags = std::regex::ECMAScript | std::regex::optimize;
    const std::string cap = kCapitalized;
    const std::string months = kMonths;

    // PERSON
    rules_.push_back({"PERSON", std::regex(
        R"(\b(?:Mr|Mrs|Ms|Miss|Dr|Prof|Sir)\.?\s{1,8}()" + cap + ")", flags), 1});
    rules_.push_back({"PERSON", std::regex(
        R"(\b(?:[Mm]y name is|[Nn]amed|[Cc]alled|[Pp]atient|I am|I'm)\s{1,8}()" + cap + ")", flags), 1});

    // DATE
    rules_.push_back({"DATE", std::regex(R"(\b\d{1,2}[/.-]\d{1,2}[/.-]\d{2,4}\b)", flags), 0});
    rules_.push_back({"DATE", std::regex(R"(\b\d{4}-\d{2}-\d{2}\b)", flags), 0});
    rules_.push_back({"DATE", std::regex(
        R"(\b)" + months + R"(\.?\s{1,8}\d{1,2}(?:st|nd|rd|th)?(?:,?\s{1,8}\d{4})?\b)", flags), 0});
    rules_.push_back({"DATE", std::regex(
        R"(\b\d{1,2}(?:st|nd|rd|th)?\s{1,8}(?:of\s{1,8})?)" + months + R"((?:,?\s{1,8}\d{4})?\b)", flags), 0});

    // LOCATION
    rules_.push_back({"LOCATION", std::regex(
        R"(\b\d{1,5}\s{1,8})" + cap +
        R"(\s{1,8}(?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Lane|Ln|Drive|Way|Court|Ct)\b\.?)",
        flags), 0});
    rules_.push_back({"LOCATION", std::regex(
        R"(\b(?:live in|lives in|living in|born in|moved to|located in|reside in|resides in)\s{1,8}()" +
        cap + ")", flags), 1});

    // ORG
    rules_.push_back({"ORG", std::regex(
        R"(\b()" + cap + R"(\s{1,8}(?:Inc|Corp|Corporation|LLC|Ltd|GmbH|Hospital|Clinic|University|Bank|Company|Group)\b\.?))",
        flags), 1});

    if (!config_.enabled) {
        unavailable_reason_ = "ner_disabled";
    } else if (!config_.gazetteer_file.empty() && !load_gazetteer(config_.gazetteer_file)) {
        unavailable_reason_ = "gazetteer_unavailable";
    }
}

bool EntityRecognizer::load_gazetteer(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        utils::log::warn(std::format("Entity recognizer: cannot open gazetteer {}", path));
        return false;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const std::string trimmed = utils::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;

        const auto tab = trimmed.find('\t');
        if (tab == std::string::npos) {
            utils::log::warn(std::format("Gazetteer {}:{}: expected LABEL<TAB>phrase", path, line_no));
            continue;
        }
        GazetteerEntry entry{canonical_label(trimmed.substr(0, tab)),
                             utils::trim(trimmed.substr(tab + 1))};
        if (!entry.phrase.empty()) {
            gazetteer_.push_back(std::move(entry));
        }
    }
    utils::log::info(std::format("Entity recognizer: loaded {} gazetteer entries from {}",
                                 gazetteer_.size(), path));
    return true;
}

Availability EntityRecognizer::availability() const {
    if (!unavailable_reason_.empty()) return Availability::no(unavailable_reason_);
    return Availability::yes();
}

Result<DetectionResult> EntityRecognizer::detect(const DetectionRequest& request) const {
    if (const auto avail = availability(); !avail.available) {
        return Result<DetectionResult>::error(ErrorCategory::DETECTOR_UNAVAILABLE, avail.reason);
    }

    std::vector<std::string> wanted;
    wanted.reserve(request.settings.entity_types.size());
    for (const auto& label : request.settings.entity_types) {
        wanted.push_back(canonical_label(label));
    }
    const auto is_wanted = [&](const std::string& label) {
        return std::ranges::find(wanted, label) != wanted.end();
    };

    const std::string_view text = request.text;
    std::vector<MatchedSpan> spans;

    for (const auto& rule : rules_) {
        if (!is_wanted(rule.label)) continue;
        for_each_match(text, 0, text.size(), rule.re, [&](const RegexMatch& m) {
            const auto& group = m[rule.group];
            if (!group.matched || group.length() == 0) return;
            const auto start = static_cast<size_t>(group.first - text.begin());
            spans.push_back({start, start + static_cast<size_t>(group.length()), rule.label});
        });
    }

    if (!gazetteer_.empty()) {
        const NormalizedText normalized(text);
        for (const auto& entry : gazetteer_) {
            if (!is_wanted(entry.label)) continue;
            for (auto& span : normalized.find_all_phrases(entry.phrase, entry.label)) {
                spans.push_back(std::move(span));
            }
        }
    }

    DetectionResult result;
    result.matched_spans = resolve_overlaps(std::move(spans));
    if (!result.matched_spans.empty()) {
        result.decision = Decision::FLAG;
        result.reason = "pii_detected";
    }
    return Result<DetectionResult>::ok(std::move(result));
}

} // namespace promptshield
