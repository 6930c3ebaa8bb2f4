#include "validator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Engines occasionally emit numbers or nulls where strings belong.
std::string string_field(const json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

TranscriptEntry parse_entry(const json& obj) {
    TranscriptEntry e;
    e.time_label = string_field(obj, "time", "");
    e.speaker_label = string_field(obj, "speaker", "Unknown");
    e.text = string_field(obj, "text", "");

    auto it = obj.find("confidence");
    if (it != obj.end() && it->is_number()) {
        e.confidence = it->get<double>();
    }
    return e;
}

} // namespace

TranscriptValidator::TranscriptValidator(ValidatorOptions opts) : opts_(std::move(opts)) {
    auto& phrases = opts_.suspicious_phrases;
    for (auto& p : phrases) p = lowercase(std::move(p));
    std::erase_if(phrases, [](const std::string& p) { return p.empty(); });
}

size_t TranscriptValidator::expected_max_entries(const AudioAnalysis& analysis) const {
    if (opts_.length_sanity_window <= 0.0) return 1;
    double est = std::floor(analysis.speech_duration_seconds() / opts_.length_sanity_window);
    return std::max<size_t>(1, static_cast<size_t>(std::max(0.0, est)));
}

bool TranscriptValidator::is_suspicious(const std::string& text) const {
    if (opts_.suspicious_phrases.empty()) return false;
    auto lower = lowercase(text);
    return std::any_of(opts_.suspicious_phrases.begin(), opts_.suspicious_phrases.end(),
                       [&lower](const std::string& p) { return lower.find(p) != std::string::npos; });
}

std::expected<ValidatedTranscript, ParseFailure>
TranscriptValidator::validate(std::string_view raw_json, const AudioAnalysis& analysis) const {
    json doc;
    try {
        doc = json::parse(raw_json);
    } catch (const json::exception& e) {
        return std::unexpected(ParseFailure{std::string(raw_json), e.what()});
    }

    if (!doc.is_array()) {
        return std::unexpected(ParseFailure{std::string(raw_json), "expected a JSON array"});
    }

    ValidatedTranscript out;

    for (const auto& item : doc) {
        if (!item.is_object()) {
            return std::unexpected(ParseFailure{
                std::string(raw_json), "array element is not an object: " + item.dump()});
        }

        auto entry = parse_entry(item);
        double confidence = entry.confidence.value_or(opts_.default_confidence);

        if (confidence < opts_.confidence_threshold) {
            out.rejections.push_back({std::move(entry), RejectionReason::LowConfidence, confidence});
            continue;
        }

        if (is_suspicious(entry.text)) {
            out.rejections.push_back({std::move(entry), RejectionReason::SuspiciousContent, confidence});
            continue;
        }

        out.entries.push_back(std::move(entry));
    }

    size_t expected = expected_max_entries(analysis);
    if (out.entries.size() > expected * 3) {
        out.warnings.push_back(std::format(
            "Transcript seems too long for detected speech duration ({:.2f}s): "
            "expected max ~{} entries, got {}",
            analysis.speech_duration_seconds(), expected, out.entries.size()));
    }

    return out;
}
