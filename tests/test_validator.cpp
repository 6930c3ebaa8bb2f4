#include <catch2/catch_test_macros.hpp>

#include "detector/speech_detector.hpp"
#include "transcript/validator.hpp"
#include "wav_fixture.hpp"

#include <format>
#include <string>

namespace {

// Analysis with roughly `speech_s` seconds of active audio.
AudioAnalysis analysis_with_speech(double speech_s) {
    auto samples = fixture::tone_then_silence(speech_s, 1.0, 16000);
    return SpeechDetector().analyze(samples, 16000).value();
}

std::string entries_json(int count, double confidence) {
    std::string out = "[";
    for (int i = 0; i < count; ++i) {
        if (i) out += ",";
        out += std::format(R"({{"time": "[00:{:02}]", "speaker": "Speaker 1", "text": "line {}", "confidence": {}}})",
                           i, i, confidence);
    }
    return out + "]";
}

} // namespace

TEST_CASE("TranscriptValidator", "[validator]") {
    TranscriptValidator validator;
    auto analysis = analysis_with_speech(3.0);

    SECTION("DefaultOptions") {
        REQUIRE(validator.options().confidence_threshold == 0.7);
        REQUIRE(validator.options().default_confidence == 0.5);
        REQUIRE(validator.options().suspicious_phrases.empty());
        REQUIRE(validator.options().length_sanity_window == 2.0);
    }

    SECTION("EmptyArrayIsSuccess") {
        auto r = validator.validate("[]", analysis);
        REQUIRE(r.has_value());
        REQUIRE(r->entries.empty());
        REQUIRE(r->rejections.empty());
        REQUIRE(r->warnings.empty());
    }

    SECTION("MalformedJsonKeepsRawText") {
        auto r = validator.validate("{not json", analysis);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().raw_text == "{not json");
        REQUIRE_FALSE(r.error().message.empty());
    }

    SECTION("NonArrayIsParseFailure") {
        auto r = validator.validate(R"({"time": "[00:01]"})", analysis);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().raw_text == R"({"time": "[00:01]"})");
    }

    SECTION("NonObjectElementIsParseFailure") {
        auto r = validator.validate(R"(["hello"])", analysis);
        REQUIRE_FALSE(r.has_value());
    }

    SECTION("ConfidenceBoundary") {
        auto r = validator.validate(R"([
            {"time": "[00:01]", "speaker": "Speaker 1", "text": "below", "confidence": 0.69},
            {"time": "[00:02]", "speaker": "Speaker 2", "text": "at", "confidence": 0.70}
        ])", analysis);
        REQUIRE(r.has_value());
        REQUIRE(r->entries.size() == 1);
        REQUIRE(r->entries[0].text == "at");
        REQUIRE(r->rejections.size() == 1);
        REQUIRE(r->rejections[0].reason == RejectionReason::LowConfidence);
        REQUIRE(r->rejections[0].entry.text == "below");
        REQUIRE(r->rejections[0].effective_confidence == 0.69);
    }

    SECTION("MissingConfidenceUsesDefault") {
        auto r = validator.validate(R"([{"time": "[00:01]", "speaker": "A", "text": "hi"}])", analysis);
        REQUIRE(r.has_value());
        REQUIRE(r->entries.empty());
        REQUIRE(r->rejections.size() == 1);
        REQUIRE(r->rejections[0].reason == RejectionReason::LowConfidence);
        REQUIRE(r->rejections[0].effective_confidence == 0.5);
        REQUIRE_FALSE(r->rejections[0].entry.confidence.has_value());

        TranscriptValidator lenient(ValidatorOptions{.default_confidence = 0.9});
        auto kept = lenient.validate(R"([{"text": "hi"}])", analysis);
        REQUIRE(kept.has_value());
        REQUIRE(kept->entries.size() == 1);
        REQUIRE_FALSE(kept->entries[0].confidence.has_value());
    }

    SECTION("NonNumericConfidenceUsesDefault") {
        auto r = validator.validate(R"([{"text": "hi", "confidence": "high"}])", analysis);
        REQUIRE(r.has_value());
        REQUIRE(r->rejections.size() == 1);
        REQUIRE(r->rejections[0].effective_confidence == 0.5);
    }

    SECTION("MissingFieldsDefaulted") {
        auto r = validator.validate(R"([{"confidence": 1.0}])", analysis);
        REQUIRE(r.has_value());
        REQUIRE(r->entries.size() == 1);
        REQUIRE(r->entries[0].time_label.empty());
        REQUIRE(r->entries[0].speaker_label == "Unknown");
        REQUIRE(r->entries[0].text.empty());
        REQUIRE(r->entries[0].confidence == 1.0);
    }

    SECTION("OrderPreserved") {
        auto r = validator.validate(R"([
            {"time": "[00:09]", "speaker": "B", "text": "third", "confidence": 0.9},
            {"time": "[00:01]", "speaker": "A", "text": "first", "confidence": 0.2},
            {"time": "[00:03]", "speaker": "A", "text": "second", "confidence": 0.8}
        ])", analysis);
        REQUIRE(r.has_value());
        REQUIRE(r->entries.size() == 2);
        REQUIRE(r->entries[0].text == "third");
        REQUIRE(r->entries[1].text == "second");
    }

    SECTION("NoSuspiciousPhrasesByDefault") {
        auto r = validator.validate(
            R"([{"text": "Thank you for watching", "confidence": 0.99}])", analysis);
        REQUIRE(r.has_value());
        REQUIRE(r->entries.size() == 1);
    }

    SECTION("SuspiciousPhrasesCaseInsensitive") {
        TranscriptValidator strict(ValidatorOptions{
            .suspicious_phrases = {"Thank You For Watching", "", "subscribe"},
        });
        REQUIRE(strict.options().suspicious_phrases ==
                std::vector<std::string>{"thank you for watching", "subscribe"});

        auto r = strict.validate(R"([
            {"time": "[00:01]", "speaker": "A", "text": "THANK YOU FOR WATCHING!", "confidence": 0.99},
            {"time": "[00:02]", "speaker": "A", "text": "please Subscribe", "confidence": 0.95},
            {"time": "[00:03]", "speaker": "A", "text": "real words", "confidence": 0.95}
        ])", analysis);
        REQUIRE(r.has_value());
        REQUIRE(r->entries.size() == 1);
        REQUIRE(r->entries[0].text == "real words");
        REQUIRE(r->rejections.size() == 2);
        REQUIRE(r->rejections[0].reason == RejectionReason::SuspiciousContent);
        REQUIRE(r->rejections[1].reason == RejectionReason::SuspiciousContent);
    }

    SECTION("LowConfidenceCheckedBeforeContent") {
        TranscriptValidator strict(ValidatorOptions{.suspicious_phrases = {"subscribe"}});
        auto r = strict.validate(R"([{"text": "subscribe", "confidence": 0.1}])", analysis);
        REQUIRE(r.has_value());
        REQUIRE(r->rejections.size() == 1);
        REQUIRE(r->rejections[0].reason == RejectionReason::LowConfidence);
    }

    SECTION("SanityWarningKeepsEntries") {
        auto ten_seconds = analysis_with_speech(10.0);
        REQUIRE(validator.expected_max_entries(ten_seconds) == 5);

        auto r = validator.validate(entries_json(20, 0.95), ten_seconds);
        REQUIRE(r.has_value());
        REQUIRE(r->entries.size() == 20);
        REQUIRE(r->warnings.size() == 1);
        REQUIRE(r->warnings[0].find("~5") != std::string::npos);
        REQUIRE(r->warnings[0].find("got 20") != std::string::npos);
    }

    SECTION("SanityThresholdIsExclusive") {
        auto ten_seconds = analysis_with_speech(10.0);
        auto r = validator.validate(entries_json(15, 0.95), ten_seconds);
        REQUIRE(r.has_value());
        REQUIRE(r->warnings.empty());
    }

    SECTION("ExpectedEntriesAtLeastOne") {
        REQUIRE(validator.expected_max_entries(AudioAnalysis{}) == 1);
        REQUIRE(validator.expected_max_entries(analysis_with_speech(1.5)) == 1);

        auto r = validator.validate(entries_json(4, 0.95), AudioAnalysis{});
        REQUIRE(r.has_value());
        REQUIRE(r->entries.size() == 4);
        REQUIRE(r->warnings.size() == 1);
    }

    SECTION("RejectedEntriesDoNotCountTowardsSanity") {
        auto r = validator.validate(entries_json(10, 0.3), AudioAnalysis{});
        REQUIRE(r.has_value());
        REQUIRE(r->entries.empty());
        REQUIRE(r->rejections.size() == 10);
        REQUIRE(r->warnings.empty());
    }

    SECTION("ToneThenSilenceTranscriptKept") {
        auto r = validator.validate(R"([
            {"time": "[00:00]", "speaker": "Speaker 1", "text": "Hello there.", "confidence": 0.95},
            {"time": "[00:02]", "speaker": "Speaker 2", "text": "Hi.", "confidence": 0.95}
        ])", analysis);
        REQUIRE(r.has_value());
        REQUIRE(r->entries.size() == 2);
        REQUIRE(r->rejections.empty());
        REQUIRE(r->warnings.empty());
    }
}
