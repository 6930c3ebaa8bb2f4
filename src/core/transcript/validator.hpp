#pragma once

#include "../detector/audio_analysis.hpp"
#include "transcript_entry.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

struct ValidatorOptions {
    double confidence_threshold = 0.7;
    double default_confidence = 0.5;
    std::vector<std::string> suspicious_phrases;
    double length_sanity_window = 2.0;  // expected seconds of speech per entry
};

class TranscriptValidator {
public:
    // Phrases are lower-cased; empty phrases are dropped since they would match everything.
    explicit TranscriptValidator(ValidatorOptions opts = {});

    std::expected<ValidatedTranscript, ParseFailure>
        validate(std::string_view raw_json, const AudioAnalysis& analysis) const;

    // max(1, floor(speech / length_sanity_window))
    size_t expected_max_entries(const AudioAnalysis& analysis) const;

    const ValidatorOptions& options() const { return opts_; }

private:
    bool is_suspicious(const std::string& text) const;

    ValidatorOptions opts_;
};
