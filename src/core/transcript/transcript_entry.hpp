#pragma once

#include <optional>
#include <string>
#include <vector>

// One utterance as reported by the transcription engine. Untrusted.
struct TranscriptEntry {
    std::string time_label;            // nominally "[MM:SS]"
    std::string speaker_label = "Unknown";
    std::string text;
    std::optional<double> confidence;  // absent or non-numeric in the source

    bool operator==(const TranscriptEntry&) const = default;
};

enum class RejectionReason { LowConfidence, SuspiciousContent };

struct RejectionRecord {
    TranscriptEntry entry;
    RejectionReason reason;
    double effective_confidence = 0.0; // confidence used for the decision
};

struct ValidatedTranscript {
    std::vector<TranscriptEntry> entries;  // engine order
    std::vector<RejectionRecord> rejections;
    std::vector<std::string> warnings;
};

// Engine output that was not a JSON array of objects.
struct ParseFailure {
    std::string raw_text;  // verbatim engine output
    std::string message;
};

inline const char* to_string(RejectionReason r) {
    switch (r) {
        case RejectionReason::LowConfidence: return "low_confidence";
        case RejectionReason::SuspiciousContent: return "suspicious_content";
    }
    return "unknown";
}
