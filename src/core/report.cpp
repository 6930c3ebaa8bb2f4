#include "report.hpp"

#include <format>
#include <print>

std::string format_analysis(const AudioAnalysis& a) {
    return std::format("Audio Analysis:\n"
                       "  Duration: {:.2f}s\n"
                       "  RMS Energy: {:.4f}\n"
                       "  Speech Duration: {:.2f}s\n"
                       "  Silence Ratio: {:.2f}\n"
                       "  Has Speech: {}",
                       a.duration_seconds(), a.rms_energy(), a.speech_duration_seconds(),
                       a.silence_ratio(), a.has_speech());
}

std::string format_confidence(const std::optional<double>& confidence) {
    if (!confidence) return "N/A";
    return std::format("{}", *confidence);
}

std::string format_entry(const TranscriptEntry& e) {
    return std::format("{} {}: {} [confidence: {}]",
                       e.time_label, e.speaker_label, e.text, format_confidence(e.confidence));
}

std::string format_rejection(const RejectionRecord& r) {
    const auto& e = r.entry;
    switch (r.reason) {
        case RejectionReason::LowConfidence:
            return std::format("[FILTERED] Low confidence ({:.2f}): {} {}: {}",
                               r.effective_confidence, e.time_label, e.speaker_label, e.text);
        case RejectionReason::SuspiciousContent:
            return std::format("[FILTERED] Suspicious content: {} {}: {}",
                               e.time_label, e.speaker_label, e.text);
    }
    return {};
}

void print_report(std::FILE* out, const PipelineResult& result) {
    std::println(out, "=== {} ===", result.source);

    auto outcome = result.outcome();
    if (outcome == Outcome::ReadFailed || outcome == Outcome::InvalidAudio) {
        std::println(out, "Error: {}", result.audio_error->message);
        return;
    }

    if (result.decode_failed && outcome == Outcome::AnalyzedOnly) {
        std::println(out, "Could not analyze audio ({}).", result.audio_error->message);
    } else if (result.decode_failed) {
        std::println(out, "Could not analyze audio ({}); sending it for transcription anyway.",
                     result.audio_error->message);
    } else {
        std::println(out, "{}", format_analysis(result.analysis));
    }

    switch (outcome) {
        case Outcome::Skipped:
            std::println(out, "\n--- Audio Analysis Result ---");
            std::println(out, "No meaningful speech content detected in audio file.");
            std::println(out, "Skipping transcription to prevent hallucination.");
            return;
        case Outcome::AnalyzedOnly:
            return;
        case Outcome::EngineError:
            std::println(out, "Error processing audio: {}", *result.engine_error);
            return;
        default:
            break;
    }

    std::println(out, "\nProcessing time: {:.2f} seconds", result.processing_s);

    const auto& validation = *result.validation;
    if (!validation) {
        std::println(out, "\n--- Raw Transcript (JSON Parse Failed) ---\n");
        std::println(out, "{}", validation.error().raw_text);
        return;
    }

    std::println(out, "\n--- Transcript ---\n");

    const auto& vt = *validation;
    if (vt.entries.empty() && vt.rejections.empty()) {
        std::println(out, "No speech detected.");
        return;
    }

    for (const auto& r : vt.rejections) {
        std::println(out, "{}", format_rejection(r));
    }
    for (const auto& w : vt.warnings) {
        std::println(out, "[WARNING] {}", w);
    }

    if (vt.entries.empty()) {
        std::println(out, "No high-confidence speech detected after validation.");
        return;
    }

    for (const auto& e : vt.entries) {
        std::println(out, "{}", format_entry(e));
    }
}
