#include "pipeline.hpp"

#include "audio/pcm.hpp"
#include "audio/wav_decoder.hpp"
#include "report.hpp"
#include "transcript/prompt.hpp"

#include <format>
#include <print>

const char* to_string(Outcome o) {
    switch (o) {
        case Outcome::Validated: return "validated";
        case Outcome::ParseFailed: return "parse_failed";
        case Outcome::Skipped: return "skipped";
        case Outcome::AnalyzedOnly: return "analyzed_only";
        case Outcome::EngineError: return "engine_error";
        case Outcome::InvalidAudio: return "invalid_audio";
        case Outcome::ReadFailed: return "read_failed";
    }
    return "unknown";
}

Outcome PipelineResult::outcome() const {
    if (audio_error && !decode_failed) {
        return audio_error->kind == AudioError::Kind::InvalidAudioFormat ? Outcome::InvalidAudio
                                                                        : Outcome::ReadFailed;
    }
    if (!analysis.has_speech()) return Outcome::Skipped;
    if (engine_error) return Outcome::EngineError;
    if (!validation) return Outcome::AnalyzedOnly;
    return validation->has_value() ? Outcome::Validated : Outcome::ParseFailed;
}

bool PipelineResult::ok() const {
    switch (outcome()) {
        case Outcome::EngineError:
        case Outcome::InvalidAudio:
        case Outcome::ReadFailed:
            return false;
        default:
            return true;
    }
}

SpeechPipeline::SpeechPipeline(SpeechDetector detector, TranscriptValidator validator,
                               TranscriptionEngine& engine, bool verbose)
    : detector_(std::move(detector)), validator_(std::move(validator)),
      engine_(engine), verbose_(verbose) {}

PipelineResult SpeechPipeline::process_file(const std::string& path) {
    log("Loading audio: " + path);

    auto bytes = wav::read_file(path);
    if (!bytes) {
        PipelineResult result;
        result.source = path;
        result.audio_error = bytes.error();
        record(result);
        return result;
    }
    return process(*bytes, path);
}

PipelineResult SpeechPipeline::process(std::span<const uint8_t> wav_bytes,
                                       const std::string& source) {
    PipelineResult result;
    result.source = source;

    auto decoded = wav::decode(wav_bytes);
    if (!decoded) {
        // Fail open: a file we cannot read ourselves may still hold real speech.
        std::println(stderr, "wav: {}: {}", source, decoded.error().message);
        result.audio_error = decoded.error();
        result.decode_failed = true;
        result.analysis = AudioAnalysis::assume_speech();
    } else {
        auto analysis = pcm::to_mono(*decoded).and_then(
            [this](const AudioSamples& mono) { return detector_.analyze(mono); });
        if (!analysis) {
            result.audio_error = analysis.error();
            log(std::format("{}: invalid audio: {}", source, analysis.error().message));
            record(result);
            return result;
        }
        result.analysis = *analysis;
    }

    if (verbose_) {
        log(format_analysis(result.analysis));
    }

    if (!result.analysis.has_speech()) {
        log("No speech detected, skipping transcription");
        record(result);
        return result;
    }

    if (!transcribe_) {
        record(result);
        return result;
    }

    log("Sending for transcription...");
    auto response = engine_.transcribe(wav_bytes, "audio/wav", build_prompt(result.analysis));
    if (!response) {
        std::println(stderr, "engine: {}: {}", source, response.error());
        result.engine_error = response.error();
        record(result);
        return result;
    }

    result.processing_s = response->processing_s;
    log(std::format("Transcription complete: {:.2f}s processing", response->processing_s));

    result.validation = validator_.validate(response->text, result.analysis);
    record(result);
    return result;
}

void SpeechPipeline::record(const PipelineResult& result) {
    if (!history_ || !history_->is_open()) return;

    HistoryEntry e;
    e.source = result.source;
    e.audio_duration = result.analysis.duration_seconds();
    e.speech_duration = result.analysis.speech_duration_seconds();
    e.has_speech = result.analysis.has_speech();
    e.outcome = to_string(result.outcome());

    if (result.validation && result.validation->has_value()) {
        const auto& vt = result.validation->value();
        e.entry_count = static_cast<int64_t>(vt.entries.size());
        e.rejected_count = static_cast<int64_t>(vt.rejections.size());
        for (const auto& entry : vt.entries) {
            if (!e.transcript.empty()) e.transcript += '\n';
            e.transcript += std::format("{} {}: {}", entry.time_label, entry.speaker_label, entry.text);
        }
    }

    if (!history_->insert(e)) {
        log("Failed to record run in history");
    }
}

void SpeechPipeline::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[speech-gate] {}", msg);
    }
}
