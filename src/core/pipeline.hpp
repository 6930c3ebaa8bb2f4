#pragma once

#include "audio/audio_samples.hpp"
#include "detector/speech_detector.hpp"
#include "engine/engine.hpp"
#include "storage/history_db.hpp"
#include "transcript/validator.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>

enum class Outcome {
    Validated,     // engine answered with a JSON array
    ParseFailed,   // engine answered with something else
    Skipped,       // no speech detected, engine not called
    AnalyzedOnly,  // speech detected, transcription disabled
    EngineError,
    InvalidAudio,  // decoded but unusable; never sent for transcription
    ReadFailed,    // file could not be read at all
};

const char* to_string(Outcome o);

struct PipelineResult {
    std::string source;
    AudioAnalysis analysis;
    // Set for InvalidAudio/ReadFailed, and for a decode failure that was recovered.
    std::optional<AudioError> audio_error;
    bool decode_failed = false;
    std::optional<std::string> engine_error;
    std::optional<std::expected<ValidatedTranscript, ParseFailure>> validation;
    double processing_s = 0.0;

    Outcome outcome() const;
    // False for outcomes that should fail the invocation.
    bool ok() const;
};

class SpeechPipeline {
public:
    SpeechPipeline(SpeechDetector detector, TranscriptValidator validator,
                   TranscriptionEngine& engine, bool verbose = false);

    // Transcription is skipped for every clip when disabled.
    void set_transcription_enabled(bool enabled) { transcribe_ = enabled; }
    void set_history(HistoryDb* history) { history_ = history; }

    PipelineResult process_file(const std::string& path);
    PipelineResult process(std::span<const uint8_t> wav_bytes, const std::string& source);

private:
    void record(const PipelineResult& result);
    void log(const std::string& msg);

    SpeechDetector detector_;
    TranscriptValidator validator_;
    TranscriptionEngine& engine_;
    HistoryDb* history_ = nullptr;
    bool transcribe_ = true;
    bool verbose_;
};
