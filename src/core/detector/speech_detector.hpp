#pragma once

#include "../audio/audio_samples.hpp"
#include "audio_analysis.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>

struct DetectorOptions {
    double silence_threshold = 0.005;  // RMS below this is silence
    double min_speech_duration = 0.2;  // seconds of active windows required
    double window_seconds = 0.1;
};

// Energy-based speech presence check. Holds only read-only options, so one
// instance may analyze clips from several threads at once.
class SpeechDetector {
public:
    explicit SpeechDetector(DetectorOptions opts = {});

    std::expected<AudioAnalysis, AudioError> analyze(const AudioSamples& audio) const;
    std::expected<AudioAnalysis, AudioError>
        analyze(std::span<const float> samples, uint32_t sample_rate_hz) const;

    const DetectorOptions& options() const { return opts_; }

    // Samples per analysis window at the given rate (0 if the rate is too low).
    size_t window_samples(uint32_t sample_rate_hz) const;

    static double rms(std::span<const float> samples);

private:
    DetectorOptions opts_;
};
