#include "speech_detector.hpp"

#include <cmath>
#include <format>

SpeechDetector::SpeechDetector(DetectorOptions opts) : opts_(opts) {}

size_t SpeechDetector::window_samples(uint32_t sample_rate_hz) const {
    if (!(opts_.window_seconds > 0.0)) return 0;
    // Nudge up so 0.1 * 16000 style products never truncate to one less.
    return static_cast<size_t>(opts_.window_seconds * sample_rate_hz + 1e-9);
}

double SpeechDetector::rms(std::span<const float> samples) {
    if (samples.empty()) return 0.0;
    double sum_sq = 0.0;
    for (float s : samples) {
        sum_sq += static_cast<double>(s) * s;
    }
    return std::sqrt(sum_sq / static_cast<double>(samples.size()));
}

std::expected<AudioAnalysis, AudioError>
SpeechDetector::analyze(const AudioSamples& audio) const {
    if (audio.channel_count != 1) {
        return std::unexpected(AudioError::invalid_format(
            std::format("expected mono input, got {} channels", audio.channel_count)));
    }
    return analyze(audio.samples, audio.sample_rate_hz);
}

std::expected<AudioAnalysis, AudioError>
SpeechDetector::analyze(std::span<const float> samples, uint32_t sample_rate_hz) const {
    if (sample_rate_hz == 0) {
        return std::unexpected(AudioError::invalid_format("sample rate must be positive"));
    }
    if (samples.empty()) {
        return std::unexpected(AudioError::invalid_format("no samples"));
    }

    size_t window = window_samples(sample_rate_hz);
    if (window == 0) {
        return std::unexpected(AudioError::invalid_format(
            std::format("analysis window is empty at {} Hz with a {:.3f}s window",
                        sample_rate_hz, opts_.window_seconds)));
    }

    AudioAnalysis a;
    a.duration_s_ = static_cast<double>(samples.size()) / sample_rate_hz;
    a.rms_energy_ = rms(samples);

    // Fixed stride, no overlap; a trailing partial window is not analyzed.
    size_t active = 0;
    for (size_t i = 0; i + window <= samples.size(); i += window) {
        if (rms(samples.subspan(i, window)) > opts_.silence_threshold) {
            ++active;
        }
    }

    a.speech_duration_s_ = static_cast<double>(active) * opts_.window_seconds;
    a.silence_ratio_ = AudioAnalysis::silence_ratio_for(a.duration_s_, a.speech_duration_s_);
    a.has_speech_ = a.speech_duration_s_ >= opts_.min_speech_duration &&
                    a.rms_energy_ > opts_.silence_threshold;
    return a;
}
