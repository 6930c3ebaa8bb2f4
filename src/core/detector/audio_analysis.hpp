#pragma once

#include <algorithm>

class SpeechDetector;

// Verdict for one audio clip. Only the detector computes it; the
// fail-open placeholder is the sole other way to obtain one.
class AudioAnalysis {
public:
    AudioAnalysis() = default;

    double duration_seconds() const { return duration_s_; }
    double rms_energy() const { return rms_energy_; }
    double speech_duration_seconds() const { return speech_duration_s_; }
    double silence_ratio() const { return silence_ratio_; }
    bool has_speech() const { return has_speech_; }

    // Stand-in used when the audio could not be decoded: assume speech so a
    // real recording is never dropped without being transcribed.
    static AudioAnalysis assume_speech() {
        AudioAnalysis a;
        a.has_speech_ = true;
        return a;
    }

    // Clamped: a truncated window length can make speech slightly exceed duration.
    static double silence_ratio_for(double duration_s, double speech_s) {
        if (duration_s <= 0.0) return 1.0;
        return std::clamp(1.0 - speech_s / duration_s, 0.0, 1.0);
    }

    bool operator==(const AudioAnalysis&) const = default;

private:
    friend class SpeechDetector;

    double duration_s_ = 0.0;
    double rms_energy_ = 0.0;
    double speech_duration_s_ = 0.0;
    double silence_ratio_ = 1.0;
    bool has_speech_ = false;
};
