#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Raw container contents as produced by the decoder, before normalization.
struct DecodedAudio {
    uint32_t sample_rate_hz = 0;
    uint16_t channel_count = 0;
    uint16_t bit_depth = 0;
    bool is_float = false;
    std::vector<uint8_t> data; // interleaved little-endian frames
};

// Normalized amplitudes in [-1.0, 1.0].
struct AudioSamples {
    std::vector<float> samples;
    uint32_t sample_rate_hz = 0;
    uint16_t channel_count = 1;
};

struct AudioError {
    enum class Kind { InvalidAudioFormat, AudioDecodeFailure };

    Kind kind;
    std::string message;

    static AudioError invalid_format(std::string msg) {
        return {Kind::InvalidAudioFormat, std::move(msg)};
    }
    static AudioError decode_failure(std::string msg) {
        return {Kind::AudioDecodeFailure, std::move(msg)};
    }
};
