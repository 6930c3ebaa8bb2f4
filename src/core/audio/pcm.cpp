#include "pcm.hpp"

#include <cstring>
#include <format>

namespace pcm {

namespace {

template <typename T>
T read_le(const uint8_t* p) {
    T v;
    std::memcpy(&v, p, sizeof(T));
    return v;
}

} // namespace

std::expected<std::vector<float>, AudioError> normalize(const DecodedAudio& audio) {
    if (audio.bit_depth == 0 || audio.bit_depth % 8 != 0) {
        return std::unexpected(AudioError::invalid_format(
            std::format("unsupported bit depth {}", audio.bit_depth)));
    }

    size_t width = audio.bit_depth / 8;
    size_t count = audio.data.size() / width;
    std::vector<float> out(count);
    const uint8_t* p = audio.data.data();

    if (audio.is_float) {
        if (audio.bit_depth != 32) {
            return std::unexpected(AudioError::invalid_format(
                std::format("unsupported float bit depth {}", audio.bit_depth)));
        }
        for (size_t i = 0; i < count; ++i) {
            out[i] = read_le<float>(p + i * 4);
        }
        return out;
    }

    switch (audio.bit_depth) {
        case 8:
            for (size_t i = 0; i < count; ++i) {
                out[i] = (static_cast<float>(p[i]) - 128.0f) / 128.0f;
            }
            break;
        case 16:
            for (size_t i = 0; i < count; ++i) {
                out[i] = static_cast<float>(read_le<int16_t>(p + i * 2)) / 32768.0f;
            }
            break;
        case 32:
            for (size_t i = 0; i < count; ++i) {
                out[i] = static_cast<float>(
                    static_cast<double>(read_le<int32_t>(p + i * 4)) / 2147483648.0);
            }
            break;
        default:
            return std::unexpected(AudioError::invalid_format(
                std::format("unsupported PCM bit depth {}", audio.bit_depth)));
    }
    return out;
}

std::vector<float> downmix(std::span<const float> interleaved, uint16_t channels) {
    if (channels <= 1) {
        return {interleaved.begin(), interleaved.end()};
    }

    size_t frames = interleaved.size() / channels;
    std::vector<float> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        double sum = 0.0;
        for (uint16_t c = 0; c < channels; ++c) {
            sum += interleaved[f * channels + c];
        }
        mono[f] = static_cast<float>(sum / channels);
    }
    return mono;
}

std::expected<AudioSamples, AudioError> to_mono(const DecodedAudio& audio) {
    if (audio.channel_count == 0) {
        return std::unexpected(AudioError::invalid_format("zero channels"));
    }

    auto samples = normalize(audio);
    if (!samples) {
        return std::unexpected(samples.error());
    }

    return AudioSamples{
        .samples = downmix(*samples, audio.channel_count),
        .sample_rate_hz = audio.sample_rate_hz,
        .channel_count = 1,
    };
}

} // namespace pcm
