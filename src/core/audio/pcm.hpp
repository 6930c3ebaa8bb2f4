#pragma once

#include "audio_samples.hpp"

#include <expected>
#include <span>
#include <vector>

// Sample format conversion for the detector input.
namespace pcm {

// Converts raw interleaved frames to floats in [-1, 1]:
//   u8  -> (raw - 128) / 128
//   s16 -> raw / 32768
//   s32 -> raw / 2147483648
//   f32 -> unchanged
std::expected<std::vector<float>, AudioError> normalize(const DecodedAudio& audio);

// Averages interleaved channels into one. A trailing incomplete frame is dropped.
std::vector<float> downmix(std::span<const float> interleaved, uint16_t channels);

std::expected<AudioSamples, AudioError> to_mono(const DecodedAudio& audio);

} // namespace pcm
