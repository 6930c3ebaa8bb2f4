#pragma once

#include "audio_samples.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

// Parses RIFF/WAVE containers held in memory.
namespace wav {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

std::expected<DecodedAudio, AudioError> decode(std::span<const uint8_t> bytes);

std::expected<std::vector<uint8_t>, AudioError> read_file(const std::string& path);

} // namespace wav
