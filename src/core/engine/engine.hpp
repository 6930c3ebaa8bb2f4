#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>

struct EngineResponse {
    std::string text;  // raw model output, expected to be a JSON array
    double processing_s = 0.0;
};

class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;
    virtual std::expected<EngineResponse, std::string>
        transcribe(std::span<const uint8_t> audio, const std::string& mime_type,
                   const std::string& prompt) = 0;
};
