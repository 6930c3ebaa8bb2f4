#pragma once

#include "engine/engine.hpp"

#include <expected>
#include <string>
#include <vector>

// Replays a canned reply and records what it was sent.
class FakeEngine : public TranscriptionEngine {
public:
    explicit FakeEngine(std::expected<EngineResponse, std::string> reply)
        : reply_(std::move(reply)) {}

    std::expected<EngineResponse, std::string>
    transcribe(std::span<const uint8_t> audio, const std::string& mime_type,
               const std::string& prompt) override {
        ++calls;
        last_audio.assign(audio.begin(), audio.end());
        last_mime_type = mime_type;
        last_prompt = prompt;
        return reply_;
    }

    int calls = 0;
    std::vector<uint8_t> last_audio;
    std::string last_mime_type;
    std::string last_prompt;

private:
    std::expected<EngineResponse, std::string> reply_;
};
