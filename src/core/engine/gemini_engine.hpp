#pragma once

#include "engine.hpp"

#include <nlohmann/json.hpp>
#include <string>

// Gemini generateContent over HTTPS, asking for a JSON-typed response.
class GeminiEngine : public TranscriptionEngine {
public:
    struct Settings {
        std::string url;
        std::string model;
        std::string api_key;
        long timeout_seconds = 120;
        double temperature = 0.0;
    };

    explicit GeminiEngine(Settings settings);
    ~GeminiEngine() override;

    GeminiEngine(const GeminiEngine&) = delete;
    GeminiEngine& operator=(const GeminiEngine&) = delete;

    std::expected<EngineResponse, std::string>
        transcribe(std::span<const uint8_t> audio, const std::string& mime_type,
                   const std::string& prompt) override;

    std::string endpoint() const;

    static nlohmann::json build_request(std::span<const uint8_t> audio,
                                        const std::string& mime_type,
                                        const std::string& prompt, double temperature);

    // Extracts the text of the first candidate, or the server's error message.
    static std::expected<std::string, std::string> parse_response(const std::string& body);

private:
    Settings settings_;
};
