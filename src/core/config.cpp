#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("detector")) {
            auto& d = j["detector"];
            if (d.contains("silence_threshold")) cfg.detector.silence_threshold = d["silence_threshold"].get<double>();
            if (d.contains("min_speech_duration")) cfg.detector.min_speech_duration = d["min_speech_duration"].get<double>();
            if (d.contains("window_seconds")) cfg.detector.window_seconds = d["window_seconds"].get<double>();
        }

        if (j.contains("validator")) {
            auto& v = j["validator"];
            if (v.contains("confidence_threshold")) cfg.validator.confidence_threshold = v["confidence_threshold"].get<double>();
            if (v.contains("default_confidence")) cfg.validator.default_confidence = v["default_confidence"].get<double>();
            if (v.contains("suspicious_phrases")) {
                cfg.validator.suspicious_phrases = v["suspicious_phrases"].get<std::vector<std::string>>();
            }
            if (v.contains("length_sanity_window")) cfg.validator.length_sanity_window = v["length_sanity_window"].get<double>();
        }

        if (j.contains("engine")) {
            auto& e = j["engine"];
            if (e.contains("url")) cfg.engine.url = e["url"].get<std::string>();
            if (e.contains("model")) cfg.engine.model = e["model"].get<std::string>();
            if (e.contains("api_key")) cfg.engine.api_key = e["api_key"].get<std::string>();
            if (e.contains("timeout_seconds")) cfg.engine.timeout_seconds = e["timeout_seconds"].get<long>();
            if (e.contains("temperature")) cfg.engine.temperature = e["temperature"].get<double>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("path")) cfg.history.path = h["path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

std::string Config::resolved_api_key() const {
    if (!engine.api_key.empty()) return engine.api_key;
    const char* env = std::getenv("GEMINI_API_KEY");
    return env ? env : "";
}

std::string Config::resolved_history_path() const {
    if (!history.path.empty()) return history.path;
    auto data = platform::data_dir();
    if (!data.empty()) return data + "/history.db";
    return "/tmp/speech-gate/history.db";
}
