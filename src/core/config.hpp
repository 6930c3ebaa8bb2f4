#pragma once

#include "detector/speech_detector.hpp"
#include "transcript/validator.hpp"

#include <string>
#include <vector>

struct Config {
    DetectorOptions detector;
    ValidatorOptions validator;

    struct Engine {
        std::string url = "https://generativelanguage.googleapis.com";
        std::string model = "gemini-2.5-flash";
        std::string api_key;  // empty: taken from GEMINI_API_KEY
        long timeout_seconds = 120;
        double temperature = 0.0;
    } engine;

    struct History {
        bool enabled = true;
        std::string path;  // empty: <data dir>/history.db
    } history;

    static Config load(const std::string& path);
    static Config load_default();

    // Key from the config file, else from the environment.
    std::string resolved_api_key() const;
    std::string resolved_history_path() const;
};
