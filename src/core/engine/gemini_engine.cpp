#include "gemini_engine.hpp"
#include "base64.hpp"

#include <chrono>
#include <curl/curl.h>
#include <format>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

GeminiEngine::GeminiEngine(Settings settings) : settings_(std::move(settings)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

GeminiEngine::~GeminiEngine() {
    curl_global_cleanup();
}

std::string GeminiEngine::endpoint() const {
    std::string base = settings_.url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/v1beta/models/" + settings_.model + ":generateContent";
}

json GeminiEngine::build_request(std::span<const uint8_t> audio, const std::string& mime_type,
                                 const std::string& prompt, double temperature) {
    json safety = json::array();
    for (const char* category : {"HARM_CATEGORY_DANGEROUS_CONTENT",
                                 "HARM_CATEGORY_HATE_SPEECH",
                                 "HARM_CATEGORY_HARASSMENT",
                                 "HARM_CATEGORY_SEXUALLY_EXPLICIT"}) {
        safety.push_back({{"category", category}, {"threshold", "BLOCK_NONE"}});
    }

    return {
        {"contents", json::array({
            {{"role", "user"},
             {"parts", json::array({
                 {{"inline_data", {{"mime_type", mime_type}, {"data", base64::encode(audio)}}}},
                 {{"text", prompt}},
             })}},
        })},
        {"generationConfig", {
            {"temperature", temperature},
            {"responseMimeType", "application/json"},
        }},
        {"safetySettings", safety},
    };
}

std::expected<std::string, std::string> GeminiEngine::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            auto& err = j["error"];
            std::string msg = err.is_object() ? err.value("message", err.dump()) : err.dump();
            return std::unexpected("server error: " + msg);
        }

        if (!j.contains("candidates") || !j["candidates"].is_array() || j["candidates"].empty()) {
            if (j.contains("promptFeedback")) {
                return std::unexpected("request blocked: " + j["promptFeedback"].dump());
            }
            return std::unexpected("unexpected response: " + body);
        }

        auto& candidate = j["candidates"][0];
        if (!candidate.contains("content") || !candidate["content"].contains("parts")) {
            std::string reason = candidate.value("finishReason", "unknown");
            return std::unexpected("candidate has no content (finish reason: " + reason + ")");
        }

        std::string text;
        for (auto& part : candidate["content"]["parts"]) {
            if (part.contains("text") && part["text"].is_string()) {
                text += part["text"].get<std::string>();
            }
        }
        return text;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

std::expected<EngineResponse, std::string>
GeminiEngine::transcribe(std::span<const uint8_t> audio, const std::string& mime_type,
                         const std::string& prompt) {
    if (audio.empty()) {
        return std::unexpected("empty audio");
    }
    if (settings_.api_key.empty()) {
        return std::unexpected("no API key configured");
    }

    std::string payload = build_request(audio, mime_type, prompt, settings_.temperature).dump();

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string url = endpoint();
    std::string key_header = "x-goog-api-key: " + settings_.api_key;

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, key_header.c_str());

    std::string response_body;
    long http_status = 0;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, settings_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    auto text = parse_response(response_body);
    if (!text) {
        if (http_status >= 400) {
            return std::unexpected(std::format("HTTP {}: {}", http_status, text.error()));
        }
        return std::unexpected(text.error());
    }

    return EngineResponse{
        .text = std::move(*text),
        .processing_s = processing_s,
    };
}
