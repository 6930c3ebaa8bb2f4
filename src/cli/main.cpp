#include "cli_options.hpp"
#include "config.hpp"
#include "engine/gemini_engine.hpp"
#include "pipeline.hpp"
#include "report.hpp"
#include "storage/history_db.hpp"

#include <print>
#include <string>
#include <vector>

static void usage(const char* prog) {
    std::println("Usage: {} [options] <file.wav>...", prog);
    std::println("Options:");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  --analyze-only      Run speech detection only, never call the engine");
    std::println("  --history [N]       Show the last N recorded runs (default 10)");
    std::println("  -h, --help          Show this help");
}

static int show_history(const Config& config, int limit) {
    HistoryDb db;
    auto path = config.resolved_history_path();
    if (!db.open(path)) {
        std::println(stderr, "Failed to open history at {}", path);
        return 1;
    }

    for (auto& e : db.recent(limit)) {
        std::println("[{}] {} ({}, {:.2f}s audio, {:.2f}s speech, {} kept, {} filtered)",
                     e.timestamp, e.source, e.outcome, e.audio_duration, e.speech_duration,
                     e.entry_count, e.rejected_count);
        if (!e.transcript.empty()) {
            std::println("  {}", e.transcript);
        }
    }
    return 0;
}

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::println(stderr, "{}", parsed.error());
        usage(argv[0]);
        return 1;
    }
    auto& opts = *parsed;
    if (opts.help) {
        usage(argv[0]);
        return 0;
    }

    Config config;
    if (!opts.config_path.empty()) {
        config = Config::load(opts.config_path);
    } else {
        config = Config::load_default();
    }

    if (opts.history_limit > 0) {
        return show_history(config, opts.history_limit);
    }

    GeminiEngine engine(GeminiEngine::Settings{
        .url = config.engine.url,
        .model = config.engine.model,
        .api_key = config.resolved_api_key(),
        .timeout_seconds = config.engine.timeout_seconds,
        .temperature = config.engine.temperature,
    });

    if (!opts.analyze_only && config.resolved_api_key().empty()) {
        std::println(stderr, "No API key: set engine.api_key in the config or GEMINI_API_KEY");
        return 1;
    }

    if (opts.verbose) {
        std::println(stderr, "[speech-gate] Starting (engine: {} @ {})",
                     config.engine.model, config.engine.url);
    }

    SpeechPipeline pipeline(SpeechDetector(config.detector),
                            TranscriptValidator(config.validator), engine, opts.verbose);
    pipeline.set_transcription_enabled(!opts.analyze_only);

    HistoryDb history;
    if (config.history.enabled) {
        if (history.open(config.resolved_history_path())) {
            pipeline.set_history(&history);
        } else {
            std::println(stderr, "Warning: history DB failed to open, history disabled");
        }
    }

    bool all_ok = true;
    for (const auto& file : opts.files) {
        auto result = pipeline.process_file(file);
        print_report(stdout, result);
        std::println("");
        all_ok = all_ok && result.ok();
    }

    return all_ok ? 0 : 1;
}
