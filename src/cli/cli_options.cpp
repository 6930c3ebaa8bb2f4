#include "cli_options.hpp"

#include <cstdlib>

std::expected<CliOptions, std::string> parse_args(int argc, const char* const argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--analyze-only") {
            opts.analyze_only = true;
        } else if (arg == "--history") {
            opts.history_limit = 10;
            if (i + 1 < argc && std::atoi(argv[i + 1]) > 0) opts.history_limit = std::atoi(argv[++i]);
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                return std::unexpected(arg + " requires a path");
            }
            opts.config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
            return opts;
        } else if (!arg.empty() && arg[0] == '-') {
            return std::unexpected("Unknown option: " + arg);
        } else {
            opts.files.push_back(arg);
        }
    }

    if (opts.history_limit > 0 && !opts.files.empty()) {
        return std::unexpected(std::string("--history does not take audio files"));
    }
    if (opts.history_limit == 0 && opts.files.empty()) {
        return std::unexpected(std::string("no audio files given"));
    }
    return opts;
}
