#pragma once

#include <expected>
#include <string>
#include <vector>

struct CliOptions {
    bool verbose = false;
    bool analyze_only = false;
    bool help = false;
    int history_limit = 0;  // > 0: list history instead of processing files
    std::string config_path;
    std::vector<std::string> files;
};

// Error holds the message to print before the usage text.
std::expected<CliOptions, std::string> parse_args(int argc, const char* const argv[]);
