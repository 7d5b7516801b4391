#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace fsort::cli {

enum class ExitCode : int {
    Ok = 0,
    StartupFailure = 1,   // also: source validation failed under --strict
    UsageError = 2,
    CopyFailures = 3      // --strict only
};

struct Options {
    std::filesystem::path source, output;
    std::optional<int> maxConcurrent;
    std::optional<std::filesystem::path> configPath, logFile, reportPath;
    bool verbose = false;
    bool strict = false;
    bool help = false;
};

// Throws boost::program_options::error on malformed arguments and
// std::invalid_argument on out-of-range values.
Options parse(int argc, const char* const argv[]);

std::string usage(const std::string& program = "filesorter");

// Config file (when given) with command-line overrides applied, validated.
config::Config resolveConfig(const Options& opts);

}
