#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace fsort::config {

constexpr static unsigned int DEFAULT_MAX_CONCURRENT = 10;
constexpr static std::size_t DEFAULT_CHUNK_SIZE_BYTES = 8 * 1024; // 8KiB
constexpr static const char* DEFAULT_NO_EXTENSION_KEY = "no_extension";
constexpr static const char* DEFAULT_LOG_FILE = "file_sorter.log";

struct SorterConfig {
    unsigned int max_concurrent = DEFAULT_MAX_CONCURRENT;
    std::size_t chunk_size_bytes = DEFAULT_CHUNK_SIZE_BYTES;
    std::string no_extension_key = DEFAULT_NO_EXTENSION_KEY;
    unsigned int max_name_attempts = 10000;  // exclusive-create retries before giving up on a target
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum filesorter = spdlog::level::info;  // Startup, settings, shutdown
    spdlog::level::level_enum scan       = spdlog::level::info;  // Discovery count; per-file lines at debug
    spdlog::level::level_enum copy       = spdlog::level::info;  // Per-file failures; copied lines at debug
    spdlog::level::level_enum sched      = spdlog::level::info;  // Pool lifecycle and task faults
    spdlog::level::level_enum report     = spdlog::level::info;  // Run summary
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_file = DEFAULT_LOG_FILE;
    LogLevelsConfig levels;
};

struct Config {
    SorterConfig sorter;
    LoggingConfig logging;

    void validate() const;
};

Config loadConfig(const std::filesystem::path& path);

// True when name is usable as one directory level below the output root:
// non-empty, not "." or "..", and without a path separator.
bool isPlainDirectoryName(const std::string& name);

} // namespace fsort::config
