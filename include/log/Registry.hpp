#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace fsort::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. Call once at process start.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> filesorter() { return get("filesorter"); }
    static std::shared_ptr<spdlog::logger> scan()       { return get("scan"); }
    static std::shared_ptr<spdlog::logger> copy()       { return get("copy"); }
    static std::shared_ptr<spdlog::logger> sched()      { return get("sched"); }
    static std::shared_ptr<spdlog::logger> report()     { return get("report"); }

    [[nodiscard]] static bool isInitialized();

    // Applies one level to every logger and both sinks (used by --verbose).
    static void setLevel(spdlog::level::level_enum level);

    // Flushes and drops every logger. Call once at process end.
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_file_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt>   file_sink_;
};

}
