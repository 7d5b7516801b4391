#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fsort::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SorterConfig> {
    static Node encode(const SorterConfig& rhs) {
        Node node;
        node["max_concurrent"] = rhs.max_concurrent;
        node["chunk_size_bytes"] = rhs.chunk_size_bytes;
        node["no_extension_key"] = rhs.no_extension_key;
        node["max_name_attempts"] = rhs.max_name_attempts;
        return node;
    }

    static bool decode(const Node& node, SorterConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_concurrent = node["max_concurrent"].as<unsigned int>(DEFAULT_MAX_CONCURRENT);
        rhs.chunk_size_bytes = node["chunk_size_bytes"].as<std::size_t>(DEFAULT_CHUNK_SIZE_BYTES);
        rhs.no_extension_key = node["no_extension_key"].as<std::string>(DEFAULT_NO_EXTENSION_KEY);
        rhs.max_name_attempts = node["max_name_attempts"].as<unsigned int>(10000);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["filesorter"] = to_std_string(spdlog::level::to_string_view(rhs.filesorter));
        node["scan"]       = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["copy"]       = to_std_string(spdlog::level::to_string_view(rhs.copy));
        node["sched"]      = to_std_string(spdlog::level::to_string_view(rhs.sched));
        node["report"]     = to_std_string(spdlog::level::to_string_view(rhs.report));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.filesorter = spdlog::level::from_str(node["filesorter"].as<std::string>("info"));
        rhs.scan = spdlog::level::from_str(node["scan"].as<std::string>("info"));
        rhs.copy = spdlog::level::from_str(node["copy"].as<std::string>("info"));
        rhs.sched = spdlog::level::from_str(node["sched"].as<std::string>("info"));
        rhs.report = spdlog::level::from_str(node["report"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_file"] = rhs.log_file.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_file = node["log_file"].as<std::string>(DEFAULT_LOG_FILE);
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
