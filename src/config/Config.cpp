#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace fsort::config {

void Config::validate() const {
    if (sorter.max_concurrent == 0)
        throw std::invalid_argument("sorter.max_concurrent must be a positive integer");
    if (sorter.chunk_size_bytes == 0)
        throw std::invalid_argument("sorter.chunk_size_bytes must be a positive integer");
    if (sorter.max_name_attempts == 0)
        throw std::invalid_argument("sorter.max_name_attempts must be a positive integer");
    if (!isPlainDirectoryName(sorter.no_extension_key))
        throw std::invalid_argument("sorter.no_extension_key must be a plain directory name, got '"
                                    + sorter.no_extension_key + "'");
    if (logging.log_file.empty())
        throw std::invalid_argument("logging.log_file cannot be empty");
}

bool isPlainDirectoryName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    if (name.find('/') != std::string::npos) return false;
    return std::filesystem::path(name).filename() == name;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (const auto node = root["sorter"]) cfg.sorter = node.as<SorterConfig>();
    if (const auto node = root["logging"]) cfg.logging = node.as<LoggingConfig>();

    cfg.validate();
    return cfg;
}

} // namespace fsort::config
