#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <string>
#include <utility>

namespace fsort::sort {

/**
 * Maps a file path to the key of the output subdirectory it belongs in.
 *
 * The key is the suffix after the last '.' of the base name, ASCII lower-cased,
 * without the dot. Names with no usable suffix get the sentinel key:
 *   "README"        -> sentinel
 *   ".bashrc"       -> sentinel (a leading dot does not start a suffix)
 *   "notes."        -> sentinel
 *   "archive.tar.gz" -> "gz"
 *   ".config.yaml"  -> "yaml"
 */
class Classifier {
public:
    // Throws std::invalid_argument unless noExtensionKey is a plain directory name.
    explicit Classifier(std::string noExtensionKey = config::DEFAULT_NO_EXTENSION_KEY);

    [[nodiscard]] std::string classify(const std::filesystem::path& entry) const;

    [[nodiscard]] const std::string& noExtensionKey() const { return noExtensionKey_; }

    // Splits a base name into (stem, ".ext") using the same suffix rule as classify().
    // ext is empty when the name has no suffix.
    static std::pair<std::string, std::string> splitName(const std::string& name);

private:
    std::string noExtensionKey_;
};

}
