#include "sort/Classifier.hpp"

#include <stdexcept>
#include <boost/algorithm/string.hpp>

using namespace fsort::sort;

Classifier::Classifier(std::string noExtensionKey) : noExtensionKey_(std::move(noExtensionKey)) {
    if (!config::isPlainDirectoryName(noExtensionKey_))
        throw std::invalid_argument("no-extension key must be a plain directory name, got '" + noExtensionKey_ + "'");
}

std::pair<std::string, std::string> Classifier::splitName(const std::string& name) {
    const auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot == name.size() - 1) return {name, ""};
    return {name.substr(0, dot), name.substr(dot)};
}

std::string Classifier::classify(const std::filesystem::path& entry) const {
    const auto ext = splitName(entry.filename().string()).second;
    if (ext.empty()) return noExtensionKey_;
    return boost::algorithm::to_lower_copy(ext.substr(1), std::locale::classic());
}
