#pragma once

#include "sort/model/CopyOutcome.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace spdlog { class logger; }

namespace fsort::sort {

class Enumerator {
public:
    explicit Enumerator(std::shared_ptr<spdlog::logger> log = nullptr);

    // Every regular file under root, recursively. Symlinks to regular files are
    // included; symlinked directories are not descended into. Never throws: a
    // missing or non-directory root yields an empty list. A subfolder that cannot
    // be opened is logged and skipped while its siblings are still walked; any
    // other traversal error ends the walk with whatever was collected before it.
    [[nodiscard]] std::vector<model::FileEntry> enumerate(const std::filesystem::path& root) const;

    // Logs and returns false when root is missing or is not a directory.
    [[nodiscard]] bool validateRoot(const std::filesystem::path& root) const;

private:
    bool canOpen(const std::filesystem::path& dir) const;

    std::shared_ptr<spdlog::logger> log_;
};

}
