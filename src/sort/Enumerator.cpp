#include "sort/Enumerator.hpp"
#include "log/Registry.hpp"

using namespace fsort::sort;
using namespace fsort::sort::model;

namespace fs = std::filesystem;

namespace {

// A real directory (not a link to one) that the walk would step into next.
bool isDescendable(const fs::directory_entry& entry) {
    std::error_code ec;
    return !entry.is_symlink(ec) && entry.is_directory(ec);
}

}

Enumerator::Enumerator(std::shared_ptr<spdlog::logger> log)
    : log_(log ? std::move(log) : fsort::log::Registry::scan()) {}

bool Enumerator::validateRoot(const fs::path& root) const {
    std::error_code ec;
    const auto st = fs::status(root, ec);

    if (st.type() == fs::file_type::not_found) {
        log_->error("[Enumerator] Source folder does not exist: {}", root.string());
        return false;
    }

    if (ec) {
        log_->error("[Enumerator] Cannot inspect source folder {}: {}", root.string(), ec.message());
        return false;
    }

    if (!fs::is_directory(st)) {
        log_->error("[Enumerator] Path is not a directory: {}", root.string());
        return false;
    }

    return true;
}

std::vector<FileEntry> Enumerator::enumerate(const fs::path& root) const {
    std::vector<FileEntry> files;
    if (!validateRoot(root)) return files;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        log_->error("[Enumerator] Failed to open folder {}: {}", root.string(), ec.message());
        return files;
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;

        // is_regular_file follows symlinks; the error_code overload reports
        // dangling links as "not a regular file" rather than failing.
        std::error_code typeEc;
        if (it->is_regular_file(typeEc)) {
            files.push_back(it->path());
            log_->debug("[Enumerator] Found file: {}", it->path().string());
            continue;
        }

        if (isDescendable(*it) && !canOpen(it->path())) it.disable_recursion_pending();
    }

    if (ec) log_->error("[Enumerator] Error while reading folder {}: {}", root.string(), ec.message());

    log_->info("[Enumerator] Found {} files in folder {}", files.size(), root.string());
    return files;
}

bool Enumerator::canOpen(const fs::path& dir) const {
    std::error_code ec;
    const fs::directory_iterator probe(dir, ec);
    if (!ec) return true;

    log_->error("[Enumerator] Skipping unreadable folder {}: {}", dir.string(), ec.message());
    return false;
}
