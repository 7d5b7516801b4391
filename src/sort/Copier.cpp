#include "sort/Copier.hpp"
#include "sort/Namer.hpp"
#include "log/Registry.hpp"

#include <fcntl.h>
#include <stdexcept>
#include <system_error>
#include <vector>
#include <fmt/format.h>

using namespace fsort::sort;
using namespace fsort::sort::model;
using namespace fsort::io;

namespace fs = std::filesystem;

Copier::Copier(Classifier classifier, CopyOptions options,
               std::shared_ptr<std::atomic<bool>> interruptFlag,
               std::shared_ptr<spdlog::logger> log)
    : classifier_(std::move(classifier)),
      options_(options),
      interruptFlag_(std::move(interruptFlag)),
      log_(log ? std::move(log) : fsort::log::Registry::copy()) {
    if (options_.chunkSize == 0) throw std::invalid_argument("Copier chunk size must be positive");
    if (options_.maxNameAttempts == 0) throw std::invalid_argument("Copier name attempts must be positive");
}

bool Copier::isInterrupted() const { return interruptFlag_ && interruptFlag_->load(); }

CopyOutcome Copier::fail(const fs::path& source, const std::string& reason) const {
    log_->error("[Copier] Failed to copy {}: {}", source.string(), reason);
    return {source, Failed{reason}};
}

CopyOutcome Copier::copy(const fs::path& source, const fs::path& outputRoot) const {
    try {
        if (isInterrupted()) return fail(source, INTERRUPTED_REASON);

        const auto targetDir = outputRoot / classifier_.classify(source);
        ensureDirectory(targetDir);

        FileDescriptor in(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
        if (!in) {
            const int err = errno;
            throw std::system_error(err, std::generic_category(), "cannot open source " + source.string());
        }

        auto [target, out] = createTarget(targetDir, source.filename().string());
        const auto bytes = stream(in, out, source, target);

        if (out.close() != 0) {
            const int err = errno;
            throw std::system_error(err, std::generic_category(), "cannot close target " + target.string());
        }

        log_->debug("[Copier] File copied: {} -> {} ({} bytes)", source.string(), target.string(), bytes);
        return {source, Succeeded{std::move(target), bytes}};
    } catch (const std::exception& e) {
        return fail(source, e.what());
    }
}

void Copier::ensureDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (!ec) return;

    // Another copy may have created it between our check and mkdir.
    std::error_code statEc;
    if (fs::is_directory(dir, statEc)) return;
    throw fs::filesystem_error("cannot create target directory", dir, ec);
}

std::pair<fs::path, FileDescriptor> Copier::createTarget(const fs::path& dir, const std::string& name) const {
    unsigned long counter = 0;

    for (unsigned int attempt = 0; attempt < options_.maxNameAttempts; ++attempt) {
        unsigned long used = 0;
        auto candidate = resolveTarget(dir, name, pathOccupied, counter, &used);

        const int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
        if (fd >= 0) return {std::move(candidate), FileDescriptor(fd)};

        const int err = errno;
        if (err != EEXIST)
            throw std::system_error(err, std::generic_category(), "cannot create target " + candidate.string());

        log_->debug("[Copier] {} was claimed concurrently, trying the next name", candidate.string());
        counter = used + 1;
    }

    throw std::runtime_error(fmt::format("no free name for '{}' in {} after {} attempts",
                                         name, dir.string(), options_.maxNameAttempts));
}

uintmax_t Copier::stream(const FileDescriptor& in, const FileDescriptor& out,
                         const fs::path& source, const fs::path& target) const {
    std::vector<char> buffer(options_.chunkSize);
    uintmax_t total = 0;

    while (true) {
        if (isInterrupted()) throw std::runtime_error(INTERRUPTED_REASON);

        const ssize_t n = readSome(in.get(), buffer.data(), buffer.size());
        if (n < 0) {
            const int err = errno;
            throw std::system_error(err, std::generic_category(), "read failed on " + source.string());
        }
        if (n == 0) break;

        if (!writeAll(out.get(), buffer.data(), static_cast<size_t>(n))) {
            const int err = errno;
            throw std::system_error(err, std::generic_category(), "write failed on " + target.string());
        }

        total += static_cast<uintmax_t>(n);
    }

    return total;
}
