#pragma once

#include "sort/Classifier.hpp"
#include "sort/model/CopyOutcome.hpp"
#include "io/FileDescriptor.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace spdlog { class logger; }

namespace fsort::sort {

constexpr static const char* INTERRUPTED_REASON = "interrupted";

struct CopyOptions {
    std::size_t chunkSize = config::DEFAULT_CHUNK_SIZE_BYTES;
    unsigned int maxNameAttempts = 10000;
};

/**
 * Copies one file into outputRoot/<extension key>/.
 *
 * The target name comes from resolveTarget() and is created with O_CREAT|O_EXCL,
 * so an existing file is never truncated. When another copy claims the name
 * between the check and the open, the name search resumes at the next counter.
 *
 * A failed copy may leave a partially written target behind; it is not removed.
 */
class Copier {
public:
    explicit Copier(Classifier classifier = Classifier{},
                    CopyOptions options = {},
                    std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr,
                    std::shared_ptr<spdlog::logger> log = nullptr);

    virtual ~Copier() = default;

    // Never throws; every failure is returned as Failed(reason).
    [[nodiscard]] virtual model::CopyOutcome copy(const std::filesystem::path& source,
                                                  const std::filesystem::path& outputRoot) const;

    [[nodiscard]] const Classifier& classifier() const { return classifier_; }

    [[nodiscard]] bool isInterrupted() const;

protected:
    model::CopyOutcome fail(const std::filesystem::path& source, const std::string& reason) const;

private:
    static void ensureDirectory(const std::filesystem::path& dir);

    std::pair<std::filesystem::path, io::FileDescriptor>
    createTarget(const std::filesystem::path& dir, const std::string& name) const;

    uintmax_t stream(const io::FileDescriptor& in, const io::FileDescriptor& out,
                     const std::filesystem::path& source, const std::filesystem::path& target) const;

    Classifier classifier_;
    CopyOptions options_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
    std::shared_ptr<spdlog::logger> log_;
};

}
