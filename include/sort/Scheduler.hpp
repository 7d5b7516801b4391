#pragma once

#include "sort/model/CopyOutcome.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <vector>

namespace spdlog { class logger; }

namespace fsort::sort {

class Copier;

class Scheduler {
public:
    explicit Scheduler(std::shared_ptr<const Copier> copier,
                       std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr,
                       std::shared_ptr<spdlog::logger> log = nullptr);

    /**
     * Copies every file into outputRoot with at most concurrencyLimit copies in
     * flight. Returns exactly one outcome per input, in completion-independent
     * order. A failing file never stops the others.
     *
     * Throws std::invalid_argument when concurrencyLimit is zero.
     */
    [[nodiscard]] std::vector<model::CopyOutcome> run(const std::vector<model::FileEntry>& files,
                                                      const std::filesystem::path& outputRoot,
                                                      unsigned int concurrencyLimit) const;

private:
    std::shared_ptr<const Copier> copier_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
    std::shared_ptr<spdlog::logger> log_;
};

}
