#pragma once

#include "config/Config.hpp"
#include "sort/Classifier.hpp"
#include "sort/Enumerator.hpp"
#include "sort/Reporter.hpp"
#include "sort/Scheduler.hpp"
#include "sort/model/RunSummary.hpp"

#include <atomic>
#include <filesystem>
#include <memory>

namespace spdlog { class logger; }

namespace fsort::sort {

class Copier;

/**
 * Wires the pipeline together: enumerate the source tree, copy every file into
 * its extension folder under the output root, then summarize and log the run.
 */
class Sorter {
public:
    explicit Sorter(const config::SorterConfig& cnf,
                    std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr,
                    std::shared_ptr<spdlog::logger> log = nullptr);

    // Uses a caller-provided copier (instrumented copiers in tests).
    Sorter(const config::SorterConfig& cnf,
           std::shared_ptr<const Copier> copier,
           std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr,
           std::shared_ptr<spdlog::logger> log = nullptr);

    // Logs and returns false when source is missing or not a directory.
    [[nodiscard]] bool validateSource(const std::filesystem::path& source) const;

    /**
     * Creates outputRoot, then sorts every regular file of source into it.
     * Never throws: unexpected faults are logged as critical and the summary
     * collected so far is returned. An empty source logs a warning and creates
     * no extension folders.
     */
    model::RunSummary process(const std::filesystem::path& source,
                              const std::filesystem::path& outputRoot,
                              unsigned int concurrencyLimit) const;

    model::RunSummary process(const std::filesystem::path& source,
                              const std::filesystem::path& outputRoot) const;

private:
    config::SorterConfig cnf_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
    std::shared_ptr<spdlog::logger> log_;
    Classifier classifier_;
    Enumerator enumerator_;
    std::shared_ptr<const Copier> copier_;
    Scheduler scheduler_;
    Reporter reporter_;
};

}
