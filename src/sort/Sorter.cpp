#include "sort/Sorter.hpp"
#include "sort/Copier.hpp"
#include "log/Registry.hpp"

using namespace fsort::sort;
using namespace fsort::sort::model;
using namespace fsort::config;

namespace {

std::shared_ptr<std::atomic<bool>> orNewFlag(std::shared_ptr<std::atomic<bool>> flag) {
    return flag ? std::move(flag) : std::make_shared<std::atomic<bool>>(false);
}

}

Sorter::Sorter(const SorterConfig& cnf,
               std::shared_ptr<std::atomic<bool>> interruptFlag,
               std::shared_ptr<spdlog::logger> log)
    : Sorter(cnf, std::shared_ptr<const Copier>{}, std::move(interruptFlag), std::move(log)) {}

Sorter::Sorter(const SorterConfig& cnf,
               std::shared_ptr<const Copier> copier,
               std::shared_ptr<std::atomic<bool>> interruptFlag,
               std::shared_ptr<spdlog::logger> log)
    : cnf_(cnf),
      interruptFlag_(orNewFlag(std::move(interruptFlag))),
      log_(log ? std::move(log) : fsort::log::Registry::filesorter()),
      classifier_(cnf.no_extension_key),
      copier_(copier ? std::move(copier)
                     : std::make_shared<const Copier>(classifier_,
                                                      CopyOptions{cnf.chunk_size_bytes, cnf.max_name_attempts},
                                                      interruptFlag_)),
      scheduler_(copier_, interruptFlag_),
      reporter_(classifier_) {}

bool Sorter::validateSource(const std::filesystem::path& source) const {
    return enumerator_.validateRoot(source);
}

RunSummary Sorter::process(const std::filesystem::path& source, const std::filesystem::path& outputRoot) const {
    return process(source, outputRoot, cnf_.max_concurrent);
}

RunSummary Sorter::process(const std::filesystem::path& source,
                           const std::filesystem::path& outputRoot,
                           const unsigned int concurrencyLimit) const {
    RunSummary summary;

    try {
        if (!validateSource(source)) return summary;

        std::filesystem::create_directories(outputRoot);

        const auto files = enumerator_.enumerate(source);
        if (files.empty()) {
            log_->warn("[Sorter] No files found to process");
            return summary;
        }

        summary.total = summary.failed = files.size();

        const auto outcomes = scheduler_.run(files, outputRoot, concurrencyLimit);
        summary = reporter_.summarize(files, outcomes);
        reporter_.emit(summary);
    } catch (const std::exception& e) {
        log_->critical("[Sorter] Critical error while processing files: {}", e.what());
    }

    return summary;
}
