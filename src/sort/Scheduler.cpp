#include "sort/Scheduler.hpp"
#include "sort/Copier.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/CopyTask.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

using namespace fsort::sort;
using namespace fsort::sort::model;
using namespace fsort::concurrency;

Scheduler::Scheduler(std::shared_ptr<const Copier> copier,
                     std::shared_ptr<std::atomic<bool>> interruptFlag,
                     std::shared_ptr<spdlog::logger> log)
    : copier_(std::move(copier)),
      interruptFlag_(interruptFlag ? std::move(interruptFlag) : std::make_shared<std::atomic<bool>>(false)),
      log_(log ? std::move(log) : fsort::log::Registry::sched()) {
    if (!copier_) throw std::invalid_argument("Scheduler requires a Copier");
}

std::vector<CopyOutcome> Scheduler::run(const std::vector<FileEntry>& files,
                                        const std::filesystem::path& outputRoot,
                                        const unsigned int concurrencyLimit) const {
    if (concurrencyLimit == 0) throw std::invalid_argument("Concurrency limit must be a positive integer");

    std::vector<CopyOutcome> outcomes;
    if (files.empty()) return outcomes;
    outcomes.reserve(files.size());

    const auto workers = static_cast<unsigned int>(std::min<size_t>(concurrencyLimit, files.size()));

    std::vector<std::pair<FileEntry, std::future<ExpectedFuture>>> futures;
    futures.reserve(files.size());

    {
        ThreadPool pool(workers, log_);
        log_->debug("[Scheduler] Copying {} files with {} workers (limit {})",
                    files.size(), pool.workerCount(), concurrencyLimit);

        size_t skipped = 0;
        for (const auto& file : files) {
            // Once interrupted, nothing new is queued; the file still gets an outcome.
            if (interruptFlag_->load()) {
                outcomes.emplace_back(file, Failed{INTERRUPTED_REASON});
                ++skipped;
                continue;
            }

            const auto task = std::make_shared<CopyTask>(copier_, file, outputRoot);
            futures.emplace_back(file, task->getFuture().value());
            pool.submit(task);
        }

        if (skipped) log_->warn("[Scheduler] Interrupted, {} files were not queued", skipped);

        for (auto& [file, future] : futures) {
            try {
                outcomes.push_back(future.get());
            } catch (const std::exception& e) {
                log_->error("[Scheduler] No outcome for {}: {}", file.string(), e.what());
                outcomes.emplace_back(file, Failed{e.what()});
            }
        }
    }

    return outcomes;
}
