#include "sort/Reporter.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <set>
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace fsort::sort;
using namespace fsort::sort::model;

Reporter::Reporter(Classifier classifier, std::shared_ptr<spdlog::logger> log)
    : classifier_(std::move(classifier)),
      log_(log ? std::move(log) : fsort::log::Registry::report()) {}

RunSummary Reporter::summarize(const std::vector<FileEntry>& files, const std::vector<CopyOutcome>& outcomes) const {
    RunSummary summary;
    summary.total = files.size();

    std::set<std::filesystem::path> reported;
    for (const auto& o : outcomes) {
        reported.insert(o.source);
        if (o.ok()) ++summary.succeeded;
        else summary.failures.push_back({o.source, o.failed().reason});
    }

    for (const auto& f : files)
        if (!reported.contains(f)) summary.failures.push_back({f, "no outcome recorded"});

    summary.succeeded = std::min(summary.succeeded, summary.total);
    summary.failed = summary.total - summary.succeeded;

    for (const auto& f : files) summary.extensions.insert(classifier_.classify(f));

    std::sort(summary.failures.begin(), summary.failures.end(),
              [](const FailureRecord& a, const FailureRecord& b) { return a.source < b.source; });

    return summary;
}

void Reporter::emit(const RunSummary& summary) const {
    log_->info("[Reporter] Processing finished. Total: {}, succeeded: {}, failed: {}",
               summary.total, summary.succeeded, summary.failed);
    log_->info("[Reporter] Extension folders: {}", summary.extensions.size());
    log_->info("[Reporter] Extensions: {}", fmt::join(summary.extensions, ", "));

    for (const auto& f : summary.failures)
        log_->debug("[Reporter] Failed: {} ({})", f.source.string(), f.reason);
}
