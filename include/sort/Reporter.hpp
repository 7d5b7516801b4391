#pragma once

#include "sort/Classifier.hpp"
#include "sort/model/CopyOutcome.hpp"
#include "sort/model/RunSummary.hpp"

#include <memory>
#include <vector>

namespace spdlog { class logger; }

namespace fsort::sort {

class Reporter {
public:
    explicit Reporter(Classifier classifier = Classifier{}, std::shared_ptr<spdlog::logger> log = nullptr);

    // Inputs without an outcome count as failed, so succeeded + failed == files.size().
    [[nodiscard]] model::RunSummary summarize(const std::vector<model::FileEntry>& files,
                                              const std::vector<model::CopyOutcome>& outcomes) const;

    void emit(const model::RunSummary& summary) const;

private:
    Classifier classifier_;
    std::shared_ptr<spdlog::logger> log_;
};

}
