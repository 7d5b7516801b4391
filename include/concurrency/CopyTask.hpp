#pragma once

#include "concurrency/Task.hpp"

#include <filesystem>
#include <memory>

namespace fsort::sort {
class Copier;
}

namespace fsort::concurrency {

// Runs one Copier::copy() and fulfils the promise with its outcome. Any fault,
// including one thrown by an overridden copy(), is delivered as Failed.
class CopyTask final : public PromisedTask {
public:
    CopyTask(std::shared_ptr<const sort::Copier> copier,
             std::filesystem::path source,
             std::filesystem::path outputRoot);

    ~CopyTask() override = default;

    void operator()() override;

private:
    std::shared_ptr<const sort::Copier> copier_;
    std::filesystem::path source_, outputRoot_;
};

}
