#include "concurrency/CopyTask.hpp"
#include "sort/Copier.hpp"

using namespace fsort::concurrency;
using namespace fsort::sort;
using namespace fsort::sort::model;

CopyTask::CopyTask(std::shared_ptr<const Copier> copier,
                   std::filesystem::path source,
                   std::filesystem::path outputRoot)
    : copier_(std::move(copier)), source_(std::move(source)), outputRoot_(std::move(outputRoot)) {}

void CopyTask::operator()() {
    try {
        promise.set_value(copier_->copy(source_, outputRoot_));
    } catch (const std::exception& e) {
        promise.set_value(CopyOutcome{source_, Failed{e.what()}});
    } catch (...) {
        promise.set_value(CopyOutcome{source_, Failed{"unknown error"}});
    }
}
