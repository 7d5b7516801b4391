#include "sort/model/RunSummary.hpp"

#include <nlohmann/json.hpp>

using namespace fsort::sort::model;

void fsort::sort::model::to_json(nlohmann::json& j, const FailureRecord& f) {
    j = nlohmann::json{
        {"source", f.source.string()},
        {"reason", f.reason}
    };
}

void fsort::sort::model::to_json(nlohmann::json& j, const RunSummary& s) {
    j = nlohmann::json{
        {"total", s.total},
        {"succeeded", s.succeeded},
        {"failed", s.failed},
        {"extensions", s.extensions},
        {"failures", s.failures}
    };
}
