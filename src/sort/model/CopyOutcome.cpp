#include "sort/model/CopyOutcome.hpp"

#include <nlohmann/json.hpp>

using namespace fsort::sort::model;

void fsort::sort::model::to_json(nlohmann::json& j, const CopyOutcome& o) {
    j = nlohmann::json{
        {"source", o.source.string()},
        {"ok", o.ok()}
    };

    if (o.ok()) {
        j["target"] = o.succeeded().target.string();
        j["bytes"] = o.succeeded().bytes;
    } else {
        j["reason"] = o.failed().reason;
    }
}
