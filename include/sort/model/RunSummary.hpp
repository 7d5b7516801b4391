#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fsort::sort::model {

struct FailureRecord {
    std::filesystem::path source;
    std::string reason;
};

struct RunSummary {
    std::size_t total{}, succeeded{}, failed{};
    std::set<std::string> extensions;
    std::vector<FailureRecord> failures;

    [[nodiscard]] bool allSucceeded() const { return failed == 0; }
};

void to_json(nlohmann::json& j, const FailureRecord& f);
void to_json(nlohmann::json& j, const RunSummary& s);

}
