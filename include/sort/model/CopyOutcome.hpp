#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <nlohmann/json_fwd.hpp>

namespace fsort::sort::model {

// A discovered regular file. Immutable once enumerated.
using FileEntry = std::filesystem::path;

struct Succeeded {
    std::filesystem::path target;
    uintmax_t bytes{};
};

struct Failed {
    std::string reason;
};

struct CopyOutcome {
    std::filesystem::path source;
    std::variant<Succeeded, Failed> result;

    CopyOutcome() = default;
    CopyOutcome(std::filesystem::path src, Succeeded s) : source(std::move(src)), result(std::move(s)) {}
    CopyOutcome(std::filesystem::path src, Failed f) : source(std::move(src)), result(std::move(f)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<Succeeded>(result); }

    // Throw std::bad_variant_access on the wrong alternative.
    [[nodiscard]] const Succeeded& succeeded() const { return std::get<Succeeded>(result); }
    [[nodiscard]] const Failed& failed() const { return std::get<Failed>(result); }
};

void to_json(nlohmann::json& j, const CopyOutcome& o);

}
