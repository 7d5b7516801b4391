#include "sort/Namer.hpp"
#include "sort/Classifier.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace fsort::sort {

bool pathOccupied(const std::filesystem::path& p) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const auto st = fs::symlink_status(p, ec);
    if (st.type() == fs::file_type::not_found) return false;
    if (ec) throw fs::filesystem_error("Cannot inspect candidate path", p, ec);
    return true;
}

std::filesystem::path resolveTarget(const std::filesystem::path& targetDir,
                                    const std::string& desiredName,
                                    const ExistsFn& exists,
                                    const unsigned long firstCounter,
                                    unsigned long* counterOut) {
    if (firstCounter == 0) {
        auto candidate = targetDir / desiredName;
        if (!exists(candidate)) {
            if (counterOut) *counterOut = 0;
            return candidate;
        }
    }

    const auto [stem, ext] = Classifier::splitName(desiredName);
    for (unsigned long counter = std::max(1ul, firstCounter);; ++counter) {
        auto candidate = targetDir / fmt::format("{}_{}{}", stem, counter, ext);
        if (!exists(candidate)) {
            if (counterOut) *counterOut = counter;
            return candidate;
        }
    }
}

}
