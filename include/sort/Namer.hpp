#pragma once

#include <filesystem>
#include <functional>
#include <string>

namespace fsort::sort {

using ExistsFn = std::function<bool(const std::filesystem::path&)>;

// True for any directory entry at p, dangling symlinks included.
// Throws std::filesystem::filesystem_error when p cannot be inspected.
bool pathOccupied(const std::filesystem::path& p);

/**
 * Picks the first free name in targetDir for desiredName.
 *
 * Tries targetDir/desiredName first (only when firstCounter == 0), then
 * targetDir/{stem}_{n}{ext} for n = max(1, firstCounter), max(1, firstCounter) + 1, ...
 * Each step changes the candidate, so the search ends as soon as exists() returns
 * false for one of them. counterOut, if given, receives the counter of the returned
 * name (0 for the unsuffixed name).
 */
std::filesystem::path resolveTarget(const std::filesystem::path& targetDir,
                                    const std::string& desiredName,
                                    const ExistsFn& exists = pathOccupied,
                                    unsigned long firstCounter = 0,
                                    unsigned long* counterOut = nullptr);

}
