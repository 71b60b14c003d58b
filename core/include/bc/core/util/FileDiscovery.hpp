#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace bc {

/**
 * @brief Recursively collect container files below `root`
 *
 * Depth-first in directory-listing order; `extension` (e.g. ".lif") is
 * matched case-insensitively. Subdirectories that cannot be listed are
 * skipped with a warning; symlinked directories are not followed.
 *
 * @throws bc::IOError if root is missing, not a directory or unreadable
 */
std::vector<std::filesystem::path> discoverContainers(
    const std::filesystem::path& root,
    const std::string& extension = ".lif");

bool hasExtensionIgnoreCase(const std::filesystem::path& path, const std::string& extension);

} // namespace bc
