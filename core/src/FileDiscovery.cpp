#include "bc/core/util/FileDiscovery.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace bc {

namespace {

std::string lowered(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void walk(const fs::path& dir, const std::string& ext, std::vector<fs::path>& out)
{
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        Logger()->warn("skipping unreadable directory {}: {}", dir.string(), ec.message());
        return;
    }

    const fs::directory_iterator end;
    while (it != end) {
        const fs::directory_entry& entry = *it;
        std::error_code sec;
        if (entry.is_symlink(sec)) {
            if (entry.is_regular_file(sec) && hasExtensionIgnoreCase(entry.path(), ext))
                out.push_back(entry.path());
        } else if (entry.is_directory(sec)) {
            walk(entry.path(), ext, out);
        } else if (entry.is_regular_file(sec) && hasExtensionIgnoreCase(entry.path(), ext)) {
            out.push_back(entry.path());
        }

        it.increment(ec);
        if (ec) {
            Logger()->warn("listing of {} stopped early: {}", dir.string(), ec.message());
            break;
        }
    }
}

} // namespace

bool hasExtensionIgnoreCase(const fs::path& path, const std::string& extension)
{
    return lowered(path.extension().string()) == lowered(extension);
}

std::vector<fs::path> discoverContainers(const fs::path& root, const std::string& extension)
{
    std::error_code ec;
    if (!fs::exists(root, ec))
        throw IOError("input directory does not exist: " + root.string());
    if (!fs::is_directory(root, ec))
        throw IOError("input path is not a directory: " + root.string());

    // Probe the root explicitly; an unreadable root is fatal, unlike subdirectories
    fs::directory_iterator probe(root, ec);
    if (ec)
        throw IOError("cannot read input directory " + root.string() + ": " + ec.message());

    std::vector<fs::path> found;
    walk(root, extension, found);
    Logger()->info("found {} {} file(s) below {}", found.size(), extension, root.string());
    return found;
}

} // namespace bc
