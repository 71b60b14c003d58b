#include "bc/pipeline/RoiProvider.hpp"
#include "bc/core/util/Logging.hpp"
#include "bc/core/util/RoiArchive.hpp"

namespace fs = std::filesystem;

namespace bc {

RoiSetFileProvider::RoiSetFileProvider(fs::path dir) : dir_(std::move(dir)) {}

fs::path RoiSetFileProvider::archiveFor(const std::string& seriesName) const
{
    return dir_ / (seriesName + "_RoiSet.zip");
}

std::vector<Roi> RoiSetFileProvider::acquire(const Projection& projection, int)
{
    const fs::path archive = archiveFor(projection.seriesName);
    std::error_code ec;
    if (!fs::is_regular_file(archive, ec)) {
        Logger()->info("no ROI archive {}, skipping series", archive.string());
        return {};
    }
    auto rois = readRoiSet(archive);
    Logger()->info("loaded {} ROIs from {}", rois.size(), archive.string());
    return rois;
}

ScriptedRoiProvider::ScriptedRoiProvider(std::map<std::string, std::vector<Roi>> bySeries)
    : bySeries_(std::move(bySeries))
{
}

void ScriptedRoiProvider::set(const std::string& seriesName, std::vector<Roi> rois)
{
    bySeries_[seriesName] = std::move(rois);
}

std::vector<Roi> ScriptedRoiProvider::acquire(const Projection& projection, int)
{
    requested_.push_back(projection.seriesName);
    auto it = bySeries_.find(projection.seriesName);
    return it == bySeries_.end() ? std::vector<Roi>{} : it->second;
}

} // namespace bc
