#include "bc/pipeline/ReportWriter.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/Logging.hpp"
#include "bc/core/util/Overlay.hpp"
#include "bc/core/util/RoiArchive.hpp"
#include "bc/core/util/Tiff.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace bc {

ReportWriter::ReportWriter(fs::path outputRoot) : root_(std::move(outputRoot)) {}

fs::path ReportWriter::spotsTiff(const std::string& series) { return series + "_spots.tiff"; }
fs::path ReportWriter::overlayTiff(const std::string& series) { return series + "_CellOverlay.tiff"; }
fs::path ReportWriter::roiSet(const std::string& series) { return series + "_RoiSet.zip"; }

fs::path ReportWriter::coordinates(const std::string& series, size_t roiIndex)
{
    return fs::path(kCoordinatesDir) / (series + "_Cell" + std::to_string(roiIndex + 1) + ".csv");
}

void writeCoordinatesCsv(const fs::path& path, const std::vector<cv::Point>& spots)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out)
        throw IOError("cannot write " + path.string());
    out << "X,Y\n";
    for (const auto& p : spots)
        out << p.x << ',' << p.y << "\n";
    out.close();
    if (!out)
        throw IOError("failed writing " + path.string());
}

void ReportWriter::writeSeries(StagedOutputs& staged,
                               const Projection& projection,
                               int channel,
                               const std::vector<Roi>& rois,
                               const std::vector<CellMeasurement>& cells) const
{
    const std::string& name = projection.seriesName;
    const cv::Mat& quant = projection.channel(channel);

    std::vector<Roi> measured;
    std::vector<cv::Point> allSpots;
    for (const auto& cell : cells) {
        if (!cell.measured())
            continue;
        measured.push_back(rois.at(cell.index));
        allSpots.insert(allSpots.end(), cell.spots.begin(), cell.spots.end());
        writeCoordinatesCsv(staged.stage(coordinates(name, cell.index)), cell.spots);
    }

    TiffWriteOptions spotsOpts;
    spotsOpts.description = imagejHyperstackDescription(2, true);
    writeTiffPages(staged.stage(spotsTiff(name)),
                   {quant, spotLayer(quant.size(), quant.depth(), allSpots)}, spotsOpts);

    cv::Mat overlay = compositeBgr(projection);
    drawRois(overlay, measured);
    writeTiffPages(staged.stage(overlayTiff(name)), {overlay});

    writeRoiSet(staged.stage(roiSet(name)), measured);

    Logger()->debug("staged {} files for {}", staged.pending(), name);
}

void ReportWriter::writeResults(const ResultTable& table) const
{
    table.writeCsv(root_ / kResultsFile);
}

} // namespace bc
