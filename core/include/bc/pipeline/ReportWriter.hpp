#pragma once

#include "bc/core/types/Projection.hpp"
#include "bc/core/types/ResultTable.hpp"
#include "bc/core/types/Roi.hpp"
#include "bc/core/util/StagedOutputs.hpp"
#include "bc/pipeline/CellAggregator.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace bc {

/**
 * @brief Lays out the per-series and per-run files under the output root
 *
 *   <series>_spots.tiff          quantification channel + spot layer
 *   <series>_CellOverlay.tiff    composite with ROI outlines and labels
 *   <series>_RoiSet.zip          ImageJ ROI archive
 *   X_Y_Coords/<series>_Cell<n>.csv
 *   Full_Results.csv
 */
class ReportWriter {
public:
    explicit ReportWriter(std::filesystem::path outputRoot);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    // Stage every per-series file; the caller commits. Only measured cells
    // contribute outlines, archive entries and coordinate tables.
    void writeSeries(StagedOutputs& staged,
                     const Projection& projection,
                     int channel,
                     const std::vector<Roi>& rois,
                     const std::vector<CellMeasurement>& cells) const;

    void writeResults(const ResultTable& table) const;

    static std::filesystem::path spotsTiff(const std::string& series);
    static std::filesystem::path overlayTiff(const std::string& series);
    static std::filesystem::path roiSet(const std::string& series);
    static std::filesystem::path coordinates(const std::string& series, size_t roiIndex);
    static constexpr const char* kCoordinatesDir = "X_Y_Coords";
    static constexpr const char* kResultsFile = "Full_Results.csv";

private:
    std::filesystem::path root_;
};

// Spot coordinates as "X,Y" rows.
void writeCoordinatesCsv(const std::filesystem::path& path, const std::vector<cv::Point>& spots);

} // namespace bc
