#pragma once

#include "bc/core/types/Projection.hpp"
#include "bc/core/types/Roi.hpp"
#include "bc/core/util/SpotDetector.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace bc {

// Outcome for one ROI of a series.
struct CellMeasurement {
    size_t index = 0;                  ///< position in the ROI list
    std::string label;
    double area = 0.0;
    std::vector<cv::Point> spots;
    std::optional<std::string> error;  ///< set when the ROI was rejected

    [[nodiscard]] bool measured() const { return !error.has_value(); }
};

/**
 * @brief Area and spots for every ROI, in ROI order
 *
 * ROIs are measured in parallel. An ROI that fails geometry validation is
 * returned with `error` set; all others are measured.
 */
std::vector<CellMeasurement> measureCells(const PreparedPlane& plane,
                                          const std::vector<Roi>& rois,
                                          const SpotDetector& detector);

// Preprocesses `channel` (1-based) of the projection and measures every ROI.
// @throws bc::ShapeError if the channel does not exist
std::vector<CellMeasurement> measureCells(const Projection& projection,
                                          const std::vector<Roi>& rois,
                                          const SpotDetector& detector,
                                          int channel);

} // namespace bc
