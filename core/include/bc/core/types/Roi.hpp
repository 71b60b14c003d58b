#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace bc {

// Operator-drawn closed polygon delimiting one cell.
struct Roi {
    std::string label;                 ///< "Cell_<n>"
    std::vector<cv::Point2f> vertices; ///< pixel coordinates, implicitly closed
};

// Label of the ROI created at 0-based position `index`: "Cell_<index+1>".
std::string cellLabel(size_t index);

// Shoelace area of the closed polygon (always >= 0).
double polygonArea(const std::vector<cv::Point2f>& vertices);

// Smallest integer rectangle containing every vertex.
cv::Rect roiBounds(const Roi& roi);

// Throws bc::GeometryError when the ROI has fewer than three vertices, a
// non-finite vertex, or a vertex outside [0,width] x [0,height].
void validateRoi(const Roi& roi, cv::Size imageSize);

/**
 * @brief Pixel mask of the ROI interior
 *
 * A pixel belongs to the ROI when its centre (x+0.5, y+0.5) lies inside
 * the polygon (even-odd rule), so an axis-aligned WxH rectangle on integer
 * coordinates covers exactly W*H pixels.
 *
 * @throws bc::GeometryError via validateRoi()
 */
cv::Mat_<uint8_t> rasterizeRoi(const Roi& roi, cv::Size imageSize);

} // namespace bc
