#pragma once

#include "bc/core/types/Projection.hpp"
#include "bc/core/types/Roi.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace bc {

// Linear min..max stretch of a single-channel plane to CV_8U.
cv::Mat toDisplay8u(const cv::Mat& plane);

// Every channel stretched and tinted with its LUT colour, summed to BGR.
cv::Mat compositeBgr(const Projection& projection);

// Same as compositeBgr() for a single channel (0-based) in its LUT colour.
cv::Mat channelBgr(const Projection& projection, int channelIndex);

// Burn ROI outlines and labels into a CV_8UC3 image.
void drawRois(cv::Mat& bgr, const std::vector<Roi>& rois,
              const cv::Scalar& color = cv::Scalar(0, 255, 255));

// Zero plane of `depth` with the depth's maximum at every spot.
cv::Mat spotLayer(cv::Size size, int depth, const std::vector<cv::Point>& spots);

} // namespace bc
