#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace bc {

/**
 * @brief Offsets of a circular neighbourhood of the given radius
 *
 * Same shape as ImageJ's RankFilters: row dy spans
 * |dx| <= floor(sqrt(r^2 + 1 - dy^2)), so radius 1 is the full 3x3 square.
 * Radius <= 0 yields the centre pixel only.
 */
std::vector<cv::Point> circularKernel(double radius);

// Same neighbourhood as a binary structuring element for OpenCV morphology.
cv::Mat circularStructuringElement(double radius);

// Median over circularKernel(radius); out-of-image pixels replicate the edge.
cv::Mat_<float> medianFilter(const cv::Mat_<float>& src, double radius);

// src - opening(src) with a circular element; identity (copy) for radius <= 0.
cv::Mat_<float> whiteTopHat(const cv::Mat_<float>& src, double radius);

} // namespace bc
