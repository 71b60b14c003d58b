#pragma once

#include <opencv2/core.hpp>

#include <vector>

namespace bc {

struct SpotDetectorParams {
    double prominence = 50.0;       ///< minimum drop from a maximum to any higher region
    double topHatRadius = 5.0;      ///< 0 disables background subtraction
    double medianRadius = 1.0;      ///< 0 disables smoothing
    bool excludeEdgeMaxima = false;
};

// Filtered plane plus its Otsu foreground, shared by every ROI of a series.
struct PreparedPlane {
    cv::Mat_<float> filtered;
    cv::Mat_<uint8_t> foreground;   ///< 255 where filtered > Otsu threshold
    double threshold = 0.0;         ///< Otsu threshold on the filtered scale
};

/**
 * @brief Otsu foreground of a float plane
 *
 * The plane is binned into 256 levels spanning its min..max and the Otsu
 * level is chosen on that histogram. A constant plane has no foreground.
 */
cv::Mat_<uint8_t> otsuForeground(const cv::Mat_<float>& plane, double* threshold = nullptr);

/**
 * @brief Prominence-based local maxima, MaximumFinder style
 *
 * The search is confined to `domain` (empty = whole plane). Candidates are
 * 8-connected local maxima inside domain and `foreground`, excluding pixels
 * at the plane minimum. They are visited from highest to lowest value (ties
 * row-major); each is flooded over domain pixels >= v0 - prominence and
 * accepted only if neither a higher pixel nor an already processed region
 * is reached. A plateau yields the pixel closest to its centroid.
 *
 * @return accepted maxima sorted row-major
 */
std::vector<cv::Point> findMaxima(const cv::Mat_<float>& plane,
                                  const cv::Mat_<uint8_t>& domain,
                                  const cv::Mat_<uint8_t>& foreground,
                                  double prominence,
                                  bool excludeEdgeMaxima = false);

class SpotDetector {
public:
    explicit SpotDetector(SpotDetectorParams params = {});

    [[nodiscard]] const SpotDetectorParams& params() const { return params_; }

    // Top-hat, median and Otsu gate on one single-channel plane (any depth).
    [[nodiscard]] PreparedPlane preprocess(const cv::Mat& image) const;

    /**
     * @param mask  optional 8-bit mask of the plane's size; null = whole plane
     * @throws bc::GeometryError if the mask size differs from the plane
     */
    [[nodiscard]] std::vector<cv::Point> detectPreprocessed(const PreparedPlane& plane,
                                                            const cv::Mat_<uint8_t>* mask) const;

    [[nodiscard]] std::vector<cv::Point> detect(const cv::Mat& image,
                                                const cv::Mat_<uint8_t>* mask = nullptr) const
    {
        return detectPreprocessed(preprocess(image), mask);
    }

private:
    SpotDetectorParams params_;
};

} // namespace bc
