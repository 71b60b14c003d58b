#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace bc {

// Display colour a channel is rendered with in composites.
enum class LutColor { Gray, Red, Green, Blue, Cyan, Magenta, Yellow };

LutColor lutFromName(const std::string& name);
std::string lutName(LutColor lut);
// BGR weights in [0,1] for an 8-bit intensity rendered with `lut`.
cv::Vec3f lutWeightsBgr(LutColor lut);

// Metadata of one acquisition, available without reading pixel data.
struct SeriesInfo {
    size_t index = 0;          ///< position among the container's image series
    std::string path;          ///< element path inside the container, '/'-joined
    std::string name;          ///< sanitized name used for output files
    int sizeX = 0;
    int sizeY = 0;
    int sizeZ = 1;
    int sizeC = 1;
    int sizeT = 1;
    int bitsPerSample = 8;
    std::vector<LutColor> luts; ///< one per channel
};

/**
 * @brief Multi-channel z-stack of one acquisition
 *
 * Planes are indexed [channel][z]; all planes are CV_8UC1 or CV_16UC1.
 */
class Series {
public:
    Series() = default;
    Series(SeriesInfo info, std::vector<std::vector<cv::Mat>> planes);

    [[nodiscard]] const SeriesInfo& info() const { return info_; }
    [[nodiscard]] const std::string& name() const { return info_.name; }
    [[nodiscard]] int channels() const { return static_cast<int>(planes_.size()); }
    [[nodiscard]] int slices(int channel) const;

    // 0-based channel and slice
    [[nodiscard]] const cv::Mat& plane(int channel, int z) const;
    [[nodiscard]] const std::vector<cv::Mat>& stack(int channel) const;

private:
    SeriesInfo info_;
    std::vector<std::vector<cv::Mat>> planes_;
};

// Replace every character outside [A-Za-z0-9._-] with '_'.
std::string sanitizeSeriesName(const std::string& raw);

} // namespace bc
