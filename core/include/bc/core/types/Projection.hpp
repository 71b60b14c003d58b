#pragma once

#include "bc/core/types/Series.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace bc {

// One 2D plane per channel, collapsed from a Series.
struct Projection {
    std::string seriesName;
    std::vector<cv::Mat> channels;  ///< same depth as the source planes
    std::vector<LutColor> luts;

    [[nodiscard]] cv::Size size() const {
        return channels.empty() ? cv::Size() : channels.front().size();
    }

    // 1-based channel number; throws bc::ShapeError if absent
    [[nodiscard]] const cv::Mat& channel(int number) const;
};

} // namespace bc
