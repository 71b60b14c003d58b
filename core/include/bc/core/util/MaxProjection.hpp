#pragma once

#include "bc/core/types/Projection.hpp"
#include "bc/core/types/Series.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace bc {

// Per-pixel maximum across slices. Throws bc::ShapeError when the stack is
// empty or the slices differ in size or type.
cv::Mat maxProject(const std::vector<cv::Mat>& slices);

// Maximum-intensity projection of every channel of `series`.
Projection maxIntensityProjection(const Series& series);

} // namespace bc
