#include "bc/core/util/RankFilters.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace bc {

std::vector<cv::Point> circularKernel(double radius)
{
    if (radius <= 0.0)
        return {cv::Point(0, 0)};

    const double r2 = radius * radius + 1.0;
    const int kRadius = static_cast<int>(std::sqrt(r2 + 1e-10));
    std::vector<cv::Point> k;
    for (int dy = -kRadius; dy <= kRadius; ++dy) {
        const int dx = static_cast<int>(std::sqrt(r2 - dy * dy + 1e-10));
        for (int x = -dx; x <= dx; ++x)
            k.emplace_back(x, dy);
    }
    return k;
}

cv::Mat circularStructuringElement(double radius)
{
    const auto k = circularKernel(radius);
    int extent = 0;
    for (const auto& p : k)
        extent = std::max({extent, std::abs(p.x), std::abs(p.y)});

    cv::Mat el = cv::Mat::zeros(2 * extent + 1, 2 * extent + 1, CV_8U);
    for (const auto& p : k)
        el.at<uint8_t>(p.y + extent, p.x + extent) = 1;
    return el;
}

cv::Mat_<float> medianFilter(const cv::Mat_<float>& src, double radius)
{
    if (radius <= 0.0 || src.empty())
        return src.clone();

    const auto kernel = circularKernel(radius);
    const int rows = src.rows;
    const int cols = src.cols;
    const size_t mid = kernel.size() / 2;
    cv::Mat_<float> dst(src.size());

    #pragma omp parallel for schedule(static)
    for (int y = 0; y < rows; ++y) {
        std::vector<float> values(kernel.size());
        for (int x = 0; x < cols; ++x) {
            for (size_t i = 0; i < kernel.size(); ++i) {
                const int yy = std::clamp(y + kernel[i].y, 0, rows - 1);
                const int xx = std::clamp(x + kernel[i].x, 0, cols - 1);
                values[i] = src(yy, xx);
            }
            // kernel size is always odd
            std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
            dst(y, x) = values[mid];
        }
    }
    return dst;
}

cv::Mat_<float> whiteTopHat(const cv::Mat_<float>& src, double radius)
{
    if (radius <= 0.0 || src.empty())
        return src.clone();

    cv::Mat opened;
    cv::morphologyEx(src, opened, cv::MORPH_OPEN, circularStructuringElement(radius),
                     cv::Point(-1, -1), 1, cv::BORDER_REPLICATE);
    cv::Mat_<float> out;
    cv::subtract(src, opened, out);
    return out;
}

} // namespace bc
