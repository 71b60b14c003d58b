#include "bc/core/types/Roi.hpp"
#include "bc/core/util/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace bc {

std::string cellLabel(size_t index)
{
    return "Cell_" + std::to_string(index + 1);
}

double polygonArea(const std::vector<cv::Point2f>& vertices)
{
    const size_t n = vertices.size();
    if (n < 3)
        return 0.0;

    double twice = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const cv::Point2f& a = vertices[i];
        const cv::Point2f& b = vertices[(i + 1) % n];
        twice += static_cast<double>(a.x) * b.y - static_cast<double>(b.x) * a.y;
    }
    return std::abs(twice) * 0.5;
}

cv::Rect roiBounds(const Roi& roi)
{
    if (roi.vertices.empty())
        return {};

    float x0 = std::numeric_limits<float>::max(), y0 = x0;
    float x1 = std::numeric_limits<float>::lowest(), y1 = x1;
    for (const auto& v : roi.vertices) {
        x0 = std::min(x0, v.x); y0 = std::min(y0, v.y);
        x1 = std::max(x1, v.x); y1 = std::max(y1, v.y);
    }
    const int ix0 = static_cast<int>(std::floor(x0));
    const int iy0 = static_cast<int>(std::floor(y0));
    const int ix1 = static_cast<int>(std::ceil(x1));
    const int iy1 = static_cast<int>(std::ceil(y1));
    return {ix0, iy0, ix1 - ix0, iy1 - iy0};
}

void validateRoi(const Roi& roi, cv::Size imageSize)
{
    if (roi.vertices.size() < 3) {
        throw GeometryError(roi.label + " has " + std::to_string(roi.vertices.size()) +
                            " vertices, a polygon needs at least 3");
    }
    for (const auto& v : roi.vertices) {
        if (!std::isfinite(v.x) || !std::isfinite(v.y)) {
            throw GeometryError(roi.label + " has a non-finite vertex");
        }
        if (v.x < 0.f || v.y < 0.f || v.x > static_cast<float>(imageSize.width) ||
            v.y > static_cast<float>(imageSize.height)) {
            throw GeometryError(roi.label + " vertex (" + std::to_string(v.x) + ", " +
                                std::to_string(v.y) + ") lies outside the " +
                                std::to_string(imageSize.width) + "x" +
                                std::to_string(imageSize.height) + " image");
        }
    }
}

cv::Mat_<uint8_t> rasterizeRoi(const Roi& roi, cv::Size imageSize)
{
    validateRoi(roi, imageSize);

    cv::Mat_<uint8_t> mask(imageSize, uint8_t(0));
    const cv::Rect box = roiBounds(roi) & cv::Rect(0, 0, imageSize.width, imageSize.height);
    const size_t n = roi.vertices.size();

    std::vector<double> xs;
    for (int y = box.y; y < box.y + box.height; ++y) {
        const double yc = y + 0.5;
        xs.clear();
        for (size_t i = 0; i < n; ++i) {
            const cv::Point2f& a = roi.vertices[i];
            const cv::Point2f& b = roi.vertices[(i + 1) % n];
            // half-open rule so shared vertices are counted once
            if ((a.y <= yc) != (b.y <= yc)) {
                xs.push_back(a.x + (yc - a.y) * (b.x - a.x) / (b.y - a.y));
            }
        }
        std::sort(xs.begin(), xs.end());

        uint8_t* row = mask.ptr<uint8_t>(y);
        for (size_t k = 0; k + 1 < xs.size(); k += 2) {
            // pixels whose centre x+0.5 falls in [xs[k], xs[k+1])
            int xa = static_cast<int>(std::ceil(xs[k] - 0.5));
            int xb = static_cast<int>(std::ceil(xs[k + 1] - 0.5));
            xa = std::max(xa, 0);
            xb = std::min(xb, imageSize.width);
            for (int x = xa; x < xb; ++x)
                row[x] = 255;
        }
    }
    return mask;
}

} // namespace bc
