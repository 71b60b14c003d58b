#include "bc/core/util/Overlay.hpp"
#include "bc/core/util/Errors.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>

namespace bc {

cv::Mat toDisplay8u(const cv::Mat& plane)
{
    if (plane.empty() || plane.channels() != 1)
        throw ShapeError("display conversion needs a single-channel plane");

    double lo = 0, hi = 0;
    cv::minMaxLoc(plane, &lo, &hi);
    cv::Mat out;
    if (hi <= lo) {
        out = cv::Mat::zeros(plane.size(), CV_8U);
        return out;
    }
    const double scale = 255.0 / (hi - lo);
    plane.convertTo(out, CV_8U, scale, -lo * scale);
    return out;
}

cv::Mat channelBgr(const Projection& projection, int channelIndex)
{
    const cv::Mat& plane = projection.channel(channelIndex + 1);
    const LutColor lut = channelIndex < static_cast<int>(projection.luts.size())
                             ? projection.luts[channelIndex]
                             : LutColor::Gray;

    cv::Mat gray;
    toDisplay8u(plane).convertTo(gray, CV_32F);
    const cv::Vec3f w = lutWeightsBgr(lut);
    std::vector<cv::Mat> bgr = {gray * w[0], gray * w[1], gray * w[2]};
    cv::Mat merged;
    cv::merge(bgr, merged);
    return merged;
}

cv::Mat compositeBgr(const Projection& projection)
{
    if (projection.channels.empty())
        throw ShapeError("projection of " + projection.seriesName + " has no channels");

    cv::Mat acc = cv::Mat::zeros(projection.size(), CV_32FC3);
    for (int c = 0; c < static_cast<int>(projection.channels.size()); ++c)
        acc += channelBgr(projection, c);

    cv::Mat out;
    acc.convertTo(out, CV_8UC3);
    return out;
}

void drawRois(cv::Mat& bgr, const std::vector<Roi>& rois, const cv::Scalar& color)
{
    for (const auto& roi : rois) {
        if (roi.vertices.size() < 2)
            continue;

        std::vector<cv::Point> pts;
        cv::Point2f centroid(0, 0);
        for (const auto& v : roi.vertices) {
            pts.emplace_back(static_cast<int>(std::lround(v.x)), static_cast<int>(std::lround(v.y)));
            centroid += v;
        }
        centroid *= 1.0f / static_cast<float>(roi.vertices.size());

        cv::polylines(bgr, std::vector<std::vector<cv::Point>>{pts}, true, color, 1, cv::LINE_8);

        int baseline = 0;
        const cv::Size text = cv::getTextSize(roi.label, cv::FONT_HERSHEY_SIMPLEX, 0.4, 1, &baseline);
        const cv::Point org(static_cast<int>(centroid.x) - text.width / 2,
                            static_cast<int>(centroid.y) + text.height / 2);
        cv::putText(bgr, roi.label, org, cv::FONT_HERSHEY_SIMPLEX, 0.4, color, 1, cv::LINE_AA);
    }
}

cv::Mat spotLayer(cv::Size size, int depth, const std::vector<cv::Point>& spots)
{
    cv::Mat layer = cv::Mat::zeros(size, CV_MAKETYPE(depth, 1));
    const cv::Rect bounds(0, 0, size.width, size.height);
    for (const auto& p : spots) {
        if (!bounds.contains(p))
            continue;
        switch (depth) {
        case CV_8U: layer.at<uint8_t>(p) = 255; break;
        case CV_16U: layer.at<uint16_t>(p) = 65535; break;
        case CV_32F: layer.at<float>(p) = 1.0f; break;
        default: throw ShapeError("unsupported spot layer depth " + std::to_string(depth));
        }
    }
    return layer;
}

} // namespace bc
