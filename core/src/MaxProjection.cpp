#include "bc/core/util/MaxProjection.hpp"
#include "bc/core/util/Errors.hpp"

#include <string>

namespace bc {

const cv::Mat& Projection::channel(int number) const
{
    if (number < 1 || number > static_cast<int>(channels.size())) {
        throw ShapeError("projection of " + seriesName + " has no channel " +
                         std::to_string(number) + " (channels: " +
                         std::to_string(channels.size()) + ")");
    }
    return channels[static_cast<size_t>(number - 1)];
}

cv::Mat maxProject(const std::vector<cv::Mat>& slices)
{
    if (slices.empty())
        throw ShapeError("cannot project an empty stack");

    const cv::Mat& first = slices.front();
    if (first.empty() || first.channels() != 1)
        throw ShapeError("projection expects non-empty single-channel slices");

    cv::Mat out = first.clone();
    for (size_t z = 1; z < slices.size(); ++z) {
        const cv::Mat& s = slices[z];
        if (s.size() != first.size() || s.type() != first.type()) {
            throw ShapeError("slice " + std::to_string(z) + " is " +
                             std::to_string(s.cols) + "x" + std::to_string(s.rows) +
                             ", expected " + std::to_string(first.cols) + "x" +
                             std::to_string(first.rows) + " of the same type");
        }
        cv::max(out, s, out);
    }
    return out;
}

Projection maxIntensityProjection(const Series& series)
{
    Projection p;
    p.seriesName = series.name();
    p.channels.reserve(static_cast<size_t>(series.channels()));
    for (int c = 0; c < series.channels(); ++c) {
        p.channels.push_back(maxProject(series.stack(c)));
        if (p.channels.back().size() != p.channels.front().size()) {
            throw ShapeError("channel " + std::to_string(c + 1) + " of " + series.name() +
                             " differs in size from channel 1");
        }
    }
    p.luts = series.info().luts;
    p.luts.resize(p.channels.size(), LutColor::Gray);
    return p;
}

} // namespace bc
