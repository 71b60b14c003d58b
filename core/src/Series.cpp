#include "bc/core/types/Series.hpp"
#include "bc/core/util/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace bc {

LutColor lutFromName(const std::string& name)
{
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "red") return LutColor::Red;
    if (n == "green") return LutColor::Green;
    if (n == "blue") return LutColor::Blue;
    if (n == "cyan") return LutColor::Cyan;
    if (n == "magenta") return LutColor::Magenta;
    if (n == "yellow") return LutColor::Yellow;
    return LutColor::Gray;
}

std::string lutName(LutColor lut)
{
    switch (lut) {
        case LutColor::Red:     return "Red";
        case LutColor::Green:   return "Green";
        case LutColor::Blue:    return "Blue";
        case LutColor::Cyan:    return "Cyan";
        case LutColor::Magenta: return "Magenta";
        case LutColor::Yellow:  return "Yellow";
        case LutColor::Gray:    break;
    }
    return "Gray";
}

cv::Vec3f lutWeightsBgr(LutColor lut)
{
    switch (lut) {
        case LutColor::Red:     return {0.f, 0.f, 1.f};
        case LutColor::Green:   return {0.f, 1.f, 0.f};
        case LutColor::Blue:    return {1.f, 0.f, 0.f};
        case LutColor::Cyan:    return {1.f, 1.f, 0.f};
        case LutColor::Magenta: return {1.f, 0.f, 1.f};
        case LutColor::Yellow:  return {0.f, 1.f, 1.f};
        case LutColor::Gray:    break;
    }
    return {1.f, 1.f, 1.f};
}

Series::Series(SeriesInfo info, std::vector<std::vector<cv::Mat>> planes)
    : info_(std::move(info)), planes_(std::move(planes))
{
}

int Series::slices(int channel) const
{
    return static_cast<int>(stack(channel).size());
}

const std::vector<cv::Mat>& Series::stack(int channel) const
{
    if (channel < 0 || channel >= channels()) {
        throw ShapeError("series " + info_.name + " has no channel " +
                         std::to_string(channel + 1) + " (channels: " +
                         std::to_string(channels()) + ")");
    }
    return planes_[static_cast<size_t>(channel)];
}

const cv::Mat& Series::plane(int channel, int z) const
{
    const auto& s = stack(channel);
    if (z < 0 || z >= static_cast<int>(s.size())) {
        throw ShapeError("series " + info_.name + " has no slice " + std::to_string(z));
    }
    return s[static_cast<size_t>(z)];
}

std::string sanitizeSeriesName(const std::string& raw)
{
    std::string out = raw;
    for (char& c : out) {
        const auto u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || c == '.' || c == '_' || c == '-'))
            c = '_';
    }
    if (out.empty())
        out = "series";
    return out;
}

} // namespace bc
