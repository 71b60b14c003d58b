#include "bc/core/util/SpotDetector.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/Logging.hpp"
#include "bc/core/util/RankFilters.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace bc {

namespace {

constexpr uint8_t kListed = 1;
constexpr uint8_t kProcessed = 2;
constexpr uint8_t kEqual = 4;

constexpr int kDx[8] = {-1, 0, 1, -1, 1, -1, 0, 1};
constexpr int kDy[8] = {-1, -1, -1, 0, 0, 1, 1, 1};

struct Candidate {
    float value;
    int offset;
};

} // namespace

cv::Mat_<uint8_t> otsuForeground(const cv::Mat_<float>& plane, double* threshold)
{
    cv::Mat_<uint8_t> fg = cv::Mat_<uint8_t>::zeros(plane.size());
    if (plane.empty())
        return fg;

    double lo = 0, hi = 0;
    cv::minMaxLoc(plane, &lo, &hi);
    if (hi <= lo) {
        if (threshold)
            *threshold = hi;
        return fg;
    }

    cv::Mat binned;
    const double scale = 255.0 / (hi - lo);
    plane.convertTo(binned, CV_8U, scale, -lo * scale);

    const double level = cv::threshold(binned, fg, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    if (threshold)
        *threshold = lo + level / scale;
    return fg;
}

std::vector<cv::Point> findMaxima(const cv::Mat_<float>& plane,
                                  const cv::Mat_<uint8_t>& domain,
                                  const cv::Mat_<uint8_t>& foreground,
                                  double prominence,
                                  bool excludeEdgeMaxima)
{
    if (plane.empty())
        return {};

    const int w = plane.cols;
    const int h = plane.rows;
    auto inDomain = [&](int x, int y) { return domain.empty() || domain(y, x) != 0; };
    auto onBorder = [&](int x, int y) { return x == 0 || y == 0 || x == w - 1 || y == h - 1; };

    double minVal = 0;
    cv::minMaxLoc(plane, &minVal);

    std::vector<Candidate> candidates;
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            if (!inDomain(x, y) || foreground(y, x) == 0)
                continue;
            const float v = plane(y, x);
            if (v <= minVal)
                continue;

            bool isMax = true;
            for (int d = 0; d < 8 && isMax; ++d) {
                const int x2 = x + kDx[d];
                const int y2 = y + kDy[d];
                if (x2 < 0 || y2 < 0 || x2 >= w || y2 >= h || !inDomain(x2, y2))
                    continue;
                isMax = plane(y2, x2) <= v;
            }
            if (isMax)
                candidates.push_back({v, y * w + x});
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        return a.value != b.value ? a.value > b.value : a.offset < b.offset;
    });

    std::vector<uint8_t> types(static_cast<size_t>(w) * h, 0);
    std::vector<int> list;
    std::vector<cv::Point> maxima;

    for (const auto& c : candidates) {
        if (types[c.offset] & kProcessed)
            continue;

        const float v0 = c.value;
        const float floor = static_cast<float>(v0 - prominence);
        list.clear();
        list.push_back(c.offset);
        types[c.offset] |= kListed | kEqual;

        bool maxPossible = true;
        double sumX = c.offset % w;
        double sumY = c.offset / w;
        int nEqual = 1;

        for (size_t i = 0; i < list.size() && maxPossible; ++i) {
            const int x = list[i] % w;
            const int y = list[i] / w;
            if (excludeEdgeMaxima && onBorder(x, y)) {
                maxPossible = false;
                break;
            }
            for (int d = 0; d < 8; ++d) {
                const int x2 = x + kDx[d];
                const int y2 = y + kDy[d];
                if (x2 < 0 || y2 < 0 || x2 >= w || y2 >= h || !inDomain(x2, y2))
                    continue;
                const int o2 = y2 * w + x2;
                if (types[o2] & kListed)
                    continue;
                if (types[o2] & kProcessed) {
                    maxPossible = false;
                    break;
                }
                const float v2 = plane(y2, x2);
                if (v2 > v0) {
                    maxPossible = false;
                    break;
                }
                if (v2 >= floor) {
                    list.push_back(o2);
                    types[o2] |= kListed;
                    if (v2 == v0) {
                        types[o2] |= kEqual;
                        sumX += x2;
                        sumY += y2;
                        ++nEqual;
                    }
                }
            }
        }

        const double cx = sumX / nEqual;
        const double cy = sumY / nEqual;
        int best = -1;
        double bestDist = 0;
        for (int o : list) {
            if (maxPossible && (types[o] & kEqual)) {
                const double dx = o % w - cx;
                const double dy = o / w - cy;
                const double dist = dx * dx + dy * dy;
                if (best < 0 || dist < bestDist || (dist == bestDist && o < best)) {
                    best = o;
                    bestDist = dist;
                }
            }
            types[o] = static_cast<uint8_t>((types[o] & ~(kListed | kEqual)) | kProcessed);
        }

        if (maxPossible)
            maxima.emplace_back(best % w, best / w);
    }

    std::sort(maxima.begin(), maxima.end(), [](const cv::Point& a, const cv::Point& b) {
        return a.y != b.y ? a.y < b.y : a.x < b.x;
    });
    return maxima;
}

SpotDetector::SpotDetector(SpotDetectorParams params) : params_(params) {}

PreparedPlane SpotDetector::preprocess(const cv::Mat& image) const
{
    if (image.empty() || image.channels() != 1)
        throw ShapeError("spot detection needs a non-empty single-channel plane");

    cv::Mat_<float> plane;
    image.convertTo(plane, CV_32F);

    PreparedPlane out;
    out.filtered = medianFilter(whiteTopHat(plane, params_.topHatRadius), params_.medianRadius);
    out.foreground = otsuForeground(out.filtered, &out.threshold);
    Logger()->debug("spot preprocessing: top-hat r={} median r={} otsu={}",
                    params_.topHatRadius, params_.medianRadius, out.threshold);
    return out;
}

std::vector<cv::Point> SpotDetector::detectPreprocessed(const PreparedPlane& plane,
                                                        const cv::Mat_<uint8_t>* mask) const
{
    if (mask && mask->size() != plane.filtered.size()) {
        throw GeometryError("mask " + std::to_string(mask->cols) + "x" + std::to_string(mask->rows) +
                            " does not match plane " + std::to_string(plane.filtered.cols) + "x" +
                            std::to_string(plane.filtered.rows));
    }
    return findMaxima(plane.filtered, mask ? *mask : cv::Mat_<uint8_t>(), plane.foreground,
                      params_.prominence, params_.excludeEdgeMaxima);
}

} // namespace bc
