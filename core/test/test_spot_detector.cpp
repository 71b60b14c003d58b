#include "test.hpp"

#include <opencv2/core.hpp>

#include "bc/core/util/Errors.hpp"
#include "bc/core/util/RankFilters.hpp"
#include "bc/core/util/SpotDetector.hpp"

namespace {

bc::SpotDetector rawDetector(double prominence)
{
    bc::SpotDetectorParams p;
    p.prominence = prominence;
    p.topHatRadius = 0;
    p.medianRadius = 0;
    return bc::SpotDetector(p);
}

// Row 2 of a 20x5 zero plane: peak 100 at x=5, saddle of 70 over x=6..9, peak 80 at x=10.
cv::Mat twoPeaks()
{
    cv::Mat_<uint8_t> m = cv::Mat_<uint8_t>::zeros(5, 20);
    m(2, 5) = 100;
    for (int x = 6; x <= 9; ++x)
        m(2, x) = 70;
    m(2, 10) = 80;
    return m;
}

} // namespace

TEST(RankFilters, RadiusOneKernelIsFull3x3)
{
    EXPECT_EQ(bc::circularKernel(1.0).size(), size_t(9));
    EXPECT_EQ(bc::circularKernel(0.0).size(), size_t(1));
    // radius 2: rows of width 3, 5, 5, 5, 3
    EXPECT_EQ(bc::circularKernel(2.0).size(), size_t(21));
}

TEST(RankFilters, MedianRemovesIsolatedPixel)
{
    cv::Mat_<float> m(7, 7, 10.0f);
    m(3, 3) = 500.0f;
    const cv::Mat_<float> out = bc::medianFilter(m, 1.0);
    EXPECT_FLOAT_EQ(out(3, 3), 10.0f);
    EXPECT_FLOAT_EQ(out(0, 0), 10.0f);
}

TEST(RankFilters, TopHatFlattensBackground)
{
    cv::Mat_<float> m(15, 15, 40.0f);
    m(7, 7) = 90.0f;
    const cv::Mat_<float> out = bc::whiteTopHat(m, 2.0);
    EXPECT_FLOAT_EQ(out(0, 0), 0.0f);
    EXPECT_FLOAT_EQ(out(7, 7), 50.0f);
}

TEST(RankFilters, ZeroRadiusIsIdentity)
{
    cv::Mat_<float> m(4, 4, 3.0f);
    m(1, 2) = 8.0f;
    EXPECT_EQ(cv::norm(bc::whiteTopHat(m, 0), m, cv::NORM_INF), 0.0);
    EXPECT_EQ(cv::norm(bc::medianFilter(m, 0), m, cv::NORM_INF), 0.0);
}

TEST(SpotDetector, SingleBrightPixelOnFlatImage)
{
    cv::Mat_<uint8_t> m(3, 3, uint8_t(10));
    m(1, 1) = 100;
    const auto spots = rawDetector(1.0).detect(m);
    ASSERT_EQ(spots.size(), size_t(1));
    EXPECT_EQ(spots[0].x, 1);
    EXPECT_EQ(spots[0].y, 1);
}

TEST(SpotDetector, FlatImageHasNoSpots)
{
    cv::Mat_<uint16_t> m(8, 8, uint16_t(300));
    EXPECT_TRUE(rawDetector(1.0).detect(m).empty());
}

TEST(SpotDetector, ProminenceMergesShallowPeaks)
{
    const cv::Mat m = twoPeaks();
    EXPECT_EQ(rawDetector(20.0).detect(m).size(), size_t(1));

    const auto both = rawDetector(5.0).detect(m);
    ASSERT_EQ(both.size(), size_t(2));
    EXPECT_EQ(both[0], cv::Point(5, 2));
    EXPECT_EQ(both[1], cv::Point(10, 2));
}

TEST(SpotDetector, MaskConfinesSearch)
{
    const cv::Mat m = twoPeaks();
    cv::Mat_<uint8_t> mask = cv::Mat_<uint8_t>::zeros(m.size());
    mask(cv::Rect(8, 0, 12, 5)).setTo(255);

    // the higher peak is outside the mask, so the lower one stands alone
    const auto spots = rawDetector(20.0).detect(m, &mask);
    ASSERT_EQ(spots.size(), size_t(1));
    EXPECT_EQ(spots[0], cv::Point(10, 2));
}

TEST(SpotDetector, MaskSizeMismatchIsGeometryError)
{
    const cv::Mat m = twoPeaks();
    cv::Mat_<uint8_t> mask = cv::Mat_<uint8_t>::zeros(4, 4);
    const bc::SpotDetector d = rawDetector(5.0);
    EXPECT_THROW((void)d.detect(m, &mask), bc::GeometryError);
}

TEST(SpotDetector, PlateauYieldsOneCentralPoint)
{
    cv::Mat_<uint8_t> m = cv::Mat_<uint8_t>::zeros(7, 9);
    m(3, 3) = m(3, 4) = m(3, 5) = 120;
    const auto spots = rawDetector(10.0).detect(m);
    ASSERT_EQ(spots.size(), size_t(1));
    EXPECT_EQ(spots[0], cv::Point(4, 3));
}

TEST(SpotDetector, EdgeMaximaCanBeExcluded)
{
    cv::Mat_<uint8_t> m = cv::Mat_<uint8_t>::zeros(6, 6);
    m(0, 0) = 200;
    m(3, 3) = 150;

    EXPECT_EQ(rawDetector(10.0).detect(m).size(), size_t(2));

    bc::SpotDetectorParams p;
    p.prominence = 10.0;
    p.topHatRadius = 0;
    p.medianRadius = 0;
    p.excludeEdgeMaxima = true;
    const auto inner = bc::SpotDetector(p).detect(m);
    ASSERT_EQ(inner.size(), size_t(1));
    EXPECT_EQ(inner[0], cv::Point(3, 3));
}

TEST(SpotDetector, ResultsAreDeterministicAndRowMajor)
{
    cv::Mat m(64, 64, CV_16UC1);
    cv::RNG rng(42);
    rng.fill(m, cv::RNG::UNIFORM, 0, 2000);

    bc::SpotDetectorParams p;
    p.prominence = 50;
    const bc::SpotDetector d(p);
    const auto a = d.detect(m);
    const auto b = d.detect(m);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i)
        EXPECT_EQ(a[i], b[i]);
    for (size_t i = 1; i < a.size(); ++i)
        EXPECT_TRUE(a[i - 1].y < a[i].y || (a[i - 1].y == a[i].y && a[i - 1].x < a[i].x));
}

TEST(SpotDetector, PreprocessedPlaneIsReusable)
{
    const cv::Mat m = twoPeaks();
    const bc::SpotDetector d = rawDetector(5.0);
    const bc::PreparedPlane plane = d.preprocess(m);
    EXPECT_EQ(d.detectPreprocessed(plane, nullptr).size(), d.detect(m).size());
    EXPECT_EQ(cv::countNonZero(plane.foreground), 6);
}

TEST(SpotDetector, MultiChannelInputIsShapeError)
{
    const cv::Mat rgb = cv::Mat::zeros(4, 4, CV_8UC3);
    EXPECT_THROW((void)rawDetector(1.0).preprocess(rgb), bc::ShapeError);
}
