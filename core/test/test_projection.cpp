#include "test.hpp"

#include <opencv2/core.hpp>

#include "bc/core/types/Projection.hpp"
#include "bc/core/types/Series.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/core/util/MaxProjection.hpp"

namespace {

bool identical(const cv::Mat& a, const cv::Mat& b)
{
    return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0;
}

bc::Series makeSeries(std::vector<std::vector<cv::Mat>> planes)
{
    bc::SeriesInfo info;
    info.name = "LNG_01";
    info.sizeC = static_cast<int>(planes.size());
    info.luts = {bc::LutColor::Blue, bc::LutColor::Green};
    return bc::Series(info, std::move(planes));
}

} // namespace

TEST(MaxProjection, SingleSliceIsIdentity)
{
    cv::Mat plane(16, 12, CV_16UC1);
    cv::randu(plane, 0, 4096);
    const cv::Mat projected = bc::maxProject({plane});
    EXPECT_TRUE(identical(projected, plane));
}

TEST(MaxProjection, TakesPerPixelMaximum)
{
    cv::Mat a = (cv::Mat_<uint8_t>(2, 2) << 1, 9, 3, 0);
    cv::Mat b = (cv::Mat_<uint8_t>(2, 2) << 5, 2, 3, 7);
    cv::Mat expected = (cv::Mat_<uint8_t>(2, 2) << 5, 9, 3, 7);
    EXPECT_TRUE(identical(bc::maxProject({a, b}), expected));
}

TEST(MaxProjection, SizeMismatchIsShapeError)
{
    std::vector<cv::Mat> stack = {cv::Mat::zeros(4, 4, CV_8U), cv::Mat::zeros(4, 5, CV_8U)};
    EXPECT_THROW(bc::maxProject(stack), bc::ShapeError);
}

TEST(MaxProjection, TypeMismatchIsShapeError)
{
    std::vector<cv::Mat> stack = {cv::Mat::zeros(4, 4, CV_8U), cv::Mat::zeros(4, 4, CV_16U)};
    EXPECT_THROW(bc::maxProject(stack), bc::ShapeError);
}

TEST(MaxProjection, EmptyStackIsShapeError)
{
    EXPECT_THROW(bc::maxProject(std::vector<cv::Mat>{}), bc::ShapeError);
}

TEST(MaxProjection, ProjectsEveryChannelAndKeepsLuts)
{
    cv::Mat c0z0 = cv::Mat::zeros(3, 3, CV_8U);
    cv::Mat c0z1 = cv::Mat::zeros(3, 3, CV_8U);
    c0z1.at<uint8_t>(1, 1) = 50;
    cv::Mat c1z0 = cv::Mat::ones(3, 3, CV_8U);
    cv::Mat c1z1 = cv::Mat::ones(3, 3, CV_8U);

    const bc::Projection p = bc::maxIntensityProjection(makeSeries({{c0z0, c0z1}, {c1z0, c1z1}}));
    ASSERT_EQ(p.channels.size(), size_t(2));
    EXPECT_EQ(p.seriesName, std::string("LNG_01"));
    EXPECT_EQ(p.channel(1).at<uint8_t>(1, 1), 50);
    EXPECT_EQ(p.channel(2).at<uint8_t>(0, 0), 1);
    EXPECT_TRUE(p.luts[1] == bc::LutColor::Green);
    EXPECT_TRUE(p.size() == cv::Size(3, 3));
}

TEST(MaxProjection, MissingChannelIsShapeError)
{
    const bc::Projection p = bc::maxIntensityProjection(makeSeries({{cv::Mat::zeros(2, 2, CV_8U)}}));
    EXPECT_THROW((void)p.channel(2), bc::ShapeError);
    EXPECT_THROW((void)p.channel(0), bc::ShapeError);
}

TEST(Series, NamesAreSanitized)
{
    EXPECT_EQ(bc::sanitizeSeriesName("Project/LNG 01:a"), std::string("Project_LNG_01_a"));
    EXPECT_EQ(bc::sanitizeSeriesName(""), std::string("series"));
}
