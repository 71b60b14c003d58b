#include "test.hpp"

#include <opencv2/core.hpp>
#include <tiffio.h>

#include "bc/core/util/Errors.hpp"
#include "bc/core/util/Tiff.hpp"
#include "bc/testing/LifFixture.hpp"

TEST(Tiff, MultiPage16BitRoundTrip)
{
    bc::testing::TempDir dir;
    cv::Mat a(20, 30, CV_16UC1);
    cv::randu(a, 0, 65535);
    cv::Mat b = cv::Mat::zeros(20, 30, CV_16UC1);
    b.at<uint16_t>(4, 7) = 65535;

    bc::TiffWriteOptions opts;
    opts.description = bc::imagejHyperstackDescription(2, true);
    bc::writeTiffPages(dir / "s.tiff", {a, b}, opts);

    const auto pages = bc::readTiffPages(dir / "s.tiff");
    ASSERT_EQ(pages.size(), size_t(2));
    EXPECT_EQ(cv::norm(pages[0], a, cv::NORM_INF), 0.0);
    EXPECT_EQ(cv::norm(pages[1], b, cv::NORM_INF), 0.0);
}

TEST(Tiff, ImageJDescriptionIsStoredOnFirstPage)
{
    bc::testing::TempDir dir;
    const auto path = dir / "d.tiff";
    bc::TiffWriteOptions opts;
    opts.description = bc::imagejHyperstackDescription(2, true);
    bc::writeTiffPages(path, {cv::Mat::zeros(4, 4, CV_8UC1), cv::Mat::zeros(4, 4, CV_8UC1)}, opts);

    TIFF* tf = TIFFOpen(path.string().c_str(), "r");
    ASSERT_TRUE(tf != nullptr);
    char* desc = nullptr;
    const bool found = TIFFGetField(tf, TIFFTAG_IMAGEDESCRIPTION, &desc) == 1;
    const std::string text = found && desc ? desc : "";
    TIFFClose(tf);
    EXPECT_TRUE(found);
    EXPECT_NE(text.find("channels=2"), std::string::npos);
    EXPECT_NE(text.find("mode=composite"), std::string::npos);
}

TEST(Tiff, ColourPageKeepsChannelOrder)
{
    bc::testing::TempDir dir;
    cv::Mat bgr(6, 5, CV_8UC3, cv::Scalar(10, 20, 30));
    bc::writeTiffPages(dir / "c.tiff", {bgr});
    const auto pages = bc::readTiffPages(dir / "c.tiff");
    ASSERT_EQ(pages.size(), size_t(1));
    ASSERT_EQ(pages[0].type(), CV_8UC3);
    const cv::Vec3b px = pages[0].at<cv::Vec3b>(2, 2);
    EXPECT_EQ(px[0], 10);
    EXPECT_EQ(px[2], 30);
}

TEST(Tiff, UnsupportedPageTypeIsRejected)
{
    bc::testing::TempDir dir;
    EXPECT_THROW(bc::writeTiffPages(dir / "x.tiff", {cv::Mat::zeros(3, 3, CV_64FC1)}), bc::IOError);
    EXPECT_THROW(bc::writeTiffPages(dir / "y.tiff", {}), bc::IOError);
}
