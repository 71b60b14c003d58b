#include "test.hpp"

#include <fstream>

#include "bc/core/lif/LifReader.hpp"
#include "bc/core/util/Errors.hpp"
#include "bc/testing/LifFixture.hpp"

using bc::testing::makeSeries;
using bc::testing::TempDir;

TEST(LifReader, ReadsVersion2Container)
{
    TempDir dir;
    const auto path = dir / "plate.lif";
    bc::testing::writeLif(path, {makeSeries("LNG_01", {12, 9}, 3, 2),
                                 makeSeries("Nucleus_01", {5, 4}, 1, 1)}, 2);

    bc::lif::LifReader reader(path);
    EXPECT_EQ(reader.version(), 2);
    ASSERT_EQ(reader.seriesCount(), size_t(2));

    const bc::SeriesInfo& info = reader.info(0);
    EXPECT_EQ(info.name, std::string("LNG_01"));
    EXPECT_EQ(info.sizeX, 12);
    EXPECT_EQ(info.sizeY, 9);
    EXPECT_EQ(info.sizeZ, 3);
    EXPECT_EQ(info.sizeC, 2);
    EXPECT_EQ(info.bitsPerSample, 8);
    ASSERT_EQ(info.luts.size(), size_t(2));
    EXPECT_TRUE(info.luts[1] == bc::LutColor::Green);
    EXPECT_EQ(reader.info(1).name, std::string("Nucleus_01"));
}

TEST(LifReader, PixelsMatchWrittenPlanes)
{
    TempDir dir;
    const auto path = dir / "px.lif";
    const auto fixture = makeSeries("LNG_02", {7, 5}, 2, 2, CV_16U);
    bc::testing::writeLif(path, {fixture}, 1);

    bc::lif::LifReader reader(path);
    EXPECT_EQ(reader.version(), 1);
    const bc::Series s = reader.read(0);
    ASSERT_EQ(s.channels(), 2);
    EXPECT_EQ(s.info().bitsPerSample, 16);
    for (int c = 0; c < 2; ++c) {
        ASSERT_EQ(s.slices(c), 2);
        for (int z = 0; z < 2; ++z) {
            const cv::Mat& got = s.plane(c, z);
            EXPECT_EQ(got.type(), CV_16UC1);
            EXPECT_EQ(cv::norm(got, fixture.planes[c][z], cv::NORM_INF), 0.0);
        }
    }
}

TEST(LifReader, SingleSliceSeriesHasDepthOne)
{
    TempDir dir;
    const auto path = dir / "flat.lif";
    bc::testing::writeLif(path, {makeSeries("LNG_flat", {4, 4}, 1, 1)});
    bc::lif::LifReader reader(path);
    EXPECT_EQ(reader.info(0).sizeZ, 1);
    EXPECT_EQ(reader.read(0).slices(0), 1);
}

TEST(LifReader, SeriesIndexOutOfRangeThrows)
{
    TempDir dir;
    const auto path = dir / "one.lif";
    bc::testing::writeLif(path, {makeSeries("LNG_01", {4, 4}, 1, 1)});
    bc::lif::LifReader reader(path);
    EXPECT_THROW((void)reader.info(3), std::out_of_range);
}

TEST(LifReader, MissingFileIsIOError)
{
    TempDir dir;
    EXPECT_THROW((void)bc::lif::LifReader(dir / "absent.lif"), bc::IOError);
}

TEST(LifReader, BadMagicIsFormatError)
{
    TempDir dir;
    const auto path = dir / "bad.lif";
    std::ofstream(path, std::ios::binary) << "this is not a leica file at all";
    EXPECT_THROW((void)bc::lif::LifReader(path), bc::FormatError);
}

TEST(LifReader, TruncatedContainerIsFormatError)
{
    TempDir dir;
    const auto path = dir / "cut.lif";
    bc::testing::writeLif(path, {makeSeries("LNG_01", {32, 32}, 4, 2)});
    std::filesystem::resize_file(path, std::filesystem::file_size(path) - 100);
    EXPECT_THROW((void)bc::lif::LifReader(path), bc::FormatError);
}

TEST(LifReader, Utf16Decoding)
{
    const char ascii[] = {'L', 0, 'N', 0, 'G', 0};
    EXPECT_EQ(bc::lif::utf16leToUtf8(ascii, 3), std::string("LNG"));
    // U+00B5 MICRO SIGN
    const char micro[] = {char(0xB5), 0};
    EXPECT_EQ(bc::lif::utf16leToUtf8(micro, 1), std::string("\xC2\xB5"));
}
