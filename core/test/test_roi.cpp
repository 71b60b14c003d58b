#include "test.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <limits>

#include "bc/core/types/Roi.hpp"
#include "bc/core/util/Errors.hpp"

namespace {

bc::Roi square(float x, float y, float side)
{
    return {"Cell_1", {{x, y}, {x + side, y}, {x + side, y + side}, {x, y + side}}};
}

} // namespace

TEST(Roi, LabelsAreOneBased)
{
    EXPECT_EQ(bc::cellLabel(0), std::string("Cell_1"));
    EXPECT_EQ(bc::cellLabel(11), std::string("Cell_12"));
}

TEST(Roi, SquareAreaAndMaskAgree)
{
    const bc::Roi roi = square(10, 10, 10);
    EXPECT_FLOAT_EQ(bc::polygonArea(roi.vertices), 100.0);

    const cv::Mat_<uint8_t> mask = bc::rasterizeRoi(roi, cv::Size(40, 40));
    EXPECT_EQ(cv::countNonZero(mask), 100);
    EXPECT_EQ(mask(10, 10), 255);
    EXPECT_EQ(mask(19, 19), 255);
    EXPECT_EQ(mask(20, 20), 0);
    EXPECT_EQ(mask(9, 15), 0);
}

TEST(Roi, AreaIgnoresWindingDirection)
{
    bc::Roi roi = square(0, 0, 4);
    std::reverse(roi.vertices.begin(), roi.vertices.end());
    EXPECT_FLOAT_EQ(bc::polygonArea(roi.vertices), 16.0);
}

TEST(Roi, TriangleArea)
{
    const std::vector<cv::Point2f> tri = {{0, 0}, {6, 0}, {0, 4}};
    EXPECT_FLOAT_EQ(bc::polygonArea(tri), 12.0);
}

TEST(Roi, SquareTouchingImageBorderIsValid)
{
    const bc::Roi roi = square(0, 0, 8);
    const cv::Mat_<uint8_t> mask = bc::rasterizeRoi(roi, cv::Size(8, 8));
    EXPECT_EQ(cv::countNonZero(mask), 64);
}

TEST(Roi, TooFewVerticesIsGeometryError)
{
    const bc::Roi roi{"Cell_1", {{1, 1}, {5, 5}}};
    EXPECT_THROW(bc::validateRoi(roi, cv::Size(10, 10)), bc::GeometryError);
}

TEST(Roi, VertexOutsideImageIsGeometryError)
{
    const bc::Roi roi = square(5, 5, 10);
    EXPECT_THROW(bc::rasterizeRoi(roi, cv::Size(12, 12)), bc::GeometryError);
}

TEST(Roi, NonFiniteVertexIsGeometryError)
{
    bc::Roi roi = square(1, 1, 2);
    roi.vertices[2].x = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(bc::validateRoi(roi, cv::Size(10, 10)), bc::GeometryError);
}

TEST(Roi, BoundsCoverFractionalVertices)
{
    const bc::Roi roi{"Cell_1", {{1.5f, 2.25f}, {7.5f, 2.25f}, {4.0f, 9.75f}}};
    const cv::Rect b = bc::roiBounds(roi);
    EXPECT_EQ(b.x, 1);
    EXPECT_EQ(b.y, 2);
    EXPECT_EQ(b.width, 7);
    EXPECT_EQ(b.height, 8);
}
