#include <gtest/gtest.h>

#include "PdfTessellator.h"

#include <cmath>

using namespace pdfraster;

namespace
{
    PdfPath Line(double x0, double y0, double x1, double y1)
    {
        PdfPath p;
        p.emplace_back(PdfPathSegment::MoveTo, x0, y0);
        p.emplace_back(PdfPathSegment::LineTo, x1, y1);
        return p;
    }

    struct Box
    {
        double x0, y0, x1, y1;
    };

    Box BoundsOf(const PdfContours& contours)
    {
        Box b{ 0, 0, 0, 0 };
        EXPECT_TRUE(PdfTessellator::Bounds(contours, b.x0, b.y0, b.x1, b.y1));
        return b;
    }

    bool HasVertex(const PdfContours& contours, double x, double y)
    {
        for (const auto& c : contours)
        {
            for (const auto& p : c)
            {
                if (std::fabs(p.x - x) < 1e-6 && std::fabs(p.y - y) < 1e-6)
                    return true;
            }
        }
        return false;
    }
}

TEST(PdfTessellatorTest, FillAppliesTheMatrix)
{
    PdfPath path;
    AppendRect(path, 10, 20, 30, 40);

    PdfContours contours;
    PdfTessellator::FlattenFill(path, PdfMatrix(2, 0, 0, -1, 5, 100), contours);
    ASSERT_EQ(contours.size(), 1u);

    Box b = BoundsOf(contours);
    EXPECT_DOUBLE_EQ(b.x0, 25);
    EXPECT_DOUBLE_EQ(b.x1, 85);
    EXPECT_DOUBLE_EQ(b.y0, 40);
    EXPECT_DOUBLE_EQ(b.y1, 80);
}

TEST(PdfTessellatorTest, CurvesStayWithinTolerance)
{
    // quarter circles, radius 100
    const double k = 0.5522847498 * 100;
    PdfPath path;
    path.emplace_back(PdfPathSegment::MoveTo, 100, 0);
    path.emplace_back(100, k, k, 100, 0, 100);
    path.emplace_back(-k, 100, -100, k, -100, 0);
    path.emplace_back(-100, -k, -k, -100, 0, -100);
    path.emplace_back(k, -100, 100, -k, 100, 0);
    path.emplace_back();

    PdfContours contours;
    PdfTessellator::FlattenFill(path, PdfMatrix(), contours);
    ASSERT_EQ(contours.size(), 1u);
    EXPECT_GT(contours[0].size(), 16u);

    for (const auto& p : contours[0])
    {
        double r = std::hypot(p.x, p.y);
        EXPECT_NEAR(r, 100, 0.1);
    }
}

TEST(PdfTessellatorTest, OpenSubpathsAreClosedForFilling)
{
    PdfPath path;
    path.emplace_back(PdfPathSegment::MoveTo, 0, 0);
    path.emplace_back(PdfPathSegment::LineTo, 10, 0);
    path.emplace_back(PdfPathSegment::LineTo, 10, 10);
    path.emplace_back(PdfPathSegment::MoveTo, 50, 50);
    path.emplace_back(PdfPathSegment::LineTo, 60, 50);

    PdfContours contours;
    PdfTessellator::FlattenFill(path, PdfMatrix(), contours);

    // the two-point subpath encloses nothing
    EXPECT_EQ(contours.size(), 1u);
}

TEST(PdfTessellatorTest, ButtCapEndsAtTheEndpoints)
{
    PdfStrokeStyle style;
    style.width = 4;

    PdfContours contours;
    PdfTessellator::StrokeOutline(Line(10, 10, 90, 10), PdfMatrix(), style, contours);

    Box b = BoundsOf(contours);
    EXPECT_NEAR(b.x0, 10, 1e-9);
    EXPECT_NEAR(b.x1, 90, 1e-9);
    EXPECT_NEAR(b.y0, 8, 1e-9);
    EXPECT_NEAR(b.y1, 12, 1e-9);
}

TEST(PdfTessellatorTest, SquareCapExtendsByHalfTheWidth)
{
    PdfStrokeStyle style;
    style.width = 4;
    style.cap = 2;

    PdfContours contours;
    PdfTessellator::StrokeOutline(Line(10, 10, 90, 10), PdfMatrix(), style, contours);

    Box b = BoundsOf(contours);
    EXPECT_NEAR(b.x0, 8, 1e-9);
    EXPECT_NEAR(b.x1, 92, 1e-9);
}

TEST(PdfTessellatorTest, RoundCapExtendsByHalfTheWidth)
{
    PdfStrokeStyle style;
    style.width = 4;
    style.cap = 1;

    PdfContours contours;
    PdfTessellator::StrokeOutline(Line(10, 10, 90, 10), PdfMatrix(), style, contours);

    Box b = BoundsOf(contours);
    EXPECT_NEAR(b.x0, 8, 0.05);
    EXPECT_NEAR(b.x1, 92, 0.05);
    EXPECT_NEAR(b.y0, 8, 0.05);
}

TEST(PdfTessellatorTest, ZeroLengthSubpathNeedsACap)
{
    PdfStrokeStyle style;
    style.width = 6;

    PdfContours butt;
    PdfTessellator::StrokeOutline(Line(20, 20, 20, 20), PdfMatrix(), style, butt);
    EXPECT_TRUE(butt.empty());

    style.cap = 2;
    PdfContours square;
    PdfTessellator::StrokeOutline(Line(20, 20, 20, 20), PdfMatrix(), style, square);
    Box b = BoundsOf(square);
    EXPECT_NEAR(b.x0, 17, 1e-9);
    EXPECT_NEAR(b.x1, 23, 1e-9);
}

TEST(PdfTessellatorTest, HairlineIsOneDevicePixel)
{
    PdfStrokeStyle style;
    style.width = 0;

    PdfContours contours;
    PdfTessellator::StrokeOutline(Line(0, 10, 50, 10), PdfMatrix(4, 0, 0, 4, 0, 0), style, contours);

    Box b = BoundsOf(contours);
    EXPECT_NEAR(b.y1 - b.y0, 1.0, 1e-9);
    EXPECT_NEAR(b.x1 - b.x0, 200.0, 1e-9);
}

TEST(PdfTessellatorTest, WidthScalesWithTheMatrix)
{
    PdfStrokeStyle style;
    style.width = 1;

    PdfContours contours;
    PdfTessellator::StrokeOutline(Line(0, 10, 50, 10), PdfMatrix(4, 0, 0, 4, 0, 0), style, contours);

    Box b = BoundsOf(contours);
    EXPECT_NEAR(b.y1 - b.y0, 4.0, 1e-9);
}

TEST(PdfTessellatorTest, DashSplitsTheLine)
{
    PdfStrokeStyle style;
    style.width = 2;
    style.dash.array = { 10, 10 };

    PdfContours contours;
    PdfTessellator::StrokeOutline(Line(0, 0, 100, 0), PdfMatrix(), style, contours);

    // on at 0-10, 20-30, 40-50, 60-70, 80-90
    ASSERT_EQ(contours.size(), 5u);
    Box b = BoundsOf(contours);
    EXPECT_NEAR(b.x0, 0, 1e-9);
    EXPECT_NEAR(b.x1, 90, 1e-9);
}

TEST(PdfTessellatorTest, DashPhaseShiftsThePattern)
{
    PdfStrokeStyle style;
    style.width = 2;
    style.dash.array = { 10, 10 };
    style.dash.phase = 5;

    PdfContours contours;
    PdfTessellator::StrokeOutline(Line(0, 0, 100, 0), PdfMatrix(), style, contours);

    // on at 0-5, 15-25, 35-45, 55-65, 75-85, 95-100
    ASSERT_EQ(contours.size(), 6u);
    Box b = BoundsOf(contours);
    EXPECT_NEAR(b.x1, 100, 1e-9);
}

TEST(PdfTessellatorTest, MiterJoinReachesTheCorner)
{
    PdfPath path;
    path.emplace_back(PdfPathSegment::MoveTo, 0, 0);
    path.emplace_back(PdfPathSegment::LineTo, 50, 0);
    path.emplace_back(PdfPathSegment::LineTo, 50, 50);

    PdfStrokeStyle style;
    style.width = 10;
    style.join = 0;

    PdfContours miter;
    PdfTessellator::StrokeOutline(path, PdfMatrix(), style, miter);
    EXPECT_TRUE(HasVertex(miter, 55, -5));

    // a right angle needs a limit of at least sqrt(2)
    style.miterLimit = 1.2;
    PdfContours limited;
    PdfTessellator::StrokeOutline(path, PdfMatrix(), style, limited);
    EXPECT_FALSE(HasVertex(limited, 55, -5));

    style.miterLimit = 10;
    style.join = 2;
    PdfContours bevel;
    PdfTessellator::StrokeOutline(path, PdfMatrix(), style, bevel);
    EXPECT_FALSE(HasVertex(bevel, 55, -5));
    EXPECT_TRUE(HasVertex(bevel, 55, 0));
}

TEST(PdfTessellatorTest, DegenerateMatrixStrokesNothing)
{
    PdfStrokeStyle style;
    PdfContours contours;
    PdfTessellator::StrokeOutline(Line(0, 0, 10, 10), PdfMatrix(0, 0, 0, 0, 0, 0), style, contours);
    EXPECT_TRUE(contours.empty());
}

TEST(PdfTessellatorTest, EmptyBounds)
{
    PdfContours none;
    double x0, y0, x1, y1;
    EXPECT_FALSE(PdfTessellator::Bounds(none, x0, y0, x1, y1));
}
