#include <gtest/gtest.h>

#include "PdfPainter.h"
#include "PdfPainterGPU.h"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <string>

using namespace pdfraster;

namespace
{
    const float kTransparent[4] = { 0, 0, 0, 0 };

    PdfPaintSource Solid(float r, float g, float b, float alpha = 1.0f)
    {
        PdfPaintSource p;
        p.kind = PdfPaintSource::Solid;
        p.r = r;
        p.g = g;
        p.b = b;
        p.alpha = alpha;
        return p;
    }

    PdfContours RectContours(double x0, double y0, double x1, double y1)
    {
        return { PdfTessellator::Rect(x0, y0, x1, y1) };
    }

    struct Pixel
    {
        int r, g, b, a;
    };

    Pixel At(const std::vector<uint8_t>& rgba, int width, int x, int y)
    {
        const uint8_t* p = &rgba[(static_cast<size_t>(y) * width + x) * 4];
        return { p[0], p[1], p[2], p[3] };
    }

    // Painter behaviour shared by both backends
    class PainterTest : public ::testing::TestWithParam<std::string>
    {
    protected:
        void SetUp() override
        {
            if (GetParam() == "gpu")
            {
                if (!PdfPainterGPU::IsAvailable())
                    GTEST_SKIP() << "no EGL display";
                auto gpu = std::unique_ptr<PdfPainterGPU>(new PdfPainterGPU());
                PdfError err;
                if (!gpu->initialize(err))
                    GTEST_SKIP() << err.message;
                painter = std::move(gpu);
            }
            else
            {
                painter.reset(new PdfPainter());
            }
        }

        void begin(int w, int h, const float background[4] = kTransparent)
        {
            PdfError err;
            ASSERT_TRUE(painter->beginPage(w, h, background, err)) << err.message;
        }

        std::vector<uint8_t> end()
        {
            std::vector<uint8_t> rgba;
            PdfError err;
            EXPECT_TRUE(painter->endPage(rgba, err)) << err.message;
            return rgba;
        }

        std::unique_ptr<IPdfPainter> painter;
    };
}

TEST_P(PainterTest, ClearsToBackground)
{
    const float white[4] = { 1, 1, 1, 1 };
    ASSERT_NO_FATAL_FAILURE(begin(8, 6, white));
    auto rgba = end();
    ASSERT_EQ(rgba.size(), 8u * 6u * 4u);
    Pixel p = At(rgba, 8, 7, 5);
    EXPECT_EQ(p.r, 255);
    EXPECT_EQ(p.a, 255);
}

TEST_P(PainterTest, RejectsEmptyTarget)
{
    PdfError err;
    EXPECT_FALSE(painter->beginPage(0, 10, kTransparent, err));
    EXPECT_EQ(err.code, PdfErrorCode::RenderBackendFault);
}

TEST_P(PainterTest, PixelAlignedRectangle)
{
    ASSERT_NO_FATAL_FAILURE(begin(20, 20));
    painter->fill(RectContours(4, 4, 12, 10), false, Solid(0, 0, 1));
    auto rgba = end();

    Pixel inside = At(rgba, 20, 4, 4);
    EXPECT_EQ(inside.b, 255);
    EXPECT_EQ(inside.a, 255);
    EXPECT_EQ(At(rgba, 20, 11, 9).a, 255);
    EXPECT_EQ(At(rgba, 20, 3, 4).a, 0);
    EXPECT_EQ(At(rgba, 20, 12, 4).a, 0);
    EXPECT_EQ(At(rgba, 20, 4, 10).a, 0);
}

TEST_P(PainterTest, PartialCoverageIsAntialiased)
{
    ASSERT_NO_FATAL_FAILURE(begin(10, 10));
    painter->fill(RectContours(2, 2, 4.5, 8), false, Solid(1, 0, 0));
    auto rgba = end();

    Pixel edge = At(rgba, 10, 4, 5);
    EXPECT_NEAR(edge.a, 128, 16);
    // colour stays straight
    EXPECT_EQ(edge.r, 255);
}

TEST_P(PainterTest, AlphaComposites)
{
    const float white[4] = { 1, 1, 1, 1 };
    ASSERT_NO_FATAL_FAILURE(begin(10, 10, white));
    painter->fill(RectContours(0, 0, 10, 10), false, Solid(0, 0, 0, 0.5f));
    auto rgba = end();

    Pixel p = At(rgba, 10, 5, 5);
    EXPECT_NEAR(p.r, 128, 2);
    EXPECT_EQ(p.a, 255);
}

TEST_P(PainterTest, EvenOddLeavesAHole)
{
    PdfContours nested = { PdfTessellator::Rect(2, 2, 18, 18), PdfTessellator::Rect(6, 6, 14, 14) };

    ASSERT_NO_FATAL_FAILURE(begin(20, 20));
    painter->fill(nested, true, Solid(0, 0, 0));
    auto evenOdd = end();
    EXPECT_EQ(At(evenOdd, 20, 10, 10).a, 0);
    EXPECT_EQ(At(evenOdd, 20, 3, 3).a, 255);

    // both rectangles wind the same way, so nonzero fills the centre
    ASSERT_NO_FATAL_FAILURE(begin(20, 20));
    painter->fill(nested, false, Solid(0, 0, 0));
    auto nonZero = end();
    EXPECT_EQ(At(nonZero, 20, 10, 10).a, 255);
}

TEST_P(PainterTest, ClipMasksAndPopRestores)
{
    ASSERT_NO_FATAL_FAILURE(begin(20, 20));
    painter->pushClip(RectContours(0, 0, 10, 20), false);
    painter->fill(RectContours(0, 0, 20, 10), false, Solid(1, 0, 0));
    painter->popClip();
    painter->fill(RectContours(0, 10, 20, 20), false, Solid(0, 1, 0));
    auto rgba = end();

    EXPECT_EQ(At(rgba, 20, 5, 5).r, 255);
    EXPECT_EQ(At(rgba, 20, 15, 5).a, 0);
    EXPECT_EQ(At(rgba, 20, 15, 15).g, 255);
    EXPECT_EQ(At(rgba, 20, 15, 15).a, 255);
}

TEST_P(PainterTest, NestedClipsIntersectInAnyOrder)
{
    PdfContours a = RectContours(2, 2, 14.5, 14.5);
    PdfContours b;
    // triangle, so the intersection has sloped antialiased edges
    b.push_back({ { 6, 1 }, { 19, 18 }, { 1, 18 } });

    auto render = [&](const PdfContours& first, const PdfContours& second) {
        begin(20, 20);
        painter->pushClip(first, false);
        painter->pushClip(second, false);
        painter->fill(RectContours(0, 0, 20, 20), false, Solid(0.2f, 0.4f, 0.6f));
        painter->popClip();
        painter->popClip();
        return end();
    };

    auto ab = render(a, b);
    auto ba = render(b, a);
    ASSERT_EQ(ab.size(), ba.size());

    int worst = 0;
    for (size_t i = 0; i < ab.size(); ++i)
        worst = std::max(worst, std::abs(static_cast<int>(ab[i]) - static_cast<int>(ba[i])));
    EXPECT_LE(worst, GetParam() == "gpu" ? 2 : 0);

    // outside either clip nothing was painted
    EXPECT_EQ(At(ab, 20, 1, 1).a, 0);
    EXPECT_EQ(At(ab, 20, 17, 16).a, 0);
}

TEST_P(PainterTest, EmptyClipHidesEverything)
{
    ASSERT_NO_FATAL_FAILURE(begin(10, 10));
    painter->pushClip(PdfContours(), false);
    painter->fill(RectContours(0, 0, 10, 10), false, Solid(1, 1, 1));
    painter->popClip();
    auto rgba = end();

    for (size_t i = 3; i < rgba.size(); i += 4)
        ASSERT_EQ(rgba[i], 0);
}

INSTANTIATE_TEST_SUITE_P(Backends, PainterTest, ::testing::Values("cpu", "gpu"),
    [](const ::testing::TestParamInfo<std::string>& info) { return info.param; });

TEST(PainterAgreementTest, GpuMatchesCpu)
{
    if (!PdfPainterGPU::IsAvailable())
        GTEST_SKIP() << "no EGL display";

    PdfPainterGPU gpu;
    PdfError err;
    if (!gpu.initialize(err))
        GTEST_SKIP() << err.message;
    PdfPainter cpu;

    PdfContours ring = { PdfTessellator::Rect(4, 4, 60, 44), PdfTessellator::Rect(14, 14, 50, 34) };
    PdfContours diamond;
    diamond.push_back({ { 32, 2 }, { 62, 24 }, { 32, 46 }, { 2, 24 } });

    auto draw = [&](IPdfPainter& p, std::vector<uint8_t>& out) {
        const float white[4] = { 1, 1, 1, 1 };
        PdfError e;
        ASSERT_TRUE(p.beginPage(64, 48, white, e)) << e.message;
        p.fill(ring, true, Solid(0.9f, 0.1f, 0.1f));
        p.pushClip(diamond, false);
        p.fill(RectContours(0, 0, 64, 48), false, Solid(0.1f, 0.3f, 0.9f, 0.6f));
        p.popClip();
        ASSERT_TRUE(p.endPage(out, e)) << e.message;
    };

    std::vector<uint8_t> a, b;
    ASSERT_NO_FATAL_FAILURE(draw(cpu, a));
    ASSERT_NO_FATAL_FAILURE(draw(gpu, b));
    ASSERT_EQ(a.size(), b.size());

    double sum = 0;
    for (size_t i = 0; i < a.size(); ++i)
        sum += std::abs(static_cast<int>(a[i]) - static_cast<int>(b[i]));
    EXPECT_LT(sum / a.size(), 2.0);
}
