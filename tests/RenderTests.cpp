#include <gtest/gtest.h>

#include "PdfTestUtil.h"
#include "PdfPainter.h"

#include <atomic>
#include <cmath>

using namespace pdfraster;
using namespace pdfraster::test;

namespace
{
    // 2x2 box filter in premultiplied space
    PdfRenderTarget Downsample2x(const PdfRenderTarget& in)
    {
        PdfRenderTarget out;
        out.width = in.width / 2;
        out.height = in.height / 2;
        out.rgba.resize(static_cast<size_t>(out.width) * out.height * 4);

        for (int y = 0; y < out.height; ++y)
        {
            for (int x = 0; x < out.width; ++x)
            {
                double sum[4] = { 0, 0, 0, 0 };
                for (int dy = 0; dy < 2; ++dy)
                {
                    for (int dx = 0; dx < 2; ++dx)
                    {
                        const uint8_t* p = in.pixel(2 * x + dx, 2 * y + dy);
                        double a = p[3] / 255.0;
                        for (int c = 0; c < 3; ++c)
                            sum[c] += p[c] * a;
                        sum[3] += a;
                    }
                }
                uint8_t* o = &out.rgba[(static_cast<size_t>(y) * out.width + x) * 4];
                double a = sum[3] / 4.0;
                for (int c = 0; c < 3; ++c)
                    o[c] = static_cast<uint8_t>(a > 0 ? std::lround(sum[c] / sum[3]) : 0);
                o[3] = static_cast<uint8_t>(std::lround(a * 255.0));
            }
        }
        return out;
    }

    bool IsRed(const Rgba& p)
    {
        return p.r == 255 && p.g == 0 && p.b == 0 && p.a == 255;
    }
}

// =====================================================
// Device space
// =====================================================

TEST(RenderTest, RedSquareLandsFlipped)
{
    TestRender r;
    ASSERT_TRUE(r.run(SinglePagePdf("1 0 0 rg 10 10 100 100 re f"))) << r.error.message;
    ASSERT_EQ(r.target.width, 200);
    ASSERT_EQ(r.target.height, 200);

    // user y 10..110 is device rows 90..190
    EXPECT_TRUE(IsRed(PixelAt(r.target, 50, 150)));
    EXPECT_TRUE(IsRed(PixelAt(r.target, 10, 90)));
    EXPECT_TRUE(IsRed(PixelAt(r.target, 109, 189)));
    EXPECT_EQ(PixelAt(r.target, 9, 150).a, 0);
    EXPECT_EQ(PixelAt(r.target, 110, 150).a, 0);
    EXPECT_EQ(PixelAt(r.target, 50, 89).a, 0);
    EXPECT_EQ(PixelAt(r.target, 50, 190).a, 0);
    EXPECT_EQ(PixelAt(r.target, 150, 50).a, 0);
}

// RG sets only the stroke colour, so `1 0 0 RG ... re f` paints the square
// in the default black fill, not red. RedSquareLandsFlipped uses rg.
TEST(RenderTest, StrokeColourDoesNotFill)
{
    TestRender r;
    ASSERT_TRUE(r.run(SinglePagePdf("1 0 0 RG 10 10 100 100 re f"))) << r.error.message;

    Rgba p = PixelAt(r.target, 50, 150);
    EXPECT_EQ(p.r, 0);
    EXPECT_EQ(p.g, 0);
    EXPECT_EQ(p.b, 0);
    EXPECT_EQ(p.a, 255);
}

TEST(RenderTest, ScaleChangesResolutionOnly)
{
    const std::string content =
        "0 0 1 rg 20 20 100 60 re f "
        "1 0 0 RG 4 w 30 150 m 170 150 l S "
        "0 1 0 rg 120 100 m 180 100 l 150 140 l f";

    TestRender one;
    ASSERT_TRUE(one.run(SinglePagePdf(content), 1.0)) << one.error.message;
    TestRender two;
    ASSERT_TRUE(two.run(SinglePagePdf(content), 2.0)) << two.error.message;
    ASSERT_EQ(two.target.width, 400);

    PdfRenderTarget reduced = Downsample2x(two.target);
    EXPECT_LT(MeanDifference(one.target, reduced), 1.0);
    EXPECT_LE(MaxDifference(one.target, reduced), 40);
}

TEST(RenderTest, FractionalScaleRoundsTheViewport)
{
    TestRender r;
    ASSERT_TRUE(r.run(SinglePagePdf("", "<< >>", 612, 792), 0.5)) << r.error.message;
    EXPECT_EQ(r.target.width, 306);
    EXPECT_EQ(r.target.height, 396);
}

TEST(RenderTest, Rotate90TurnsClockwise)
{
    TestRender r;
    ASSERT_TRUE(r.run(SinglePagePdf("1 0 0 rg 0 0 50 50 re f", "<< >>", 200, 100, "/Rotate 90")))
        << r.error.message;
    ASSERT_EQ(r.target.width, 100);
    ASSERT_EQ(r.target.height, 200);

    // the bottom-left corner of the page moves to the top-left
    EXPECT_TRUE(IsRed(PixelAt(r.target, 25, 25)));
    EXPECT_EQ(PixelAt(r.target, 75, 25).a, 0);
    EXPECT_EQ(PixelAt(r.target, 25, 175).a, 0);
}

TEST(RenderTest, Rotate180)
{
    TestRender r;
    ASSERT_TRUE(r.run(SinglePagePdf("1 0 0 rg 0 0 50 50 re f", "<< >>", 200, 100, "/Rotate 180")))
        << r.error.message;
    ASSERT_EQ(r.target.width, 200);
    ASSERT_EQ(r.target.height, 100);

    EXPECT_TRUE(IsRed(PixelAt(r.target, 175, 25)));
    EXPECT_EQ(PixelAt(r.target, 25, 75).a, 0);
}

TEST(RenderTest, CropBoxSetsTheViewport)
{
    TestRender r;
    ASSERT_TRUE(r.run(SinglePagePdf("1 0 0 rg 50 50 10 10 re f", "<< >>", 200, 200,
        "/CropBox [50 50 150 150]"))) << r.error.message;
    ASSERT_EQ(r.target.width, 100);
    ASSERT_EQ(r.target.height, 100);
    EXPECT_TRUE(IsRed(PixelAt(r.target, 5, 95)));
    EXPECT_EQ(PixelAt(r.target, 15, 95).a, 0);
}

TEST(RenderTest, DiagnosticsTravelWithThePixels)
{
    TestRender r;
    ASSERT_TRUE(r.run(SinglePagePdf("q Q Q 0 0 10 10 re f"))) << r.error.message;
    ASSERT_FALSE(r.target.diagnostics.empty());
    EXPECT_EQ(r.target.diagnostics[0].code, PdfErrorCode::UnbalancedRestore);
}

// =====================================================
// Paint sources
// =====================================================

TEST(RenderTest, ImageXObjectFillsItsSquare)
{
    TestPdfWriter writer;
    const std::string pixels("\xff\x00\x00\x00\x00\xff", 6);
    int image = writer.addStream(
        "/Type /XObject /Subtype /Image /Width 2 /Height 1 /ColorSpace /DeviceRGB /BitsPerComponent 8",
        pixels);
    auto bytes = BuildSinglePage(writer, "q 100 0 0 100 50 50 cm /Im1 Do Q",
        "<< /XObject << /Im1 " + std::to_string(image) + " 0 R >> >>");

    TestRender r;
    ASSERT_TRUE(r.run(bytes)) << r.error.message;

    EXPECT_TRUE(IsRed(PixelAt(r.target, 75, 100)));
    Rgba right = PixelAt(r.target, 125, 100);
    EXPECT_EQ(right.b, 255);
    EXPECT_EQ(right.a, 255);
    EXPECT_EQ(PixelAt(r.target, 25, 100).a, 0);
}

TEST(RenderTest, AxialShadingRunsAcrossThePage)
{
    auto bytes = SinglePagePdf("/Sh0 sh",
        "<< /Shading << /Sh0 << /ShadingType 2 /ColorSpace /DeviceRGB /Coords [0 0 200 0]"
        " /Function << /FunctionType 2 /Domain [0 1] /C0 [1 0 0] /C1 [0 0 1] /N 1 >>"
        " /Extend [true true] >> >> >>");

    TestRender r;
    ASSERT_TRUE(r.run(bytes)) << r.error.message;

    Rgba left = PixelAt(r.target, 5, 100);
    Rgba middle = PixelAt(r.target, 100, 100);
    Rgba right = PixelAt(r.target, 195, 100);
    EXPECT_GT(left.r, 240);
    EXPECT_LT(left.b, 15);
    EXPECT_NEAR(middle.r, 128, 4);
    EXPECT_NEAR(middle.b, 128, 4);
    EXPECT_GT(right.b, 240);
    EXPECT_EQ(right.a, 255);
}

TEST(RenderTest, ClippedShading)
{
    auto bytes = SinglePagePdf("20 20 40 40 re W n /Sh0 sh",
        "<< /Shading << /Sh0 << /ShadingType 2 /ColorSpace /DeviceGray /Coords [0 0 200 0]"
        " /Function << /FunctionType 2 /Domain [0 1] /C0 [0] /C1 [1] /N 1 >> >> >> >>");

    TestRender r;
    ASSERT_TRUE(r.run(bytes)) << r.error.message;
    EXPECT_EQ(PixelAt(r.target, 40, 160).a, 255);
    EXPECT_EQ(PixelAt(r.target, 100, 100).a, 0);
}

// =====================================================
// Limits and cancellation
// =====================================================

TEST(RenderTest, ViewportLimit)
{
    PdfRect box;
    box.x0 = 0;
    box.y0 = 0;
    box.x1 = 100000;
    box.y1 = 100;

    PdfViewport viewport;
    PdfError err;
    EXPECT_FALSE(PdfSceneRasterizer::ViewportFor(box, 0, 1.0, viewport, err));
    EXPECT_EQ(err.code, PdfErrorCode::RenderBackendFault);

    err.clear();
    EXPECT_TRUE(PdfSceneRasterizer::ViewportFor(box, 0, 0.1, viewport, err));
    EXPECT_EQ(viewport.width, 10000);
    EXPECT_EQ(viewport.height, 10);

    // tighter caller limits
    EXPECT_FALSE(PdfSceneRasterizer::ViewportFor(box, 0, 0.1, viewport, err, 4096));
    EXPECT_FALSE(PdfSceneRasterizer::ViewportFor(box, 0, 0.1, viewport, err, 16384, 50000));
}

TEST(RenderTest, InvalidScale)
{
    PdfRect box;
    box.x1 = 100;
    box.y1 = 100;

    PdfViewport viewport;
    PdfError err;
    EXPECT_FALSE(PdfSceneRasterizer::ViewportFor(box, 0, 0.0, viewport, err));
    EXPECT_EQ(err.code, PdfErrorCode::RenderBackendFault);
    EXPECT_FALSE(PdfSceneRasterizer::ViewportFor(box, 0, -2.0, viewport, err));
    EXPECT_FALSE(PdfSceneRasterizer::ViewportFor(box, 0, std::nan(""), viewport, err));
}

TEST(RenderTest, OpaqueBackground)
{
    TestRender r;
    ASSERT_TRUE(r.load(SinglePagePdf("")));
    ASSERT_TRUE(r.buildScene());

    PdfViewport viewport;
    ASSERT_TRUE(PdfSceneRasterizer::ViewportFor(r.scene->pageBox, r.scene->rotate, 1.0, viewport, r.error));

    const float white[4] = { 1, 1, 1, 1 };
    PdfPainter painter;
    PdfRenderTarget target;
    ASSERT_TRUE(PdfSceneRasterizer::Rasterize(*r.scene, viewport, white, painter, target, r.error));
    Rgba p = PixelAt(target, 100, 100);
    EXPECT_EQ(p.r, 255);
    EXPECT_EQ(p.a, 255);
}

TEST(RenderTest, CancelledRasterLeavesTheTargetAlone)
{
    TestRender r;
    ASSERT_TRUE(r.load(SinglePagePdf("0 0 10 10 re f")));
    ASSERT_TRUE(r.buildScene());

    PdfViewport viewport;
    ASSERT_TRUE(PdfSceneRasterizer::ViewportFor(r.scene->pageBox, r.scene->rotate, 1.0, viewport, r.error));

    std::atomic<bool> cancel{ true };
    const float transparent[4] = { 0, 0, 0, 0 };
    PdfPainter painter;
    PdfRenderTarget target;
    target.width = 7;

    PdfError err;
    EXPECT_FALSE(PdfSceneRasterizer::Rasterize(*r.scene, viewport, transparent, painter, target, err, &cancel));
    EXPECT_EQ(err.code, PdfErrorCode::Cancelled);
    EXPECT_EQ(target.width, 7);
    EXPECT_TRUE(target.rgba.empty());
}
