#include <gtest/gtest.h>

#include "PdfTestUtil.h"
#include "PdfResources.h"
#include "PdfTessellator.h"

using namespace pdfraster;
using namespace pdfraster::test;

namespace
{
    class FontTest : public ::testing::Test
    {
    protected:
        void load(const std::string& cidFontExtras = std::string())
        {
            TestPdfWriter writer;
            int font = AddTestType0Font(writer, 3, cidFontExtras);
            auto bytes = BuildSinglePage(writer, "",
                "<< /Font << /F1 " + std::to_string(font) + " 0 R >> >>");

            PdfError err;
            ASSERT_TRUE(doc.loadFromBytes(bytes, err)) << err.message;
            ASSERT_TRUE(doc.page(0, page, err));

            PdfObjectPtr obj;
            ASSERT_TRUE(ResolveResource(doc, page, ResourceCategory::Font, "F1", obj, err)) << err.message;
            fontDict = AsDict(obj);
            ASSERT_TRUE(fontDict);
        }

        PdfDocument doc;
        PdfPage page;
        std::shared_ptr<PdfDictionary> fontDict;
        FontCache fonts;
        GlyphCache glyphs;
    };

    PdfCharCode Cid(uint32_t code)
    {
        PdfCharCode c;
        c.code = code;
        c.bytes = 2;
        return c;
    }
}

TEST_F(FontTest, LoadsEmbeddedCidFont)
{
    ASSERT_NO_FATAL_FAILURE(load());

    PdfFontPtr font;
    PdfError err;
    ASSERT_TRUE(fonts.loadFont(doc, fontDict, font, err)) << err.message;
    EXPECT_TRUE(font->isComposite());
    EXPECT_TRUE(font->hasFace());
    EXPECT_FALSE(font->isSubstitute());
    EXPECT_EQ(font->baseFont(), "/TestSquares");
}

TEST_F(FontTest, FontCacheReturnsTheSameFont)
{
    ASSERT_NO_FATAL_FAILURE(load());

    PdfFontPtr first;
    PdfFontPtr second;
    PdfError err;
    ASSERT_TRUE(fonts.loadFont(doc, fontDict, first, err));
    ASSERT_TRUE(fonts.loadFont(doc, fontDict, second, err));
    EXPECT_EQ(first, second);
    EXPECT_EQ(fonts.cacheSize(), 1u);
    EXPECT_EQ(fonts.missCount(), 1u);
    EXPECT_EQ(fonts.hitCount(), 1u);
}

TEST_F(FontTest, IdentityHDecodesTwoByteCodes)
{
    ASSERT_NO_FATAL_FAILURE(load());

    PdfFontPtr font;
    PdfError err;
    ASSERT_TRUE(fonts.loadFont(doc, fontDict, font, err));

    std::vector<PdfCharCode> codes;
    font->decode(std::string("\x00\x01\x00\x05", 4), codes);
    ASSERT_EQ(codes.size(), 2u);
    EXPECT_EQ(codes[0].code, 1u);
    EXPECT_EQ(codes[0].bytes, 2u);
    EXPECT_EQ(codes[1].code, 5u);
}

TEST_F(FontTest, CidWidthsFallBackToDefault)
{
    ASSERT_NO_FATAL_FAILURE(load("/W [1 [500 700]]"));

    PdfFontPtr font;
    PdfError err;
    ASSERT_TRUE(fonts.loadFont(doc, fontDict, font, err));
    EXPECT_DOUBLE_EQ(font->width(Cid(1)), 500);
    EXPECT_DOUBLE_EQ(font->width(Cid(2)), 700);
    EXPECT_DOUBLE_EQ(font->width(Cid(3)), 1000);
}

TEST_F(FontTest, GlyphCacheHandsOutOneOutlinePerGlyph)
{
    ASSERT_NO_FATAL_FAILURE(load());

    PdfFontPtr font;
    PdfError err;
    ASSERT_TRUE(fonts.loadFont(doc, fontDict, font, err));

    PdfGlyphPtr first;
    PdfGlyphPtr second;
    ASSERT_TRUE(glyphs.glyphForCode(*font, Cid(1), first, err)) << err.message;
    ASSERT_TRUE(glyphs.glyphForCode(*font, Cid(1), second, err));
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(glyphs.cacheSize(), 1u);
    EXPECT_EQ(glyphs.missCount(), 1u);
    EXPECT_EQ(glyphs.hitCount(), 1u);

    PdfGlyphPtr other;
    ASSERT_TRUE(glyphs.glyphForCode(*font, Cid(2), other, err));
    EXPECT_NE(other.get(), first.get());
}

TEST_F(FontTest, OutlineIsInEmUnits)
{
    ASSERT_NO_FATAL_FAILURE(load());

    PdfFontPtr font;
    PdfError err;
    ASSERT_TRUE(fonts.loadFont(doc, fontDict, font, err));

    PdfGlyphPtr glyph;
    ASSERT_TRUE(glyphs.glyphForCode(*font, Cid(1), glyph, err));
    EXPECT_DOUBLE_EQ(glyph->advance, 1000);

    PdfContours contours;
    PdfTessellator::FlattenFill(glyph->outline, PdfMatrix(), contours);
    double x0, y0, x1, y1;
    ASSERT_TRUE(PdfTessellator::Bounds(contours, x0, y0, x1, y1));
    EXPECT_NEAR(x0, 0.1, 1e-9);
    EXPECT_NEAR(y0, 0.0, 1e-9);
    EXPECT_NEAR(x1, 0.9, 1e-9);
    EXPECT_NEAR(y1, 0.8, 1e-9);
}

TEST_F(FontTest, UndefinedCidHasNoGlyph)
{
    ASSERT_NO_FATAL_FAILURE(load());

    PdfFontPtr font;
    PdfError err;
    ASSERT_TRUE(fonts.loadFont(doc, fontDict, font, err));

    uint32_t gid = 0;
    EXPECT_FALSE(font->glyphIndex(Cid(5), gid));
    EXPECT_FALSE(font->glyphIndex(Cid(0), gid));
    EXPECT_TRUE(font->glyphIndex(Cid(2), gid));
    EXPECT_EQ(gid, 2u);

    PdfGlyphPtr glyph;
    EXPECT_FALSE(glyphs.glyphForCode(*font, Cid(5), glyph, err));
    EXPECT_EQ(err.code, PdfErrorCode::UndefinedGlyph);
    EXPECT_EQ(glyphs.cacheSize(), 0u);
}

TEST_F(FontTest, MissingDescendantIsNotAFont)
{
    auto bogus = std::make_shared<PdfDictionary>();
    bogus->entries["/Type"] = std::make_shared<PdfName>("/Font");
    bogus->entries["/Subtype"] = std::make_shared<PdfName>("/Type0");

    PdfFontPtr font;
    PdfError err;
    EXPECT_FALSE(fonts.loadFont(doc, bogus, font, err));
    EXPECT_EQ(err.code, PdfErrorCode::UndefinedResource);
    EXPECT_EQ(fonts.cacheSize(), 0u);
}

TEST(GlyphCacheTest, BoxGlyphsAreSharedPerWidth)
{
    GlyphCache glyphs;
    PdfGlyphPtr a = glyphs.boxGlyph(600);
    PdfGlyphPtr b = glyphs.boxGlyph(600.2);
    PdfGlyphPtr c = glyphs.boxGlyph(250);

    EXPECT_EQ(a.get(), b.get());
    EXPECT_NE(a.get(), c.get());
    EXPECT_DOUBLE_EQ(a->advance, 600);
    EXPECT_FALSE(a->outline.empty());

    // no width falls back to half an em
    EXPECT_DOUBLE_EQ(glyphs.boxGlyph(0)->advance, 500);
}
