#include "PdfTestUtil.h"
#include "PdfContentParser.h"
#include "PdfPainter.h"

#include <zlib.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cmath>

namespace pdfraster
{
namespace test
{
    // =====================================================
    // PDF writer
    // =====================================================

    std::string TestPdfWriter::StreamBody(const std::string& dictEntries, const std::string& data)
    {
        return "<< " + dictEntries + " /Length " + std::to_string(data.size()) + " >>\nstream\n" +
            data + "\nendstream";
    }

    std::vector<uint8_t> TestPdfWriter::build(int rootNum, const std::string& trailerExtras) const
    {
        std::string out = "%PDF-1.7\n%\xE2\xE3\xCF\xD3\n";

        int maxNum = _objects.empty() ? 0 : _objects.rbegin()->first;
        std::vector<size_t> offsets(static_cast<size_t>(maxNum) + 1, 0);

        for (const auto& kv : _objects)
        {
            offsets[static_cast<size_t>(kv.first)] = out.size();
            out += std::to_string(kv.first) + " 0 obj\n" + kv.second + "\nendobj\n";
        }

        size_t xref = out.size();
        out += "xref\n0 " + std::to_string(maxNum + 1) + "\n";
        out += "0000000000 65535 f \n";
        char line[32];
        for (int n = 1; n <= maxNum; ++n)
        {
            if (_objects.count(n))
                std::snprintf(line, sizeof(line), "%010zu 00000 n \n", offsets[static_cast<size_t>(n)]);
            else
                std::snprintf(line, sizeof(line), "0000000000 65535 f \n");
            out += line;
        }

        out += "trailer\n<< /Size " + std::to_string(maxNum + 1) + " /Root " + std::to_string(rootNum) + " 0 R " +
            trailerExtras + " >>\nstartxref\n" + std::to_string(xref) + "\n%%EOF\n";
        return Bytes(out);
    }

    std::vector<uint8_t> BuildSinglePage(TestPdfWriter& writer,
        const std::string& content,
        const std::string& resources,
        double width,
        double height,
        const std::string& pageExtras)
    {
        int catalog = writer.reserve();
        int pages = writer.reserve();
        int page = writer.reserve();
        int contents = writer.addStream("", content);

        char box[128];
        std::snprintf(box, sizeof(box), "[0 0 %g %g]", width, height);

        writer.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
        writer.set(pages, "<< /Type /Pages /Kids [" + std::to_string(page) + " 0 R] /Count 1 >>");
        writer.set(page, "<< /Type /Page /Parent " + std::to_string(pages) + " 0 R /MediaBox " + box +
            " /Resources " + resources + " /Contents " + std::to_string(contents) + " 0 R " + pageExtras + " >>");
        return writer.build(catalog);
    }

    std::vector<uint8_t> SinglePagePdf(const std::string& content,
        const std::string& resources,
        double width,
        double height,
        const std::string& pageExtras)
    {
        TestPdfWriter writer;
        return BuildSinglePage(writer, content, resources, width, height, pageExtras);
    }

    std::string Deflate(const std::string& data)
    {
        uLongf size = compressBound(static_cast<uLong>(data.size()));
        std::string out(size, '\0');
        if (compress(reinterpret_cast<Bytef*>(&out[0]), &size,
            reinterpret_cast<const Bytef*>(data.data()), static_cast<uLong>(data.size())) != Z_OK)
            return std::string();
        out.resize(size);
        return out;
    }

    std::vector<uint8_t> Bytes(const std::string& s)
    {
        return std::vector<uint8_t>(s.begin(), s.end());
    }

    // =====================================================
    // TrueType
    // =====================================================

    namespace
    {
        void put16(std::string& s, int v)
        {
            s += static_cast<char>((v >> 8) & 0xFF);
            s += static_cast<char>(v & 0xFF);
        }

        void put32(std::string& s, uint32_t v)
        {
            s += static_cast<char>((v >> 24) & 0xFF);
            s += static_cast<char>((v >> 16) & 0xFF);
            s += static_cast<char>((v >> 8) & 0xFF);
            s += static_cast<char>(v & 0xFF);
        }

        uint32_t tableChecksum(const std::string& t)
        {
            uint32_t sum = 0;
            for (size_t i = 0; i < t.size(); i += 4)
            {
                uint32_t word = 0;
                for (size_t k = 0; k < 4; ++k)
                {
                    word <<= 8;
                    if (i + k < t.size())
                        word |= static_cast<uint8_t>(t[i + k]);
                }
                sum += word;
            }
            return sum;
        }

        std::string squareGlyph()
        {
            std::string g;
            put16(g, 1);        // contours
            put16(g, 100);      // xMin
            put16(g, 0);        // yMin
            put16(g, 900);      // xMax
            put16(g, 800);      // yMax
            put16(g, 3);        // last point of contour 0
            put16(g, 0);        // no instructions
            for (int i = 0; i < 4; ++i)
                g += static_cast<char>(0x01); // on curve, 16-bit deltas

            // (100,0) (100,800) (900,800) (900,0)
            put16(g, 100); put16(g, 0); put16(g, 800); put16(g, 0);
            put16(g, 0); put16(g, 800); put16(g, 0); put16(g, -800 & 0xFFFF);
            return g;
        }
    }

    std::string MakeTestTrueType(int numGlyphs)
    {
        const std::string square = squareGlyph();

        std::string glyf;
        std::string loca;
        put16(loca, 0);
        for (int gid = 0; gid < numGlyphs; ++gid)
        {
            if (gid > 0)
                glyf += square;
            put16(loca, static_cast<int>(glyf.size() / 2));
        }

        std::string head;
        put32(head, 0x00010000);    // version
        put32(head, 0x00010000);    // fontRevision
        put32(head, 0);             // checkSumAdjustment
        put32(head, 0x5F0F3CF5);    // magicNumber
        put16(head, 0x000B);        // flags
        put16(head, 1000);          // unitsPerEm
        put32(head, 0); put32(head, 0); // created
        put32(head, 0); put32(head, 0); // modified
        put16(head, 0); put16(head, 0); put16(head, 1000); put16(head, 800);
        put16(head, 0);             // macStyle
        put16(head, 8);             // lowestRecPPEM
        put16(head, 2);             // fontDirectionHint
        put16(head, 0);             // short loca
        put16(head, 0);             // glyphDataFormat

        std::string hhea;
        put32(hhea, 0x00010000);
        put16(hhea, 800);           // ascender
        put16(hhea, -200 & 0xFFFF); // descender
        put16(hhea, 0);             // lineGap
        put16(hhea, 1000);          // advanceWidthMax
        put16(hhea, 0);             // minLeftSideBearing
        put16(hhea, 100);           // minRightSideBearing
        put16(hhea, 900);           // xMaxExtent
        put16(hhea, 1);             // caretSlopeRise
        put16(hhea, 0);             // caretSlopeRun
        put16(hhea, 0);             // caretOffset
        for (int i = 0; i < 4; ++i)
            put16(hhea, 0);
        put16(hhea, 0);             // metricDataFormat
        put16(hhea, numGlyphs);     // numberOfHMetrics

        std::string hmtx;
        for (int gid = 0; gid < numGlyphs; ++gid)
        {
            put16(hmtx, 1000);
            put16(hmtx, gid > 0 ? 100 : 0);
        }

        std::string maxp;
        put32(maxp, 0x00010000);
        put16(maxp, numGlyphs);
        put16(maxp, 4);             // maxPoints
        put16(maxp, 1);             // maxContours
        put16(maxp, 0);             // maxCompositePoints
        put16(maxp, 0);             // maxCompositeContours
        put16(maxp, 2);             // maxZones
        put16(maxp, 0);             // maxTwilightPoints
        put16(maxp, 0);             // maxStorage
        put16(maxp, 0);             // maxFunctionDefs
        put16(maxp, 0);             // maxInstructionDefs
        put16(maxp, 0);             // maxStackElements
        put16(maxp, 0);             // maxSizeOfInstructions
        put16(maxp, 0);             // maxComponentElements
        put16(maxp, 0);             // maxComponentDepth

        // tag order
        const std::vector<std::pair<std::string, std::string>> tables = {
            { "glyf", glyf },
            { "head", head },
            { "hhea", hhea },
            { "hmtx", hmtx },
            { "loca", loca },
            { "maxp", maxp },
        };

        const int numTables = static_cast<int>(tables.size());
        int searchRange = 1;
        int entrySelector = 0;
        while (searchRange * 2 <= numTables)
        {
            searchRange *= 2;
            ++entrySelector;
        }
        searchRange *= 16;

        std::string font;
        put32(font, 0x00010000);
        put16(font, numTables);
        put16(font, searchRange);
        put16(font, entrySelector);
        put16(font, numTables * 16 - searchRange);

        size_t offset = 12 + 16 * tables.size();
        std::string body;
        for (const auto& t : tables)
        {
            font += t.first;
            put32(font, tableChecksum(t.second));
            put32(font, static_cast<uint32_t>(offset + body.size()));
            put32(font, static_cast<uint32_t>(t.second.size()));

            body += t.second;
            while (body.size() % 4)
                body += '\0';
        }
        return font + body;
    }

    int AddTestType0Font(TestPdfWriter& writer, int numGlyphs, const std::string& cidFontExtras)
    {
        int program = writer.addStream("/Filter /FlateDecode", Deflate(MakeTestTrueType(numGlyphs)));
        int descriptor = writer.add("<< /Type /FontDescriptor /FontName /TestSquares /Flags 4"
            " /FontBBox [0 0 1000 800] /ItalicAngle 0 /Ascent 800 /Descent -200 /CapHeight 800"
            " /StemV 80 /FontFile2 " + std::to_string(program) + " 0 R >>");
        int cidFont = writer.add("<< /Type /Font /Subtype /CIDFontType2 /BaseFont /TestSquares"
            " /CIDSystemInfo << /Registry (Adobe) /Ordering (Identity) /Supplement 0 >>"
            " /FontDescriptor " + std::to_string(descriptor) + " 0 R /DW 1000 /CIDToGIDMap /Identity " +
            cidFontExtras + " >>");
        return writer.add("<< /Type /Font /Subtype /Type0 /BaseFont /TestSquares /Encoding /Identity-H"
            " /DescendantFonts [" + std::to_string(cidFont) + " 0 R] >>");
    }

    // =====================================================
    // Rendering
    // =====================================================

    Rgba PixelAt(const PdfRenderTarget& target, int x, int y)
    {
        const uint8_t* p = target.pixel(x, y);
        return { p[0], p[1], p[2], p[3] };
    }

    int MaxDifference(const PdfRenderTarget& a, const PdfRenderTarget& b)
    {
        if (a.rgba.size() != b.rgba.size())
            return 255;
        int worst = 0;
        for (size_t i = 0; i < a.rgba.size(); ++i)
            worst = std::max(worst, std::abs(static_cast<int>(a.rgba[i]) - static_cast<int>(b.rgba[i])));
        return worst;
    }

    double MeanDifference(const PdfRenderTarget& a, const PdfRenderTarget& b)
    {
        if (a.rgba.size() != b.rgba.size() || a.rgba.empty())
            return 255.0;
        double sum = 0;
        for (size_t i = 0; i < a.rgba.size(); ++i)
            sum += std::abs(static_cast<int>(a.rgba[i]) - static_cast<int>(b.rgba[i]));
        return sum / static_cast<double>(a.rgba.size());
    }

    bool RenderCpu(const PdfScene& scene, double scale, PdfRenderTarget& out, PdfError& err)
    {
        PdfViewport viewport;
        if (!PdfSceneRasterizer::ViewportFor(scene.pageBox, scene.rotate, scale, viewport, err))
            return false;

        const float transparent[4] = { 0, 0, 0, 0 };
        PdfPainter painter;
        return PdfSceneRasterizer::Rasterize(scene, viewport, transparent, painter, out, err);
    }

    bool TestRender::load(const std::vector<uint8_t>& bytes)
    {
        return doc.loadFromBytes(bytes, error);
    }

    bool TestRender::buildScene(int pageIndex)
    {
        return PdfContentParser::BuildPageScene(doc, pageIndex, fonts, glyphs, scene, error);
    }

    bool TestRender::rasterize(double scale)
    {
        return scene && RenderCpu(*scene, scale, target, error);
    }

    bool TestRender::run(const std::vector<uint8_t>& bytes, double scale, int pageIndex)
    {
        return load(bytes) && buildScene(pageIndex) && rasterize(scale);
    }
}
}
