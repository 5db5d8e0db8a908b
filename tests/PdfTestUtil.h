#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "PdfDocument.h"
#include "FontCache.h"
#include "GlyphCache.h"
#include "PdfScene.h"
#include "PdfSceneRasterizer.h"

namespace pdfraster
{
namespace test
{
    // ============================================
    // In-memory PDF files with a valid xref table
    // ============================================
    class TestPdfWriter
    {
    public:
        // Next free object number, defined later with set()
        int reserve() { return _next++; }

        void set(int num, const std::string& body) { _objects[num] = body; }

        int add(const std::string& body)
        {
            int num = reserve();
            set(num, body);
            return num;
        }

        // dictEntries go inside << >> next to /Length
        int addStream(const std::string& dictEntries, const std::string& data)
        {
            return add(StreamBody(dictEntries, data));
        }

        static std::string StreamBody(const std::string& dictEntries, const std::string& data);

        // trailerExtras is appended inside the trailer dictionary
        std::vector<uint8_t> build(int rootNum, const std::string& trailerExtras = std::string()) const;

    private:
        std::map<int, std::string> _objects;
        int _next = 1;
    };

    // Catalog, a one-kid page tree and a page over content. Objects added
    // to writer beforehand can be referenced from resources.
    std::vector<uint8_t> BuildSinglePage(TestPdfWriter& writer,
        const std::string& content,
        const std::string& resources = "<< >>",
        double width = 200,
        double height = 200,
        const std::string& pageExtras = std::string());

    std::vector<uint8_t> SinglePagePdf(const std::string& content,
        const std::string& resources = "<< >>",
        double width = 200,
        double height = 200,
        const std::string& pageExtras = std::string());

    std::string Deflate(const std::string& data);

    std::vector<uint8_t> Bytes(const std::string& s);

    // TrueType program with numGlyphs glyphs, 1000 units per em. Glyph 0
    // is empty; every other glyph is the square [100,900] x [0,800] with
    // a 1000 unit advance. No cmap, as in subset fonts embedded in PDFs.
    std::string MakeTestTrueType(int numGlyphs = 3);

    // Type0 font over MakeTestTrueType(numGlyphs) as a CIDFontType2 with
    // Identity-H and an identity CIDToGIDMap. Returns the font object.
    int AddTestType0Font(TestPdfWriter& writer, int numGlyphs = 3,
        const std::string& cidFontExtras = std::string());

    // ============================================
    // Rendering
    // ============================================
    struct Rgba
    {
        int r, g, b, a;
    };

    Rgba PixelAt(const PdfRenderTarget& target, int x, int y);

    // Largest per-channel difference over two equally sized targets
    int MaxDifference(const PdfRenderTarget& a, const PdfRenderTarget& b);

    // Mean absolute per-channel difference
    double MeanDifference(const PdfRenderTarget& a, const PdfRenderTarget& b);

    // Parses a document and renders one page on the CPU painter
    struct TestRender
    {
        PdfDocument doc;
        FontCache fonts;
        GlyphCache glyphs;
        PdfScenePtr scene;
        PdfRenderTarget target;
        PdfError error;

        bool load(const std::vector<uint8_t>& bytes);
        bool buildScene(int pageIndex = 0);
        bool rasterize(double scale = 1.0);

        // load + buildScene + rasterize
        bool run(const std::vector<uint8_t>& bytes, double scale = 1.0, int pageIndex = 0);
    };

    // Renders scene content into a fresh target on the CPU painter
    bool RenderCpu(const PdfScene& scene, double scale, PdfRenderTarget& out, PdfError& err);
}
}
