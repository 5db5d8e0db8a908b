#include <gtest/gtest.h>

#include "PdfTestUtil.h"
#include "PdfEngine.h"

#include <cstdlib>
#include <string>
#include <vector>

using namespace pdfraster;
using namespace pdfraster::test;

namespace
{
    std::string LastError()
    {
        char buffer[256] = {};
        PdfRaster_GetLastError(buffer, sizeof(buffer));
        return buffer;
    }

    class EngineApiTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            setenv("PDFRASTER_BACKEND", "cpu", 1);
            engine = PdfRaster_CreateEngine();
            ASSERT_NE(engine, nullptr);
        }

        void TearDown() override
        {
            PdfRaster_DestroyEngine(engine);
            unsetenv("PDFRASTER_BACKEND");
        }

        void open(const std::vector<uint8_t>& bytes)
        {
            ASSERT_EQ(PdfRaster_OpenDocument(engine, bytes.data(), bytes.size(), &doc), PDFRASTER_OK)
                << LastError();
        }

        PDFRASTER_ENGINE engine = nullptr;
        PDFRASTER_DOCUMENT doc = 0;
    };

    std::vector<uint8_t> DocumentWithInfo()
    {
        TestPdfWriter writer;
        int info = writer.add("<< /Title (Annual Figures) /Author (Finance) >>");
        int catalog = writer.add("<< /Type /Catalog /Pages 3 0 R >>");
        writer.add("<< /Type /Pages /Kids [4 0 R] /Count 1 >>");
        writer.add("<< /Type /Page /Parent 3 0 R /MediaBox [0 0 300 200] /Rotate 90 >>");
        return writer.build(catalog, "/Info " + std::to_string(info) + " 0 R");
    }
}

TEST_F(EngineApiTest, PageCountAndSize)
{
    ASSERT_NO_FATAL_FAILURE(open(DocumentWithInfo()));
    EXPECT_EQ(PdfRaster_GetPageCount(engine, doc), 1);

    double w = 0, h = 0;
    ASSERT_EQ(PdfRaster_GetPageSize(engine, doc, 0, &w, &h), PDFRASTER_OK);
    EXPECT_DOUBLE_EQ(w, 200);
    EXPECT_DOUBLE_EQ(h, 300);

    EXPECT_LT(PdfRaster_GetPageSize(engine, doc, 1, &w, &h), 0);
}

TEST_F(EngineApiTest, DocumentInfoIsSizedThenCopied)
{
    ASSERT_NO_FATAL_FAILURE(open(DocumentWithInfo()));

    int len = PdfRaster_GetDocumentInfo(engine, doc, "Title", nullptr, 0);
    ASSERT_EQ(len, 14);

    std::vector<char> buffer(static_cast<size_t>(len) + 1);
    EXPECT_EQ(PdfRaster_GetDocumentInfo(engine, doc, "Title", buffer.data(), len + 1), len);
    EXPECT_EQ(std::string(buffer.data()), "Annual Figures");

    EXPECT_EQ(PdfRaster_GetDocumentInfo(engine, doc, "Subject", nullptr, 0), 0);
    EXPECT_EQ(PdfRaster_GetDocumentInfo(engine, doc, "Keywords", nullptr, 0), PDFRASTER_INVALID_ARGUMENT);
}

TEST_F(EngineApiTest, RenderReportsSizeBeforeCopying)
{
    ASSERT_NO_FATAL_FAILURE(open(SinglePagePdf("1 0 0 rg 0 0 100 100 re f", "<< >>", 100, 50)));

    int w = 0, h = 0;
    int size = PdfRaster_RenderPage(engine, doc, 0, 2.0, nullptr, 0, &w, &h);
    EXPECT_EQ(w, 200);
    EXPECT_EQ(h, 100);
    ASSERT_EQ(size, 200 * 100 * 4);

    // too small: nothing written
    std::vector<uint8_t> small(16, 0xAB);
    EXPECT_EQ(PdfRaster_RenderPage(engine, doc, 0, 2.0, small.data(), static_cast<int>(small.size()), &w, &h), size);
    EXPECT_EQ(small[0], 0xAB);

    std::vector<uint8_t> pixels(static_cast<size_t>(size));
    EXPECT_EQ(PdfRaster_RenderPage(engine, doc, 0, 2.0, pixels.data(), size, &w, &h), size);
    EXPECT_EQ(pixels[0], 255);
    EXPECT_EQ(pixels[1], 0);
    EXPECT_EQ(pixels[3], 255);

    size_t hits = 0, misses = 0, entries = 0, bytes = 0;
    PdfRaster_GetCacheStats(engine, &hits, &misses, &entries, &bytes);
    EXPECT_EQ(entries, 1u);
    EXPECT_EQ(hits, 2u);
    EXPECT_EQ(bytes, static_cast<size_t>(size));

    PdfRaster_ClearCache(engine);
    PdfRaster_GetCacheStats(engine, &hits, &misses, &entries, &bytes);
    EXPECT_EQ(entries, 0u);
    EXPECT_EQ(bytes, 0u);
}

TEST_F(EngineApiTest, OutOfRangePageHasADisplayMessage)
{
    ASSERT_NO_FATAL_FAILURE(open(SinglePagePdf("")));

    int w = 0, h = 0;
    int status = PdfRaster_RenderPage(engine, doc, 2, 1.0, nullptr, 0, &w, &h);
    EXPECT_EQ(status, -static_cast<int>(PdfErrorCode::RenderPageFault));
    EXPECT_EQ(LastError(), "page 3 could not be rendered");
}

TEST_F(EngineApiTest, MalformedFile)
{
    const std::string junk = "this is not a pdf file at all";
    PDFRASTER_DOCUMENT d = 0;
    int status = PdfRaster_OpenDocument(engine, reinterpret_cast<const uint8_t*>(junk.data()), junk.size(), &d);
    EXPECT_EQ(status, -static_cast<int>(PdfErrorCode::MalformedDocument));
    EXPECT_FALSE(LastError().empty());
}

TEST_F(EngineApiTest, ClosedDocumentIsGone)
{
    ASSERT_NO_FATAL_FAILURE(open(SinglePagePdf("")));
    PdfRaster_CloseDocument(engine, doc);
    EXPECT_LT(PdfRaster_GetPageCount(engine, doc), 0);

    // cancelling a closed document is harmless
    PdfRaster_CancelRender(engine, doc, 0, 1.0);
}

TEST(EngineApiArgumentsTest, NullArgumentsAreRejected)
{
    int w = 0, h = 0;
    PDFRASTER_DOCUMENT d = 0;
    const uint8_t byte = 0;

    EXPECT_EQ(PdfRaster_RenderPage(nullptr, 1, 0, 1.0, nullptr, 0, &w, &h), PDFRASTER_INVALID_ARGUMENT);
    EXPECT_NE(LastError().find("invalid argument"), std::string::npos);
    EXPECT_EQ(PdfRaster_OpenDocument(nullptr, &byte, 1, &d), PDFRASTER_INVALID_ARGUMENT);
    EXPECT_LT(PdfRaster_GetPageCount(nullptr, 1), 0);

    // these tolerate a null engine
    PdfRaster_CloseDocument(nullptr, 1);
    PdfRaster_CancelRender(nullptr, 1, 0, 1.0);
    PdfRaster_ClearCache(nullptr);
    PdfRaster_DestroyEngine(nullptr);
}

TEST(PdfEngineTest, DisplayMessages)
{
    PdfError err;
    err.set(PdfErrorCode::RenderGlyphFault, "no font");
    EXPECT_EQ(PdfEngine::DisplayMessage(err, 0), "page 1 could not be rendered: fonts are unavailable");

    err.set(PdfErrorCode::Cancelled, "render cancelled");
    EXPECT_EQ(PdfEngine::DisplayMessage(err, 4), "rendering of page 5 was cancelled");

    err.set(PdfErrorCode::RenderBackendFault, "viewport too large");
    EXPECT_EQ(PdfEngine::DisplayMessage(err, 1), "page 2 could not be rendered: viewport too large");
}

TEST(PdfEngineTest, EngineOverCppApi)
{
    RenderOptions options;
    options.backend = PdfBackend::Cpu;
    PdfEngine engine(options);

    DocumentHandle doc = 0;
    PdfError err;
    ASSERT_TRUE(engine.open(SinglePagePdf("0 0 1 rg 0 0 10 10 re f", "<< >>", 50, 40), doc, err)) << err.message;

    int count = 0;
    ASSERT_TRUE(engine.pageCount(doc, count, err));
    EXPECT_EQ(count, 1);

    PageSize size;
    ASSERT_TRUE(engine.pageSize(doc, 0, size, err));
    EXPECT_DOUBLE_EQ(size.width, 50);
    EXPECT_DOUBLE_EQ(size.height, 40);

    PdfRenderTargetPtr target;
    ASSERT_TRUE(engine.renderPage(doc, 0, 1.0, target, err)) << err.message;
    EXPECT_EQ(PixelAt(*target, 5, 35).b, 255);

    ASSERT_TRUE(engine.replace(doc, SinglePagePdf("", "<< >>", 60, 40), err));
    ASSERT_TRUE(engine.pageSize(doc, 0, size, err));
    EXPECT_DOUBLE_EQ(size.width, 60);

    engine.close(doc);
    EXPECT_FALSE(engine.pageCount(doc, count, err));
}
