#include <gtest/gtest.h>

#include "PdfTestUtil.h"
#include "PdfDocument.h"

#include <string>

using namespace pdfraster;
using namespace pdfraster::test;

namespace
{
    std::string AsText(const std::vector<uint8_t>& bytes)
    {
        return std::string(bytes.begin(), bytes.end());
    }

    void Put(std::string& s, uint32_t v, int bytes)
    {
        for (int i = bytes - 1; i >= 0; --i)
            s += static_cast<char>((v >> (8 * i)) & 0xFF);
    }
}

TEST(PdfDocumentTest, LoadsSinglePage)
{
    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(SinglePagePdf("0 0 m"), err)) << err.message;
    EXPECT_EQ(doc.pageCount(), 1);

    PdfPage page;
    ASSERT_TRUE(doc.page(0, page, err));
    EXPECT_DOUBLE_EQ(page.box().width(), 200);
    EXPECT_DOUBLE_EQ(page.box().height(), 200);
    EXPECT_EQ(page.rotate, 0);
}

TEST(PdfDocumentTest, PageSizeAppliesRotation)
{
    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(SinglePagePdf("", "<< >>", 200, 100, "/Rotate 90"), err));

    double w = 0, h = 0;
    ASSERT_TRUE(doc.pageSize(0, w, h, err));
    EXPECT_DOUBLE_EQ(w, 100);
    EXPECT_DOUBLE_EQ(h, 200);
}

TEST(PdfDocumentTest, PageIndexOutOfRange)
{
    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(SinglePagePdf(""), err));

    PdfPage page;
    EXPECT_FALSE(doc.page(1, page, err));
    EXPECT_EQ(err.code, PdfErrorCode::PageIndexOutOfRange);

    err.clear();
    EXPECT_FALSE(doc.page(-1, page, err));
    EXPECT_EQ(err.code, PdfErrorCode::PageIndexOutOfRange);
}

TEST(PdfDocumentTest, GarbageIsMalformed)
{
    PdfDocument doc;
    PdfError err;
    EXPECT_FALSE(doc.loadFromBytes(Bytes("this is not a pdf file at all"), err));
    EXPECT_EQ(err.code, PdfErrorCode::MalformedDocument);

    err.clear();
    EXPECT_FALSE(doc.loadFromBytes(Bytes("%PDF"), err));
    EXPECT_EQ(err.code, PdfErrorCode::MalformedDocument);
}

TEST(PdfDocumentTest, EncryptedDocumentIsRejected)
{
    TestPdfWriter writer;
    int encrypt = writer.add("<< /Filter /Standard /V 1 /R 2 /O (x) /U (y) /P -4 >>");
    int catalog = writer.add("<< /Type /Catalog /Pages 3 0 R >>");
    writer.add("<< /Type /Pages /Kids [4 0 R] /Count 1 >>");
    writer.add("<< /Type /Page /Parent 3 0 R /MediaBox [0 0 10 10] >>");

    PdfDocument doc;
    PdfError err;
    EXPECT_FALSE(doc.loadFromBytes(writer.build(catalog, "/Encrypt " + std::to_string(encrypt) + " 0 R"), err));
    EXPECT_EQ(err.code, PdfErrorCode::MalformedDocument);
}

TEST(PdfDocumentTest, CyclicPageTreeIsFatal)
{
    TestPdfWriter writer;
    int catalog = writer.add("<< /Type /Catalog /Pages 2 0 R >>");
    writer.add("<< /Type /Pages /Kids [3 0 R] /Count 1 >>");
    writer.add("<< /Type /Pages /Parent 2 0 R /Kids [2 0 R] /Count 1 >>");

    PdfDocument doc;
    PdfError err;
    EXPECT_FALSE(doc.loadFromBytes(writer.build(catalog), err));
    EXPECT_EQ(err.code, PdfErrorCode::CyclicPageTree);
}

TEST(PdfDocumentTest, ListsPagesInTreeOrder)
{
    TestPdfWriter writer;
    int catalog = writer.add("<< /Type /Catalog /Pages 2 0 R >>");
    writer.add("<< /Type /Pages /Kids [3 0 R 4 0 R] /Count 2 >>");
    writer.add("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 10 10] >>");
    writer.add("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 20 20] >>");

    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(writer.build(catalog), err)) << err.message;
    EXPECT_EQ(doc.pageCount(), 2);

    double w = 0, h = 0;
    ASSERT_TRUE(doc.pageSize(1, w, h, err));
    EXPECT_DOUBLE_EQ(w, 20);
}

TEST(PdfDocumentTest, RecoversFromBrokenStartxref)
{
    std::string text = AsText(SinglePagePdf("1 0 0 rg 0 0 10 10 re f"));
    size_t pos = text.rfind("startxref\n");
    ASSERT_NE(pos, std::string::npos);
    text = text.substr(0, pos) + "startxref\n999999\n%%EOF\n";

    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(Bytes(text), err)) << err.message;
    EXPECT_EQ(doc.pageCount(), 1);

    PdfPage page;
    std::vector<uint8_t> content;
    ASSERT_TRUE(doc.page(0, page, err));
    ASSERT_TRUE(doc.pageContents(page, content, err));
    EXPECT_EQ(AsText(content), "1 0 0 rg 0 0 10 10 re f\n");
}

TEST(PdfDocumentTest, RecoversWithoutXrefOrTrailer)
{
    std::string text = AsText(SinglePagePdf("0 0 1 rg 0 0 10 10 re f"));
    size_t pos = text.find("xref\n");
    ASSERT_NE(pos, std::string::npos);
    text = text.substr(0, pos);

    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(Bytes(text), err)) << err.message;
    EXPECT_EQ(doc.pageCount(), 1);
}

TEST(PdfDocumentTest, ReadsXrefStreamAndObjectStream)
{
    const std::string content = "0 1 0 rg 0 0 50 50 re f";
    const std::string objs[3] = {
        "<< /Type /Catalog /Pages 2 0 R >>",
        "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 100 50] /Contents 4 0 R >>",
    };

    std::string header;
    std::string body;
    for (int i = 0; i < 3; ++i)
    {
        header += std::to_string(i + 1) + " " + std::to_string(body.size()) + " ";
        body += objs[i] + "\n";
    }
    std::string objStm = header + body;

    std::string file = "%PDF-1.7\n";
    size_t off4 = file.size();
    file += "4 0 obj\n" + TestPdfWriter::StreamBody("", content) + "\nendobj\n";
    size_t off5 = file.size();
    file += "5 0 obj\n" + TestPdfWriter::StreamBody(
        "/Type /ObjStm /N 3 /First " + std::to_string(header.size()) + " /Filter /FlateDecode",
        Deflate(objStm)) + "\nendobj\n";
    size_t off6 = file.size();

    std::string xref;
    Put(xref, 0, 1); Put(xref, 0, 4); Put(xref, 65535, 2);
    for (int i = 0; i < 3; ++i)
    {
        Put(xref, 2, 1); Put(xref, 5, 4); Put(xref, static_cast<uint32_t>(i), 2);
    }
    Put(xref, 1, 1); Put(xref, static_cast<uint32_t>(off4), 4); Put(xref, 0, 2);
    Put(xref, 1, 1); Put(xref, static_cast<uint32_t>(off5), 4); Put(xref, 0, 2);
    Put(xref, 1, 1); Put(xref, static_cast<uint32_t>(off6), 4); Put(xref, 0, 2);

    file += "6 0 obj\n" + TestPdfWriter::StreamBody("/Type /XRef /Size 7 /W [1 4 2] /Root 1 0 R", xref) +
        "\nendobj\nstartxref\n" + std::to_string(off6) + "\n%%EOF\n";

    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(Bytes(file), err)) << err.message;
    ASSERT_EQ(doc.pageCount(), 1);

    double w = 0, h = 0;
    ASSERT_TRUE(doc.pageSize(0, w, h, err));
    EXPECT_DOUBLE_EQ(w, 100);
    EXPECT_DOUBLE_EQ(h, 50);

    PdfPage page;
    std::vector<uint8_t> decoded;
    ASSERT_TRUE(doc.page(0, page, err));
    ASSERT_TRUE(doc.pageContents(page, decoded, err));
    EXPECT_EQ(AsText(decoded), content + "\n");
}

TEST(PdfDocumentTest, DanglingReference)
{
    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(SinglePagePdf(""), err));

    PdfObjectPtr out;
    EXPECT_FALSE(doc.resolve(PdfIndirectRef(999, 0), out, err));
    EXPECT_EQ(err.code, PdfErrorCode::DanglingReference);
    EXPECT_EQ(doc.resolveIndirect(std::make_shared<PdfIndirectRef>(999, 0)), nullptr);
}

TEST(PdfDocumentTest, InheritsBoxAndRotationFromAncestors)
{
    TestPdfWriter writer;
    int catalog = writer.add("<< /Type /Catalog /Pages 2 0 R >>");
    writer.add("<< /Type /Pages /Kids [3 0 R] /Count 1 /MediaBox [0 0 300 400] /Rotate 270 >>");
    writer.add("<< /Type /Page /Parent 2 0 R >>");

    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(writer.build(catalog), err));

    PdfPage page;
    ASSERT_TRUE(doc.page(0, page, err));
    EXPECT_DOUBLE_EQ(page.mediaBox.width(), 300);
    EXPECT_EQ(page.rotate, 270);
    ASSERT_EQ(page.ancestors.size(), 2u);
}

TEST(PdfDocumentTest, CropBoxIsClippedToMediaBox)
{
    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(SinglePagePdf("", "<< >>", 200, 200, "/CropBox [50 50 400 150]"), err));

    PdfPage page;
    ASSERT_TRUE(doc.page(0, page, err));
    PdfRect box = page.box();
    EXPECT_DOUBLE_EQ(box.x0, 50);
    EXPECT_DOUBLE_EQ(box.y0, 50);
    EXPECT_DOUBLE_EQ(box.x1, 200);
    EXPECT_DOUBLE_EQ(box.y1, 150);
}

TEST(PdfDocumentTest, ContentsArrayIsJoined)
{
    TestPdfWriter writer;
    int a = writer.addStream("", "q");
    int b = writer.addStream("/Filter /FlateDecode", Deflate("Q"));
    int catalog = writer.add("<< /Type /Catalog /Pages " + std::to_string(a + 3) + " 0 R >>");
    int pages = writer.add("<< /Type /Pages /Kids [" + std::to_string(a + 4) + " 0 R] /Count 1 >>");
    writer.add("<< /Type /Page /Parent " + std::to_string(pages) + " 0 R /MediaBox [0 0 10 10] /Contents [" +
        std::to_string(a) + " 0 R " + std::to_string(b) + " 0 R] >>");

    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(writer.build(catalog), err)) << err.message;

    PdfPage page;
    std::vector<uint8_t> content;
    ASSERT_TRUE(doc.page(0, page, err));
    ASSERT_TRUE(doc.pageContents(page, content, err));
    EXPECT_EQ(AsText(content), "q\nQ\n");
}

TEST(PdfDocumentTest, ReadsDocumentInfo)
{
    TestPdfWriter writer;
    int info = writer.add("<< /Title (Quarterly Report) /Author (A. Writer) >>");
    int catalog = writer.add("<< /Type /Catalog /Pages 3 0 R >>");
    writer.add("<< /Type /Pages /Kids [4 0 R] /Count 1 >>");
    writer.add("<< /Type /Page /Parent 3 0 R /MediaBox [0 0 10 10] >>");

    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(writer.build(catalog, "/Info " + std::to_string(info) + " 0 R"), err));
    EXPECT_EQ(doc.info().title, "Quarterly Report");
    EXPECT_EQ(doc.info().author, "A. Writer");
    EXPECT_EQ(doc.info().subject, "");
}
