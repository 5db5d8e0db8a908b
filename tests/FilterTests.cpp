#include <gtest/gtest.h>

#include "PdfTestUtil.h"
#include "PdfFilters.h"

#include <string>

using namespace pdfraster;
using namespace pdfraster::test;

namespace
{
    std::string Text(const std::vector<uint8_t>& v)
    {
        return std::string(v.begin(), v.end());
    }
}

TEST(PdfFiltersTest, FlateRoundTripsThroughZlib)
{
    const std::string plain = "BT /F1 12 Tf 72 712 Td (Hello) Tj ET";
    std::vector<uint8_t> out;
    ASSERT_TRUE(PdfFilters::FlateDecode(Bytes(Deflate(plain)), out));
    EXPECT_EQ(Text(out), plain);
}

TEST(PdfFiltersTest, FlateRejectsGarbage)
{
    // neither a zlib header nor a valid raw deflate block type
    std::vector<uint8_t> in = { 0x07, 0x07, 0x07, 0x07 };
    std::vector<uint8_t> out;
    EXPECT_FALSE(PdfFilters::FlateDecode(in, out));
}

TEST(PdfFiltersTest, ASCIIHex)
{
    std::vector<uint8_t> out;
    ASSERT_TRUE(PdfFilters::ASCIIHexDecode(Bytes("48 65 6C\n6c 6F>"), out));
    EXPECT_EQ(Text(out), "Hello");

    // odd digit count: the last one is padded with 0
    ASSERT_TRUE(PdfFilters::ASCIIHexDecode(Bytes("4142 7>"), out));
    EXPECT_EQ(Text(out), "ABp");
}

TEST(PdfFiltersTest, ASCII85)
{
    std::vector<uint8_t> out;
    ASSERT_TRUE(PdfFilters::ASCII85Decode(Bytes("87cURD]j7BEbo7~>"), out));
    EXPECT_EQ(Text(out), "Hello world");

    ASSERT_TRUE(PdfFilters::ASCII85Decode(Bytes("z~>"), out));
    EXPECT_EQ(out, std::vector<uint8_t>(4, 0));
}

TEST(PdfFiltersTest, RunLength)
{
    std::vector<uint8_t> in = { 2, 'a', 'b', 'c', 254, 'x', 128, 'z' };
    std::vector<uint8_t> out;
    ASSERT_TRUE(PdfFilters::RunLengthDecode(in, out));
    EXPECT_EQ(Text(out), "abcxxx");
}

TEST(PdfFiltersTest, LZWSampleFromTheFormat)
{
    std::vector<uint8_t> in = { 0x80, 0x0B, 0x60, 0x50, 0x22, 0x0C, 0x0C, 0x85, 0x01 };
    std::vector<uint8_t> out;
    ASSERT_TRUE(PdfFilters::LZWDecode(in, out));
    EXPECT_EQ(out, (std::vector<uint8_t>{ 45, 45, 45, 45, 45, 65, 45, 45, 45, 66 }));
}

TEST(PdfFiltersTest, PngUpPredictor)
{
    PdfFilterParams params;
    params.predictor = 12;
    params.columns = 3;

    std::vector<uint8_t> data = { 2, 1, 2, 3, 2, 1, 1, 1 };
    ASSERT_TRUE(PdfFilters::ApplyPredictor(params, data));
    EXPECT_EQ(data, (std::vector<uint8_t>{ 1, 2, 3, 2, 3, 4 }));
}

TEST(PdfFiltersTest, TiffPredictor)
{
    PdfFilterParams params;
    params.predictor = 2;
    params.columns = 3;

    std::vector<uint8_t> data = { 1, 1, 1, 5, 250, 10 };
    ASSERT_TRUE(PdfFilters::ApplyPredictor(params, data));
    EXPECT_EQ(data, (std::vector<uint8_t>{ 1, 2, 3, 5, 255, 9 }));
}

TEST(PdfFiltersTest, ChainAppliesFiltersInOrder)
{
    const std::string plain = "0 0 1 rg 10 10 50 50 re f";
    const std::string deflated = Deflate(plain);

    static const char* digits = "0123456789ABCDEF";
    std::string hex;
    for (unsigned char c : deflated)
    {
        hex += digits[c >> 4];
        hex += digits[c & 15];
    }
    hex += '>';

    std::vector<uint8_t> out;
    ASSERT_TRUE(PdfFilters::Decode(Bytes(hex), { "/AHx", "/Fl" }, {}, out));
    EXPECT_EQ(Text(out), plain);
}

TEST(PdfFiltersTest, ImageCodecEndsTheChain)
{
    std::vector<uint8_t> jpeg = { 0xFF, 0xD8, 0xFF, 0xD9 };
    std::vector<uint8_t> out;
    std::string codec;
    ASSERT_TRUE(PdfFilters::Decode(jpeg, { "/DCTDecode" }, {}, out, &codec));
    EXPECT_EQ(codec, "/DCTDecode");
    EXPECT_EQ(out, jpeg);

    EXPECT_FALSE(PdfFilters::Decode(jpeg, { "/DCTDecode" }, {}, out));
}

TEST(PdfFiltersTest, UnknownFilterFails)
{
    std::vector<uint8_t> out;
    EXPECT_FALSE(PdfFilters::Decode(Bytes("abc"), { "/NoSuchDecode" }, {}, out));
}

TEST(PdfFiltersTest, DocumentStreamWithDecodeParms)
{
    std::string raw;
    raw += static_cast<char>(2); raw += "abc";
    raw += static_cast<char>(2); raw += std::string(3, '\x01');

    TestPdfWriter writer;
    int s = writer.addStream("/Filter /FlateDecode /DecodeParms << /Predictor 12 /Columns 3 >>", Deflate(raw));
    int catalog = writer.add("<< /Type /Catalog /Pages 3 0 R >>");
    writer.add("<< /Type /Pages /Kids [4 0 R] /Count 1 >>");
    writer.add("<< /Type /Page /Parent 3 0 R /MediaBox [0 0 10 10] >>");

    PdfDocument doc;
    PdfError err;
    ASSERT_TRUE(doc.loadFromBytes(writer.build(catalog), err));

    auto stream = AsStream(doc.getObjects().at(s));
    ASSERT_TRUE(stream);
    std::vector<uint8_t> out;
    ASSERT_TRUE(doc.decodeStream(stream, out));
    EXPECT_EQ(Text(out), "abcbcd");
}
