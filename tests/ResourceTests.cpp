#include <gtest/gtest.h>

#include "PdfTestUtil.h"
#include "PdfResources.h"

using namespace pdfraster;
using namespace pdfraster::test;

namespace
{
    // Pages node: /Font /F1 and /XObject /Im1 (indirect)
    // Page 0: own /Font with /F2 only
    // Page 1: no /Resources at all
    std::vector<uint8_t> InheritedResourcesPdf()
    {
        TestPdfWriter writer;
        int catalog = writer.reserve();
        int pages = writer.reserve();
        int page0 = writer.reserve();
        int page1 = writer.reserve();
        int image = writer.add("<< /Marker 7 >>");

        writer.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
        writer.set(pages, "<< /Type /Pages /Kids [" + std::to_string(page0) + " 0 R " +
            std::to_string(page1) + " 0 R] /Count 2 /MediaBox [0 0 100 100]"
            " /Resources << /Font << /F1 << /Marker 1 >> >>"
            " /XObject << /Im1 " + std::to_string(image) + " 0 R >> >> >>");
        writer.set(page0, "<< /Type /Page /Parent " + std::to_string(pages) + " 0 R"
            " /Resources << /Font << /F2 << /Marker 2 >> >> >> >>");
        writer.set(page1, "<< /Type /Page /Parent " + std::to_string(pages) + " 0 R >>");
        return writer.build(catalog);
    }

    double Marker(const PdfObjectPtr& obj)
    {
        auto dict = AsDict(obj);
        return dict ? NumberOr(dict->get("/Marker"), -1) : -1;
    }

    class PdfResourcesTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            PdfError err;
            ASSERT_TRUE(doc.loadFromBytes(InheritedResourcesPdf(), err)) << err.message;
            ASSERT_TRUE(doc.page(0, page0, err));
            ASSERT_TRUE(doc.page(1, page1, err));
        }

        PdfDocument doc;
        PdfPage page0;
        PdfPage page1;
    };
}

TEST_F(PdfResourcesTest, PageResourceWins)
{
    PdfObjectPtr out;
    PdfError err;
    ASSERT_TRUE(ResolveResource(doc, page0, ResourceCategory::Font, "F2", out, err));
    EXPECT_EQ(Marker(out), 2);
}

TEST_F(PdfResourcesTest, OtherCategoriesAreInherited)
{
    PdfObjectPtr out;
    PdfError err;
    ASSERT_TRUE(ResolveResource(doc, page0, ResourceCategory::XObject, "/Im1", out, err));
    EXPECT_EQ(Marker(out), 7);
}

TEST_F(PdfResourcesTest, NearestCategoryDictionaryDecides)
{
    // page 0 has its own /Font, so the ancestor's /F1 is not consulted
    PdfObjectPtr out;
    PdfError err;
    EXPECT_FALSE(ResolveResource(doc, page0, ResourceCategory::Font, "F1", out, err));
    EXPECT_EQ(err.code, PdfErrorCode::UndefinedResource);
}

TEST_F(PdfResourcesTest, PageWithoutResourcesInheritsEverything)
{
    PdfObjectPtr out;
    PdfError err;
    ASSERT_TRUE(ResolveResource(doc, page1, ResourceCategory::Font, "F1", out, err));
    EXPECT_EQ(Marker(out), 1);

    EXPECT_FALSE(ResolveResource(doc, page1, ResourceCategory::Font, "F2", out, err));
    EXPECT_EQ(err.code, PdfErrorCode::UndefinedResource);
}

TEST_F(PdfResourcesTest, MissingCategoryIsUndefined)
{
    PdfObjectPtr out;
    PdfError err;
    EXPECT_FALSE(ResolveResource(doc, page1, ResourceCategory::Shading, "Sh0", out, err));
    EXPECT_EQ(err.code, PdfErrorCode::UndefinedResource);
    EXPECT_NE(err.message.find("/Sh0"), std::string::npos);
}

TEST_F(PdfResourcesTest, LocalScopeShadowsThePage)
{
    auto font = std::make_shared<PdfDictionary>();
    font->entries["/F2"] = std::make_shared<PdfNumber>(42);
    auto local = std::make_shared<PdfDictionary>();
    local->entries["/Font"] = font;

    PdfResources pageScope(doc, page0);
    PdfResources formScope = pageScope.withLocal(local);
    EXPECT_EQ(formScope.depth(), pageScope.depth() + 1);

    PdfObjectPtr out;
    PdfError err;
    ASSERT_TRUE(formScope.resource(ResourceCategory::Font, "F2", out, err));
    EXPECT_EQ(NumberOr(out, 0), 42);

    // the enclosing chain still answers for other categories
    ASSERT_TRUE(formScope.resource(ResourceCategory::XObject, "Im1", out, err));
    EXPECT_EQ(Marker(out), 7);

    // a null local keeps the chain as it is
    EXPECT_EQ(pageScope.withLocal(nullptr).depth(), pageScope.depth());
}
