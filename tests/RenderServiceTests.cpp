#include <gtest/gtest.h>

#include "PdfTestUtil.h"
#include "PageRenderService.h"

#include <atomic>
#include <new>
#include <string>
#include <thread>
#include <vector>

using namespace pdfraster;
using namespace pdfraster::test;

namespace
{
    RenderOptions CpuOptions(size_t capacity = 16)
    {
        RenderOptions options;
        options.backend = PdfBackend::Cpu;
        options.cacheCapacity = capacity;
        return options;
    }

    // Enough small fills to keep a render busy for a while
    std::string ManyRects(int count)
    {
        std::string content;
        for (int i = 0; i < count; ++i)
        {
            int x = (i * 7) % 180;
            int y = (i * 13) % 180;
            content += "0." + std::to_string(i % 10) + " 0 0 rg " +
                std::to_string(x) + " " + std::to_string(y) + " 15.5 15.5 re f\n";
        }
        return content;
    }

    // Runs out of memory on its first pipeline
    class FailingOnceService : public PageRenderService
    {
    public:
        explicit FailingOnceService(const RenderOptions& options)
            : PageRenderService(options)
        {
        }

    protected:
        void runPipeline(const PdfDocumentSessionPtr& session, int pageIndex, double scale,
            const std::atomic<bool>* cancel, RenderResult& result) override
        {
            if (!_failed.exchange(true))
                throw std::bad_alloc();
            PageRenderService::runPipeline(session, pageIndex, scale, cancel, result);
        }

    private:
        std::atomic<bool> _failed{ false };
    };

    std::vector<uint8_t> ThreePages()
    {
        TestPdfWriter writer;
        int catalog = writer.reserve();
        int pages = writer.reserve();
        std::string kids;
        for (int i = 0; i < 3; ++i)
        {
            int contents = writer.addStream("", "0 0 1 rg 0 0 " + std::to_string(10 * (i + 1)) + " 10 re f");
            int page = writer.add("<< /Type /Page /Parent " + std::to_string(pages) +
                " 0 R /MediaBox [0 0 100 100] /Contents " + std::to_string(contents) + " 0 R >>");
            kids += std::to_string(page) + " 0 R ";
        }
        writer.set(catalog, "<< /Type /Catalog /Pages " + std::to_string(pages) + " 0 R >>");
        writer.set(pages, "<< /Type /Pages /Kids [" + kids + "] /Count 3 >>");
        return writer.build(catalog);
    }
}

TEST(PageRenderServiceTest, OpenRejectsGarbage)
{
    PageRenderService service(CpuOptions());
    uint64_t id = 0;
    PdfError err;
    EXPECT_FALSE(service.openDocument(Bytes("not a pdf at all"), id, err));
    EXPECT_EQ(err.code, PdfErrorCode::MalformedDocument);
}

TEST(PageRenderServiceTest, RendersAndCaches)
{
    PageRenderService service(CpuOptions());
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf("1 0 0 rg 0 0 50 50 re f"), id, err)) << err.message;

    PdfRenderTargetPtr first;
    ASSERT_TRUE(service.render(id, 0, 1.0, first, err)) << err.message;
    EXPECT_EQ(first->width, 200);
    EXPECT_EQ(PixelAt(*first, 10, 190).r, 255);

    PdfRenderTargetPtr second;
    ASSERT_TRUE(service.render(id, 0, 1.0, second, err));
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(service.pipelineRuns(), 1u);
    EXPECT_EQ(service.cache().hitCount(), 1u);

    // another scale is another entry
    PdfRenderTargetPtr larger;
    ASSERT_TRUE(service.render(id, 0, 2.0, larger, err));
    EXPECT_EQ(larger->width, 400);
    EXPECT_EQ(service.pipelineRuns(), 2u);
    EXPECT_EQ(service.cache().cacheSize(), 2u);
}

TEST(PageRenderServiceTest, ConcurrentRequestsShareOneRun)
{
    PageRenderService service(CpuOptions());
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf(ManyRects(3000)), id, err)) << err.message;

    const int kThreads = 6;
    std::vector<PdfRenderTargetPtr> results(kThreads);
    std::vector<int> ok(kThreads, 0);
    std::atomic<bool> go{ false };

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back([&, i]() {
            while (!go.load())
                std::this_thread::yield();
            PdfError e;
            ok[i] = service.render(id, 0, 1.5, results[i], e) ? 1 : 0;
        });
    }
    go = true;
    for (auto& t : threads)
        t.join();

    for (int i = 0; i < kThreads; ++i)
    {
        ASSERT_EQ(ok[i], 1);
        EXPECT_EQ(results[i].get(), results[0].get());
    }
    EXPECT_EQ(service.pipelineRuns(), 1u);
}

TEST(PageRenderServiceTest, LeastRecentlyUsedPageIsEvicted)
{
    PageRenderService service(CpuOptions(2));
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(ThreePages(), id, err)) << err.message;

    PdfRenderTargetPtr target;
    ASSERT_TRUE(service.render(id, 0, 1.0, target, err));
    ASSERT_TRUE(service.render(id, 1, 1.0, target, err));
    // touch page 0 so page 1 is the oldest
    ASSERT_TRUE(service.render(id, 0, 1.0, target, err));
    ASSERT_TRUE(service.render(id, 2, 1.0, target, err));

    EXPECT_EQ(service.cache().cacheSize(), 2u);
    EXPECT_TRUE(service.cache().contains({ id, 0, PageCacheKey::QuantizeScale(1.0) }));
    EXPECT_FALSE(service.cache().contains({ id, 1, PageCacheKey::QuantizeScale(1.0) }));
    EXPECT_TRUE(service.cache().contains({ id, 2, PageCacheKey::QuantizeScale(1.0) }));
    EXPECT_EQ(service.pipelineRuns(), 3u);
}

TEST(PageRenderServiceTest, ZeroCapacityCachesNothing)
{
    PageRenderService service(CpuOptions(0));
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf("0 0 5 5 re f"), id, err));

    PdfRenderTargetPtr target;
    ASSERT_TRUE(service.render(id, 0, 1.0, target, err));
    ASSERT_TRUE(service.render(id, 0, 1.0, target, err));
    EXPECT_EQ(service.pipelineRuns(), 2u);
    EXPECT_EQ(service.cache().cacheSize(), 0u);
}

TEST(PageRenderServiceTest, FailuresAreNotCached)
{
    PageRenderService service(CpuOptions());
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf("0 0 5 5 re f"), id, err));

    PdfRenderTargetPtr target;
    EXPECT_FALSE(service.render(id, 4, 1.0, target, err));
    EXPECT_EQ(err.code, PdfErrorCode::RenderPageFault);
    EXPECT_NE(err.message.find("page 5 could not be rendered"), std::string::npos);

    err.clear();
    EXPECT_FALSE(service.render(id, 4, 1.0, target, err));
    EXPECT_EQ(service.pipelineRuns(), 2u);
    EXPECT_EQ(service.cache().cacheSize(), 0u);
}

TEST(PageRenderServiceTest, InvalidScaleIsABackendFault)
{
    PageRenderService service(CpuOptions());
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf(""), id, err));

    PdfRenderTargetPtr target;
    EXPECT_FALSE(service.render(id, 0, 0.0, target, err));
    EXPECT_EQ(err.code, PdfErrorCode::RenderBackendFault);
}

TEST(PageRenderServiceTest, ClosedDocumentCannotRender)
{
    PageRenderService service(CpuOptions());
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf("0 0 5 5 re f"), id, err));

    PdfRenderTargetPtr target;
    ASSERT_TRUE(service.render(id, 0, 1.0, target, err));
    service.closeDocument(id);
    EXPECT_EQ(service.cache().cacheSize(), 0u);

    // the caller's copy outlives the cache entry
    EXPECT_EQ(target->width, 200);

    EXPECT_FALSE(service.render(id, 0, 1.0, target, err));
    EXPECT_EQ(err.code, PdfErrorCode::RenderPageFault);

    // closing twice is harmless
    service.closeDocument(id);
}

TEST(PageRenderServiceTest, ReplaceDropsTheOldPixels)
{
    PageRenderService service(CpuOptions());
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf("1 0 0 rg 0 0 200 200 re f"), id, err));

    PdfRenderTargetPtr before;
    ASSERT_TRUE(service.render(id, 0, 1.0, before, err));
    EXPECT_EQ(PixelAt(*before, 100, 100).r, 255);

    ASSERT_TRUE(service.replaceDocument(id, SinglePagePdf("0 1 0 rg 0 0 200 200 re f"), err)) << err.message;

    PdfRenderTargetPtr after;
    ASSERT_TRUE(service.render(id, 0, 1.0, after, err));
    EXPECT_EQ(PixelAt(*after, 100, 100).r, 0);
    EXPECT_EQ(PixelAt(*after, 100, 100).g, 255);
    EXPECT_EQ(service.pipelineRuns(), 2u);
}

TEST(PageRenderServiceTest, FailedReplaceKeepsTheDocument)
{
    PageRenderService service(CpuOptions());
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf("0 0 5 5 re f"), id, err));

    EXPECT_FALSE(service.replaceDocument(id, Bytes("garbage"), err));
    EXPECT_EQ(err.code, PdfErrorCode::MalformedDocument);

    PdfRenderTargetPtr target;
    err.clear();
    EXPECT_TRUE(service.render(id, 0, 1.0, target, err)) << err.message;

    // an id that was never opened cannot be replaced
    EXPECT_FALSE(service.replaceDocument(id + 100, SinglePagePdf(""), err));
}

TEST(PageRenderServiceTest, CancelledRenderIsNotCached)
{
    PageRenderService service(CpuOptions());
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf(ManyRects(20000)), id, err)) << err.message;

    PdfRenderTargetPtr target;
    PdfError renderErr;
    bool ok = false;
    std::thread worker([&]() { ok = service.render(id, 0, 2.0, target, renderErr); });

    while (service.pipelineRuns() == 0)
        std::this_thread::yield();
    service.cancel(id, 0, 2.0);
    worker.join();

    const PageCacheKey key = { id, 0, PageCacheKey::QuantizeScale(2.0) };
    if (!ok)
    {
        EXPECT_EQ(renderErr.code, PdfErrorCode::Cancelled);
        EXPECT_FALSE(service.cache().contains(key));
        EXPECT_FALSE(target);
    }

    // a later request renders normally
    PdfRenderTargetPtr again;
    ASSERT_TRUE(service.render(id, 0, 2.0, again, err)) << err.message;
    EXPECT_EQ(again->width, 400);
    EXPECT_TRUE(service.cache().contains(key));
}

TEST(PageRenderServiceTest, CancelWithoutARenderIsHarmless)
{
    PageRenderService service(CpuOptions());
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf("0 0 5 5 re f"), id, err));

    service.cancel(id, 0, 1.0);
    service.cancelDocument(id);

    PdfRenderTargetPtr target;
    EXPECT_TRUE(service.render(id, 0, 1.0, target, err));
}

TEST(PageRenderServiceTest, DocumentsDoNotShareEntries)
{
    PageRenderService service(CpuOptions());
    uint64_t a = 0, b = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf("1 0 0 rg 0 0 200 200 re f"), a, err));
    ASSERT_TRUE(service.openDocument(SinglePagePdf("0 0 1 rg 0 0 200 200 re f"), b, err));
    EXPECT_NE(a, b);

    PdfRenderTargetPtr ta, tb;
    ASSERT_TRUE(service.render(a, 0, 1.0, ta, err));
    ASSERT_TRUE(service.render(b, 0, 1.0, tb, err));
    EXPECT_EQ(PixelAt(*ta, 5, 5).r, 255);
    EXPECT_EQ(PixelAt(*tb, 5, 5).b, 255);

    service.closeDocument(a);
    EXPECT_TRUE(service.cache().contains({ b, 0, PageCacheKey::QuantizeScale(1.0) }));
}

TEST(PageRenderServiceTest, OutOfMemoryFailsOnlyThatRequest)
{
    FailingOnceService service(CpuOptions());
    uint64_t id = 0;
    PdfError err;
    ASSERT_TRUE(service.openDocument(SinglePagePdf("1 0 0 rg 0 0 50 50 re f"), id, err)) << err.message;

    PdfRenderTargetPtr target;
    EXPECT_FALSE(service.render(id, 0, 1.0, target, err));
    EXPECT_EQ(err.code, PdfErrorCode::RenderBackendFault);
    EXPECT_FALSE(target);
    EXPECT_EQ(service.cache().cacheSize(), 0u);

    // the key is free again
    err.clear();
    ASSERT_TRUE(service.render(id, 0, 1.0, target, err)) << err.message;
    EXPECT_EQ(PixelAt(*target, 10, 190).r, 255);
    EXPECT_EQ(service.pipelineRuns(), 2u);
}
