#pragma once
#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "PdfDocument.h"
#include "FontCache.h"
#include "GlyphCache.h"
#include "PdfRenderOptions.h"
#include "PdfSceneRasterizer.h"
#include "PageRenderCache.h"

namespace pdfraster
{
    class IPdfPainter;

    // A parsed document with the font and glyph caches its renders share
    struct PdfDocumentSession
    {
        explicit PdfDocumentSession(const std::string& fontDirectory)
            : fonts(fontDirectory)
        {
        }

        uint64_t id = 0;
        PdfDocument doc;
        FontCache fonts;
        GlyphCache glyphs;
    };

    using PdfDocumentSessionPtr = std::shared_ptr<PdfDocumentSession>;

    // =====================================================
    // PageRenderService - page N of document D at scale S
    //
    // Completed targets are cached. Requests for a key that is already
    // rendering wait for that run instead of starting another. Failed and
    // cancelled runs are never cached.
    // =====================================================
    class PageRenderService
    {
    public:
        explicit PageRenderService(const RenderOptions& options = RenderOptions());
        virtual ~PageRenderService();

        PageRenderService(const PageRenderService&) = delete;
        PageRenderService& operator=(const PageRenderService&) = delete;

        // Fails with MalformedDocument or CyclicPageTree
        bool openDocument(const std::vector<uint8_t>& bytes, uint64_t& docId, PdfError& err);

        // Parses bytes under an existing id; the old session's cache
        // entries go and its renders are cancelled. On failure the old
        // document stays open.
        bool replaceDocument(uint64_t docId, const std::vector<uint8_t>& bytes, PdfError& err);

        void closeDocument(uint64_t docId);

        // Fails with RenderPageFault when the id is not open
        bool session(uint64_t docId, PdfDocumentSessionPtr& out, PdfError& err) const;

        // Fails with RenderPageFault, RenderGlyphFault, RenderBackendFault
        // or Cancelled
        bool render(uint64_t docId, int pageIndex, double scale,
            PdfRenderTargetPtr& out, PdfError& err);

        void cancel(uint64_t docId, int pageIndex, double scale);
        void cancelDocument(uint64_t docId);

        const RenderOptions& options() const { return _options; }
        PageRenderCache& cache() { return _cache; }

        // Pipelines started, cache hits and joins excluded
        size_t pipelineRuns() const { return _runs.load(); }

    protected:
        struct RenderResult
        {
            PdfRenderTargetPtr target;
            PdfError error;
        };

        // Page to target for one key; leaves result.error set on failure
        virtual void runPipeline(const PdfDocumentSessionPtr& session, int pageIndex, double scale,
            const std::atomic<bool>* cancel, RenderResult& result);

    private:
        struct InFlight
        {
            std::atomic<bool> cancel{ false };
            std::shared_future<RenderResult> result;
        };

        using InFlightPtr = std::shared_ptr<InFlight>;

        RenderOptions _options;
        PageRenderCache _cache;

        mutable std::mutex _sessionMutex;
        std::map<uint64_t, PdfDocumentSessionPtr> _sessions;
        uint64_t _nextId = 1;

        std::mutex _inflightMutex;
        std::map<PageCacheKey, InFlightPtr> _inflight;

        std::atomic<size_t> _runs{ 0 };

        bool loadSession(const std::vector<uint8_t>& bytes, PdfDocumentSessionPtr& out, PdfError& err) const;

        bool rasterizeWith(IPdfPainter& painter, const PdfScene& scene, const PdfViewport& viewport,
            const std::atomic<bool>* cancel, PdfRenderTarget& out, PdfError& err) const;

        bool rasterize(const PdfScene& scene, const PdfViewport& viewport,
            const std::atomic<bool>* cancel, PdfRenderTarget& out, PdfError& err) const;

        // Caches only while session is still the one open under its id
        void storeIfCurrent(const PdfDocumentSessionPtr& session, const PageCacheKey& key,
            const PdfRenderTargetPtr& target);
    };
}
