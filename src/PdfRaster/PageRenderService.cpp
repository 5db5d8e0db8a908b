#include "PageRenderService.h"
#include "PdfContentParser.h"
#include "PdfPainter.h"
#include "PdfPainterGPU.h"
#include "PdfDebug.h"

#include <new>
#include <string>
#include <utility>

namespace pdfraster
{
    PageRenderService::PageRenderService(const RenderOptions& options)
        : _options(options)
        , _cache(options.cacheCapacity, options.cacheMemory)
    {
        LogDebug("[RenderService] backend=%s cache=%zu pages / %zu bytes",
            PdfBackendName(_options.backend), _options.cacheCapacity, _options.cacheMemory);
    }

    PageRenderService::~PageRenderService()
    {
        std::lock_guard<std::mutex> lock(_inflightMutex);
        for (auto& kv : _inflight)
            kv.second->cancel = true;
    }

    // =====================================================
    // Documents
    // =====================================================

    bool PageRenderService::loadSession(const std::vector<uint8_t>& bytes,
        PdfDocumentSessionPtr& out, PdfError& err) const
    {
        auto session = std::make_shared<PdfDocumentSession>(_options.fontDirectory);
        if (!session->doc.loadFromBytes(bytes, err))
        {
            LogDebug("[RenderService] open failed: %s %s", PdfErrorCodeName(err.code), err.message.c_str());
            return false;
        }
        out = std::move(session);
        return true;
    }

    bool PageRenderService::openDocument(const std::vector<uint8_t>& bytes, uint64_t& docId, PdfError& err)
    {
        PdfDocumentSessionPtr session;
        if (!loadSession(bytes, session, err))
            return false;

        std::lock_guard<std::mutex> lock(_sessionMutex);
        session->id = _nextId++;
        _sessions[session->id] = session;
        docId = session->id;

        LogDebug("[RenderService] opened document %llu, %d pages",
            static_cast<unsigned long long>(docId), session->doc.pageCount());
        return true;
    }

    bool PageRenderService::replaceDocument(uint64_t docId, const std::vector<uint8_t>& bytes, PdfError& err)
    {
        PdfDocumentSessionPtr session;
        if (!loadSession(bytes, session, err))
            return false;
        session->id = docId;

        {
            std::lock_guard<std::mutex> lock(_sessionMutex);
            if (_sessions.find(docId) == _sessions.end())
            {
                err.set(PdfErrorCode::RenderPageFault, "document " + std::to_string(docId) + " is not open");
                return false;
            }
            _sessions[docId] = session;
            _cache.clearDocument(docId);
        }

        cancelDocument(docId);
        LogDebug("[RenderService] replaced document %llu", static_cast<unsigned long long>(docId));
        return true;
    }

    void PageRenderService::closeDocument(uint64_t docId)
    {
        {
            std::lock_guard<std::mutex> lock(_sessionMutex);
            if (_sessions.erase(docId) == 0)
                return;
            _cache.clearDocument(docId);
        }

        cancelDocument(docId);
        LogDebug("[RenderService] closed document %llu", static_cast<unsigned long long>(docId));
    }

    bool PageRenderService::session(uint64_t docId, PdfDocumentSessionPtr& out, PdfError& err) const
    {
        std::lock_guard<std::mutex> lock(_sessionMutex);
        auto it = _sessions.find(docId);
        if (it == _sessions.end())
        {
            err.set(PdfErrorCode::RenderPageFault, "document " + std::to_string(docId) + " is not open");
            return false;
        }
        out = it->second;
        return true;
    }

    void PageRenderService::storeIfCurrent(const PdfDocumentSessionPtr& session,
        const PageCacheKey& key, const PdfRenderTargetPtr& target)
    {
        std::lock_guard<std::mutex> lock(_sessionMutex);
        auto it = _sessions.find(session->id);
        if (it != _sessions.end() && it->second == session)
            _cache.store(key, target);
    }

    // =====================================================
    // Cancellation
    // =====================================================

    // A cancelled run leaves the in-flight table at once, so the next
    // request for its key starts over instead of joining it.
    void PageRenderService::cancel(uint64_t docId, int pageIndex, double scale)
    {
        PageCacheKey key = { docId, pageIndex, PageCacheKey::QuantizeScale(scale) };

        std::lock_guard<std::mutex> lock(_inflightMutex);
        auto it = _inflight.find(key);
        if (it != _inflight.end())
        {
            it->second->cancel = true;
            _inflight.erase(it);
            LogDebug("[RenderService] cancel doc=%llu page=%d", static_cast<unsigned long long>(docId), pageIndex);
        }
    }

    void PageRenderService::cancelDocument(uint64_t docId)
    {
        std::lock_guard<std::mutex> lock(_inflightMutex);
        for (auto it = _inflight.begin(); it != _inflight.end(); )
        {
            if (it->first.docId == docId)
            {
                it->second->cancel = true;
                it = _inflight.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    // =====================================================
    // Render
    // =====================================================

    bool PageRenderService::render(uint64_t docId, int pageIndex, double scale,
        PdfRenderTargetPtr& out, PdfError& err)
    {
        PdfDocumentSessionPtr doc;
        if (!session(docId, doc, err))
            return false;

        PageCacheKey key = { docId, pageIndex, PageCacheKey::QuantizeScale(scale) };
        if (_cache.get(key, out))
            return true;

        InFlightPtr flight;
        std::promise<RenderResult> promise;
        bool owner = false;
        {
            std::lock_guard<std::mutex> lock(_inflightMutex);
            auto it = _inflight.find(key);
            if (it != _inflight.end())
            {
                flight = it->second;
            }
            else if (_cache.get(key, out))
            {
                // finished between the first lookup and this lock
                return true;
            }
            else
            {
                flight = std::make_shared<InFlight>();
                flight->result = promise.get_future().share();
                _inflight[key] = flight;
                owner = true;
            }
        }

        if (owner)
        {
            RenderResult result;
            ++_runs;
            try
            {
                runPipeline(doc, pageIndex, scale, &flight->cancel, result);

                if (result.error.ok() && flight->cancel.load())
                {
                    result.target.reset();
                    result.error.set(PdfErrorCode::Cancelled, "render cancelled");
                }

                if (result.error.ok())
                    storeIfCurrent(doc, key, result.target);
            }
            catch (const std::bad_alloc&)
            {
                result.target.reset();
                result.error.set(PdfErrorCode::RenderBackendFault, "out of memory");
                LogDebug("[RenderService] page %d: out of memory", pageIndex);
            }

            // failed or not, later requests must not join this run
            {
                std::lock_guard<std::mutex> lock(_inflightMutex);
                auto it = _inflight.find(key);
                if (it != _inflight.end() && it->second == flight)
                    _inflight.erase(it);
            }

            promise.set_value(std::move(result));
        }
        else
        {
            LogDebug("[RenderService] joined in-flight render doc=%llu page=%d",
                static_cast<unsigned long long>(docId), pageIndex);
        }

        const RenderResult& result = flight->result.get();
        if (!result.error.ok())
        {
            err = result.error;
            return false;
        }

        out = result.target;
        return true;
    }

    void PageRenderService::runPipeline(const PdfDocumentSessionPtr& session, int pageIndex, double scale,
        const std::atomic<bool>* cancel, RenderResult& result)
    {
        PdfError& err = result.error;

        PdfPage page;
        PdfError pageErr;
        if (!session->doc.page(pageIndex, page, pageErr))
        {
            err.set(PdfErrorCode::RenderPageFault,
                "page " + std::to_string(pageIndex + 1) + " could not be rendered: " + pageErr.message);
            return;
        }

        PdfViewport viewport;
        if (!PdfSceneRasterizer::ViewportFor(page.box(), page.rotate, scale, viewport, err,
            _options.maxViewportSide, _options.maxViewportPixels))
        {
            LogDebug("[RenderService] page %d: %s", pageIndex, err.message.c_str());
            return;
        }

        PdfScenePtr scene;
        if (!PdfContentParser::BuildPageScene(session->doc, pageIndex, session->fonts, session->glyphs,
            scene, err, cancel))
        {
            LogDebug("[RenderService] page %d: %s %s", pageIndex, PdfErrorCodeName(err.code), err.message.c_str());
            return;
        }

        auto target = std::make_shared<PdfRenderTarget>();
        if (!rasterize(*scene, viewport, cancel, *target, err))
        {
            LogDebug("[RenderService] page %d: %s %s", pageIndex, PdfErrorCodeName(err.code), err.message.c_str());
            return;
        }

        result.target = std::move(target);
    }

    bool PageRenderService::rasterizeWith(IPdfPainter& painter, const PdfScene& scene,
        const PdfViewport& viewport, const std::atomic<bool>* cancel,
        PdfRenderTarget& out, PdfError& err) const
    {
        return PdfSceneRasterizer::Rasterize(scene, viewport, _options.background, painter, out, err, cancel);
    }

    bool PageRenderService::rasterize(const PdfScene& scene, const PdfViewport& viewport,
        const std::atomic<bool>* cancel, PdfRenderTarget& out, PdfError& err) const
    {
        if (_options.backend != PdfBackend::Cpu)
        {
            PdfError gpuErr;
            PdfPainterGPU gpu;
            if (gpu.initialize(gpuErr) && rasterizeWith(gpu, scene, viewport, cancel, out, gpuErr))
                return true;

            if (_options.backend == PdfBackend::Gpu || gpuErr.code == PdfErrorCode::Cancelled)
            {
                err = gpuErr;
                return false;
            }

            LogDebug("[RenderService] GPU backend failed (%s), falling back to CPU", gpuErr.message.c_str());
        }

        PdfPainter cpu;
        return rasterizeWith(cpu, scene, viewport, cancel, out, err);
    }
}
