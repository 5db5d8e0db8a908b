#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "PdfDocument.h"
#include "PdfRenderOptions.h"
#include "PageRenderService.h"

#if defined(_WIN32)
#ifdef PDFRASTER_EXPORTS
#define PDFRASTER_API extern "C" __declspec(dllexport)
#else
#define PDFRASTER_API extern "C" __declspec(dllimport)
#endif
#else
#define PDFRASTER_API extern "C" __attribute__((visibility("default")))
#endif

typedef void* PDFRASTER_ENGINE;
typedef uint64_t PDFRASTER_DOCUMENT;

namespace pdfraster
{
    using DocumentHandle = uint64_t;

    struct PageSize
    {
        double width = 0;   // points, /Rotate applied
        double height = 0;
    };

    class PdfEngine
    {
    public:
        explicit PdfEngine(const RenderOptions& options = RenderOptions::fromEnvironment())
            : _service(options)
        {
        }

        bool open(const std::vector<uint8_t>& bytes, DocumentHandle& out, PdfError& err)
        {
            return _service.openDocument(bytes, out, err);
        }

        bool pageCount(DocumentHandle doc, int& out, PdfError& err) const
        {
            PdfDocumentSessionPtr session;
            if (!_service.session(doc, session, err))
                return false;
            out = session->doc.pageCount();
            return true;
        }

        bool pageSize(DocumentHandle doc, int index, PageSize& out, PdfError& err) const
        {
            PdfDocumentSessionPtr session;
            if (!_service.session(doc, session, err))
                return false;
            return session->doc.pageSize(index, out.width, out.height, err);
        }

        bool documentInfo(DocumentHandle doc, PdfDocumentInfo& out, PdfError& err) const
        {
            PdfDocumentSessionPtr session;
            if (!_service.session(doc, session, err))
                return false;
            out = session->doc.info();
            return true;
        }

        bool renderPage(DocumentHandle doc, int pageIndex, double scale,
            PdfRenderTargetPtr& out, PdfError& err)
        {
            return _service.render(doc, pageIndex, scale, out, err);
        }

        void cancel(DocumentHandle doc, int pageIndex, double scale)
        {
            _service.cancel(doc, pageIndex, scale);
        }

        bool replace(DocumentHandle doc, const std::vector<uint8_t>& bytes, PdfError& err)
        {
            return _service.replaceDocument(doc, bytes, err);
        }

        void close(DocumentHandle doc)
        {
            _service.closeDocument(doc);
        }

        PageRenderService& service() { return _service; }

        // Text a viewer can show as is
        static std::string DisplayMessage(const PdfError& err, int pageIndex);

    private:
        PageRenderService _service;
    };
}

// =============================================
// C API
// Status returns are 0 on success and the negated PdfErrorCode on
// failure; PdfRaster_GetLastError has the message for this thread.
// =============================================

#define PDFRASTER_OK 0
#define PDFRASTER_INVALID_ARGUMENT (-100)

PDFRASTER_API int PdfRaster_GetVersion();

// Options from PDFRASTER_BACKEND, PDFRASTER_FONT_DIR and PDFRASTER_CACHE_PAGES
PDFRASTER_API PDFRASTER_ENGINE PdfRaster_CreateEngine();
PDFRASTER_API void PdfRaster_DestroyEngine(PDFRASTER_ENGINE engine);

// Document management
PDFRASTER_API int PdfRaster_OpenDocument(PDFRASTER_ENGINE engine,
    const uint8_t* data, size_t size, PDFRASTER_DOCUMENT* outDoc);
PDFRASTER_API int PdfRaster_OpenDocumentFile(PDFRASTER_ENGINE engine,
    const char* path, PDFRASTER_DOCUMENT* outDoc);
PDFRASTER_API void PdfRaster_CloseDocument(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc);

// Page info; page count is negative on failure
PDFRASTER_API int PdfRaster_GetPageCount(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc);
PDFRASTER_API int PdfRaster_GetPageSize(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc,
    int pageIndex, double* widthPt, double* heightPt);

// field is "Title", "Author" or "Subject". Returns the UTF-8 length
// without the terminator, or a negative status; call with outBuffer
// NULL to size the buffer.
PDFRASTER_API int PdfRaster_GetDocumentInfo(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc,
    const char* field, char* outBuffer, int outBufferSize);

// Non-premultiplied RGBA8, top row first. Returns the byte size of the
// page; when outBuffer is NULL or too small nothing is copied and only
// outW/outH are set. Negative status on failure.
PDFRASTER_API int PdfRaster_RenderPage(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc,
    int pageIndex, double scale,
    uint8_t* outBuffer, int outBufferSize,
    int* outW, int* outH);

PDFRASTER_API void PdfRaster_CancelRender(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc,
    int pageIndex, double scale);

PDFRASTER_API void PdfRaster_ClearCache(PDFRASTER_ENGINE engine);
PDFRASTER_API void PdfRaster_GetCacheStats(PDFRASTER_ENGINE engine,
    size_t* outHits, size_t* outMisses, size_t* outCacheSize, size_t* outMemoryBytes);

// Message of the last failed call on this thread; returns its length
PDFRASTER_API int PdfRaster_GetLastError(char* outBuffer, int outBufferSize);
