#include "PdfEngine.h"
#include "PdfDebug.h"

#include <cstring>
#include <fstream>
#include <iterator>
#include <new>
#include <string>
#include <vector>

using pdfraster::PdfEngine;
using pdfraster::PdfError;
using pdfraster::PdfErrorCode;

// =====================================================
// Display messages
// =====================================================

std::string PdfEngine::DisplayMessage(const PdfError& err, int pageIndex)
{
    const std::string page = "page " + std::to_string(pageIndex + 1);

    switch (err.code)
    {
    case PdfErrorCode::None:
        return std::string();
    case PdfErrorCode::RenderPageFault:
    case PdfErrorCode::PageIndexOutOfRange:
        return page + " could not be rendered";
    case PdfErrorCode::RenderGlyphFault:
        return page + " could not be rendered: fonts are unavailable";
    case PdfErrorCode::RenderBackendFault:
        return page + " could not be rendered: " + err.message;
    case PdfErrorCode::Cancelled:
        return "rendering of " + page + " was cancelled";
    case PdfErrorCode::MalformedDocument:
        return "the file is not a readable PDF document";
    case PdfErrorCode::CyclicPageTree:
        return "the document's page tree is damaged";
    default:
        return err.message;
    }
}

// =====================================================
// Per-thread last error
// =====================================================

static thread_local std::string g_lastError;

static int Fail(const PdfError& err, int pageIndex = -1)
{
    g_lastError = pageIndex >= 0 ? PdfEngine::DisplayMessage(err, pageIndex) : err.message;
    if (g_lastError.empty())
        g_lastError = PdfErrorCodeName(err.code);
    LogDebug("[PdfCore] %s: %s", PdfErrorCodeName(err.code), err.message.c_str());
    return -static_cast<int>(err.code);
}

static int FailArgument(const char* what)
{
    g_lastError = std::string("invalid argument: ") + what;
    return PDFRASTER_INVALID_ARGUMENT;
}

static PdfEngine* AsEngine(PDFRASTER_ENGINE ptr)
{
    return reinterpret_cast<PdfEngine*>(ptr);
}

static int CopyString(const std::string& s, char* out, int cap)
{
    int len = static_cast<int>(s.size());
    if (!out || cap <= 0)
        return len;

    int n = len < cap - 1 ? len : cap - 1;
    std::memcpy(out, s.data(), static_cast<size_t>(n));
    out[n] = '\0';
    return len;
}

// =====================================================
// File I/O Helper
// =====================================================

static bool ReadAllBytes(const char* path, std::vector<uint8_t>& out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    out.assign(std::istreambuf_iterator<char>(ifs),
        std::istreambuf_iterator<char>());
    return !out.empty();
}

// =====================================================
// Engine Lifecycle
// =====================================================

PDFRASTER_API int PdfRaster_GetVersion()
{
    return 1;
}

PDFRASTER_API PDFRASTER_ENGINE PdfRaster_CreateEngine()
{
    try
    {
        return new PdfEngine();
    }
    catch (const std::bad_alloc&)
    {
        g_lastError = "out of memory";
        return nullptr;
    }
}

PDFRASTER_API void PdfRaster_DestroyEngine(PDFRASTER_ENGINE engine)
{
    delete AsEngine(engine);
}

// =====================================================
// Document Lifecycle
// =====================================================

PDFRASTER_API int PdfRaster_OpenDocument(PDFRASTER_ENGINE engine,
    const uint8_t* data, size_t size, PDFRASTER_DOCUMENT* outDoc)
{
    if (!engine || !outDoc)
        return FailArgument("engine and outDoc are required");
    if (!data || size == 0)
        return FailArgument("empty document");

    PdfError err;
    try
    {
        std::vector<uint8_t> bytes(data, data + size);
        if (!AsEngine(engine)->open(bytes, *outDoc, err))
            return Fail(err, -1);
    }
    catch (const std::bad_alloc&)
    {
        err.set(PdfErrorCode::MalformedDocument, "out of memory while reading the document");
        return Fail(err, -1);
    }
    return PDFRASTER_OK;
}

PDFRASTER_API int PdfRaster_OpenDocumentFile(PDFRASTER_ENGINE engine,
    const char* path, PDFRASTER_DOCUMENT* outDoc)
{
    if (!engine || !outDoc || !path)
        return FailArgument("engine, path and outDoc are required");

    std::vector<uint8_t> bytes;
    if (!ReadAllBytes(path, bytes))
    {
        g_lastError = std::string("cannot read ") + path;
        return -static_cast<int>(PdfErrorCode::MalformedDocument);
    }

    PdfError err;
    try
    {
        if (!AsEngine(engine)->open(bytes, *outDoc, err))
            return Fail(err, -1);
    }
    catch (const std::bad_alloc&)
    {
        err.set(PdfErrorCode::MalformedDocument, "out of memory while reading the document");
        return Fail(err, -1);
    }
    return PDFRASTER_OK;
}

PDFRASTER_API void PdfRaster_CloseDocument(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc)
{
    if (!engine) return;
    AsEngine(engine)->close(doc);
}

// =====================================================
// Page Info
// =====================================================

PDFRASTER_API int PdfRaster_GetPageCount(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc)
{
    if (!engine)
        return FailArgument("engine is required");

    int count = 0;
    PdfError err;
    if (!AsEngine(engine)->pageCount(doc, count, err))
        return Fail(err);
    return count;
}

PDFRASTER_API int PdfRaster_GetPageSize(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc,
    int pageIndex, double* widthPt, double* heightPt)
{
    if (!engine || !widthPt || !heightPt)
        return FailArgument("engine, widthPt and heightPt are required");

    pdfraster::PageSize size;
    PdfError err;
    if (!AsEngine(engine)->pageSize(doc, pageIndex, size, err))
        return Fail(err);

    *widthPt = size.width;
    *heightPt = size.height;
    return PDFRASTER_OK;
}

PDFRASTER_API int PdfRaster_GetDocumentInfo(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc,
    const char* field, char* outBuffer, int outBufferSize)
{
    if (!engine || !field)
        return FailArgument("engine and field are required");

    pdfraster::PdfDocumentInfo info;
    PdfError err;
    if (!AsEngine(engine)->documentInfo(doc, info, err))
        return Fail(err);

    if (std::strcmp(field, "Title") == 0)
        return CopyString(info.title, outBuffer, outBufferSize);
    if (std::strcmp(field, "Author") == 0)
        return CopyString(info.author, outBuffer, outBufferSize);
    if (std::strcmp(field, "Subject") == 0)
        return CopyString(info.subject, outBuffer, outBufferSize);
    return FailArgument("field must be Title, Author or Subject");
}

// =====================================================
// Page Rendering
// =====================================================

PDFRASTER_API int PdfRaster_RenderPage(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc,
    int pageIndex, double scale,
    uint8_t* outBuffer, int outBufferSize,
    int* outW, int* outH)
{
    if (!engine || !outW || !outH)
        return FailArgument("engine, outW and outH are required");

    pdfraster::PdfRenderTargetPtr target;
    PdfError err;
    try
    {
        if (!AsEngine(engine)->renderPage(doc, pageIndex, scale, target, err))
            return Fail(err, pageIndex);
    }
    catch (const std::bad_alloc&)
    {
        err.set(PdfErrorCode::RenderBackendFault, "out of memory");
        return Fail(err, pageIndex);
    }

    *outW = target->width;
    *outH = target->height;

    const int required = static_cast<int>(target->rgba.size());
    if (!outBuffer || outBufferSize < required)
        return required;

    std::memcpy(outBuffer, target->rgba.data(), static_cast<size_t>(required));
    return required;
}

PDFRASTER_API void PdfRaster_CancelRender(PDFRASTER_ENGINE engine, PDFRASTER_DOCUMENT doc,
    int pageIndex, double scale)
{
    if (!engine) return;
    AsEngine(engine)->cancel(doc, pageIndex, scale);
}

// =====================================================
// Cache
// =====================================================

PDFRASTER_API void PdfRaster_ClearCache(PDFRASTER_ENGINE engine)
{
    if (!engine) return;
    AsEngine(engine)->service().cache().clear();
}

PDFRASTER_API void PdfRaster_GetCacheStats(PDFRASTER_ENGINE engine,
    size_t* outHits, size_t* outMisses, size_t* outCacheSize, size_t* outMemoryBytes)
{
    if (!engine) return;
    auto& cache = AsEngine(engine)->service().cache();
    if (outHits) *outHits = cache.hitCount();
    if (outMisses) *outMisses = cache.missCount();
    if (outCacheSize) *outCacheSize = cache.cacheSize();
    if (outMemoryBytes) *outMemoryBytes = cache.memoryUsage();
}

PDFRASTER_API int PdfRaster_GetLastError(char* outBuffer, int outBufferSize)
{
    return CopyString(g_lastError, outBuffer, outBufferSize);
}
