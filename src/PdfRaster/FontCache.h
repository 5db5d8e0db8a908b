#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "PdfFont.h"
#include "PdfError.h"

namespace pdfraster
{
    class PdfDocument;

    // ============================================
    // FONT CACHE - one per document session
    //
    // Owns the FT_Library and every PdfFont loaded from the document,
    // keyed by the font dictionary object. Shared by reference across
    // concurrent page renders.
    // ============================================

    class FontCache
    {
    public:
        explicit FontCache(const std::string& fontDirectory = std::string());
        ~FontCache();

        FontCache(const FontCache&) = delete;
        FontCache& operator=(const FontCache&) = delete;

        // FT_Init_FreeType; fails with RenderGlyphFault. Called lazily by
        // loadFont, so an explicit call only front-loads the failure.
        bool initialize(PdfError& err);

        // Cached per dictionary object. A dictionary that is not a usable
        // font fails with UndefinedResource and is retried next time.
        bool loadFont(const PdfDocument& doc,
            const std::shared_ptr<PdfDictionary>& fontDict,
            PdfFontPtr& out,
            PdfError& err);

        const std::string& fontDirectory() const { return _fontDirectory; }

        void clear();

        size_t hitCount() const { return _hits; }
        size_t missCount() const { return _misses; }
        size_t cacheSize() const;

    private:
        struct Entry
        {
            std::shared_ptr<PdfDictionary> dict; // keeps the key address alive
            PdfFontPtr font;
        };

        std::string _fontDirectory;
        std::shared_ptr<FtLibrary> _library;
        bool _initFailed = false;

        std::unordered_map<const PdfDictionary*, Entry> _cache;
        mutable std::mutex _mutex;

        std::atomic<uint64_t> _nextId{ 1 };
        std::atomic<size_t> _hits{ 0 };
        std::atomic<size_t> _misses{ 0 };
    };
}
