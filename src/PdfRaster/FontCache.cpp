#include "FontCache.h"
#include "PdfDocument.h"
#include "PdfDebug.h"

namespace pdfraster
{
    FontCache::FontCache(const std::string& fontDirectory)
        : _fontDirectory(fontDirectory)
    {
    }

    FontCache::~FontCache()
    {
        clear();
    }

    bool FontCache::initialize(PdfError& err)
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_library)
            return true;
        if (_initFailed)
        {
            err.set(PdfErrorCode::RenderGlyphFault, "font subsystem failed to initialize");
            return false;
        }

        auto library = std::make_shared<FtLibrary>();
        FT_Error ftErr = FT_Init_FreeType(&library->lib);
        if (ftErr != 0 || !library->lib)
        {
            library->lib = nullptr;
            _initFailed = true;
            LogDebug("FontCache: FT_Init_FreeType failed (%d)", ftErr);
            err.set(PdfErrorCode::RenderGlyphFault, "font subsystem failed to initialize");
            return false;
        }

        _library = std::move(library);
        return true;
    }

    bool FontCache::loadFont(const PdfDocument& doc,
        const std::shared_ptr<PdfDictionary>& fontDict,
        PdfFontPtr& out,
        PdfError& err)
    {
        if (!fontDict)
        {
            err.set(PdfErrorCode::UndefinedResource, "font resource is not a dictionary");
            return false;
        }

        if (!initialize(err))
            return false;

        std::shared_ptr<FtLibrary> library;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _cache.find(fontDict.get());
            if (it != _cache.end())
            {
                ++_hits;
                out = it->second.font;
                return true;
            }
            library = _library;
        }

        ++_misses;

        // Load outside the lock; a concurrent load of the same dictionary
        // is discarded in favour of the first one stored
        auto font = std::make_shared<PdfFont>(_nextId++, library);
        std::string why;
        if (!font->load(doc, fontDict, _fontDirectory, why))
        {
            LogDebug("FontCache: %s", why.c_str());
            err.set(PdfErrorCode::UndefinedResource, why);
            return false;
        }

        std::lock_guard<std::mutex> lock(_mutex);
        auto inserted = _cache.emplace(fontDict.get(), Entry{ fontDict, font });
        out = inserted.first->second.font;
        return true;
    }

    void FontCache::clear()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _cache.clear();
        _hits = 0;
        _misses = 0;
    }

    size_t FontCache::cacheSize() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _cache.size();
    }
}
