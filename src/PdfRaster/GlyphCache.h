#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "PdfFont.h"
#include "PdfError.h"

namespace pdfraster
{
    // ============================================
    // GLYPH CACHE - resolution-independent outlines
    //
    // Keyed by (font id, glyph id). Outlines are extracted without the
    // cache lock held, so two threads may extract the same glyph; the
    // first one stored wins and every caller gets that object.
    // ============================================

    struct GlyphCacheKey
    {
        uint64_t fontId;
        uint32_t glyphId;

        bool operator==(const GlyphCacheKey& other) const
        {
            return fontId == other.fontId && glyphId == other.glyphId;
        }
    };

    struct GlyphCacheKeyHash
    {
        size_t operator()(const GlyphCacheKey& k) const
        {
            return std::hash<uint64_t>()(k.fontId) ^
                (std::hash<uint32_t>()(k.glyphId) << 1);
        }
    };

    class GlyphCache
    {
    public:
        GlyphCache() = default;

        GlyphCache(const GlyphCache&) = delete;
        GlyphCache& operator=(const GlyphCache&) = delete;

        // Fails with UndefinedGlyph when the code maps to no glyph or the
        // font has no outlines for it
        bool glyphForCode(const PdfFont& font, const PdfCharCode& code, PdfGlyphPtr& out, PdfError& err);

        bool glyphForId(const PdfFont& font, uint32_t glyphId, PdfGlyphPtr& out, PdfError& err);

        // Hollow rectangle standing in for a missing glyph; width in
        // 1/1000 em
        PdfGlyphPtr boxGlyph(double width);

        void clear();

        size_t hitCount() const { return _hits; }
        size_t missCount() const { return _misses; }
        size_t cacheSize() const;

    private:
        std::unordered_map<GlyphCacheKey, PdfGlyphPtr, GlyphCacheKeyHash> _cache;
        std::unordered_map<int, PdfGlyphPtr> _boxes;
        mutable std::mutex _mutex;

        std::atomic<size_t> _hits{ 0 };
        std::atomic<size_t> _misses{ 0 };
    };
}
