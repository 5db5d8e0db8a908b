#include "GlyphCache.h"
#include "PdfDebug.h"

#include <cmath>

namespace pdfraster
{
    bool GlyphCache::glyphForCode(const PdfFont& font, const PdfCharCode& code, PdfGlyphPtr& out, PdfError& err)
    {
        uint32_t gid = 0;
        if (!font.glyphIndex(code, gid))
        {
            err.set(PdfErrorCode::UndefinedGlyph,
                "no glyph for code " + std::to_string(code.code) + " in " + font.baseFont());
            return false;
        }
        return glyphForId(font, gid, out, err);
    }

    bool GlyphCache::glyphForId(const PdfFont& font, uint32_t glyphId, PdfGlyphPtr& out, PdfError& err)
    {
        GlyphCacheKey key{ font.id(), glyphId };

        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _cache.find(key);
            if (it != _cache.end())
            {
                ++_hits;
                out = it->second;
                return true;
            }
        }

        ++_misses;

        // Extract under the font's own face lock only
        auto glyph = std::make_shared<PdfGlyph>();
        if (!font.outline(glyphId, *glyph))
        {
            err.set(PdfErrorCode::UndefinedGlyph,
                "glyph " + std::to_string(glyphId) + " of " + font.baseFont() + " has no outline");
            return false;
        }

        std::lock_guard<std::mutex> lock(_mutex);
        auto inserted = _cache.emplace(key, std::move(glyph));
        out = inserted.first->second;
        return true;
    }

    PdfGlyphPtr GlyphCache::boxGlyph(double width)
    {
        int w = static_cast<int>(std::lround(width));
        if (w <= 0)
            w = 500;

        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _boxes.find(w);
        if (it != _boxes.end())
            return it->second;

        double em = w / 1000.0;
        double x0 = em * 0.1;
        double x1 = em * 0.9;
        double y0 = 0.0;
        double y1 = 0.7;
        double t = 0.04;

        // outer counter-clockwise, inner clockwise: a frame under nonzero
        auto glyph = std::make_shared<PdfGlyph>();
        PdfPath& p = glyph->outline;
        p.emplace_back(PdfPathSegment::MoveTo, x0, y0);
        p.emplace_back(PdfPathSegment::LineTo, x1, y0);
        p.emplace_back(PdfPathSegment::LineTo, x1, y1);
        p.emplace_back(PdfPathSegment::LineTo, x0, y1);
        p.emplace_back();
        if (x1 - x0 > 2 * t)
        {
            p.emplace_back(PdfPathSegment::MoveTo, x0 + t, y0 + t);
            p.emplace_back(PdfPathSegment::LineTo, x0 + t, y1 - t);
            p.emplace_back(PdfPathSegment::LineTo, x1 - t, y1 - t);
            p.emplace_back(PdfPathSegment::LineTo, x1 - t, y0 + t);
            p.emplace_back();
        }
        glyph->advance = w;

        _boxes.emplace(w, glyph);
        return glyph;
    }

    void GlyphCache::clear()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _cache.clear();
        _boxes.clear();
        _hits = 0;
        _misses = 0;
    }

    size_t GlyphCache::cacheSize() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _cache.size();
    }
}
