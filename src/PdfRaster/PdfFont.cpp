#include "PdfFont.h"
#include "PdfDocument.h"
#include "PdfDebug.h"

#include FT_OUTLINE_H
#include FT_CID_H

#include <algorithm>
#include <fstream>
#include <iterator>

namespace pdfraster
{
    namespace
    {
        // FontDescriptor /Flags
        const int FLAG_FIXED_PITCH = 1 << 0;
        const int FLAG_SERIF = 1 << 1;
        const int FLAG_SYMBOLIC = 1 << 2;
        const int FLAG_NONSYMBOLIC = 1 << 5;

        struct OutlineSink
        {
            PdfPath* path;
            double scale;
            double lastX = 0;
            double lastY = 0;
            bool open = false;
        };

        int sinkMoveTo(const FT_Vector* to, void* user)
        {
            auto* s = static_cast<OutlineSink*>(user);
            if (s->open)
                s->path->emplace_back();
            s->lastX = to->x * s->scale;
            s->lastY = to->y * s->scale;
            s->path->emplace_back(PdfPathSegment::MoveTo, s->lastX, s->lastY);
            s->open = true;
            return 0;
        }

        int sinkLineTo(const FT_Vector* to, void* user)
        {
            auto* s = static_cast<OutlineSink*>(user);
            s->lastX = to->x * s->scale;
            s->lastY = to->y * s->scale;
            s->path->emplace_back(PdfPathSegment::LineTo, s->lastX, s->lastY);
            return 0;
        }

        // quadratic to cubic: control points at 2/3 towards the conic point
        int sinkConicTo(const FT_Vector* control, const FT_Vector* to, void* user)
        {
            auto* s = static_cast<OutlineSink*>(user);
            double qx = control->x * s->scale;
            double qy = control->y * s->scale;
            double ex = to->x * s->scale;
            double ey = to->y * s->scale;
            double c1x = s->lastX + 2.0 / 3.0 * (qx - s->lastX);
            double c1y = s->lastY + 2.0 / 3.0 * (qy - s->lastY);
            double c2x = ex + 2.0 / 3.0 * (qx - ex);
            double c2y = ey + 2.0 / 3.0 * (qy - ey);
            s->path->emplace_back(c1x, c1y, c2x, c2y, ex, ey);
            s->lastX = ex;
            s->lastY = ey;
            return 0;
        }

        int sinkCubicTo(const FT_Vector* c1, const FT_Vector* c2, const FT_Vector* to, void* user)
        {
            auto* s = static_cast<OutlineSink*>(user);
            s->lastX = to->x * s->scale;
            s->lastY = to->y * s->scale;
            s->path->emplace_back(c1->x * s->scale, c1->y * s->scale,
                c2->x * s->scale, c2->y * s->scale,
                s->lastX, s->lastY);
            return 0;
        }

        bool readFile(const std::string& path, std::vector<uint8_t>& out)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file)
                return false;
            out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
            return !out.empty();
        }
    }

    PdfFont::PdfFont(uint64_t id, std::shared_ptr<FtLibrary> library)
        : _id(id), _library(std::move(library))
    {
        for (int i = 0; i < 256; ++i)
        {
            _widths[i] = 0.0;
            _hasWidth[i] = false;
            _gids[i] = -1;
        }
        _fontMatrix = PdfMatrix(0.001, 0, 0, 0.001, 0, 0);
    }

    PdfFont::~PdfFont()
    {
        if (_face && _library)
        {
            std::lock_guard<std::mutex> lock(_library->mutex);
            FT_Done_Face(_face);
            _face = nullptr;
        }
    }

    bool PdfFont::load(const PdfDocument& doc,
        const std::shared_ptr<PdfDictionary>& fontDict,
        const std::string& fontDirectory,
        std::string& why)
    {
        if (!fontDict)
        {
            why = "font resource is not a dictionary";
            return false;
        }

        _subtype = doc.getName(fontDict, "/Subtype");
        _baseFont = doc.getName(fontDict, "/BaseFont");

        bool ok;
        if (_subtype == "/Type0")
            ok = loadComposite(doc, fontDict, fontDirectory, why);
        else if (_subtype == "/Type3")
            ok = loadType3(doc, fontDict, why);
        else
            ok = loadSimple(doc, fontDict, fontDirectory, why);

        LogDebug("PdfFont: #%llu %s %s %s%s", static_cast<unsigned long long>(_id),
            _subtype.c_str(), _baseFont.c_str(),
            _face ? "with outlines" : "without outlines",
            _substitute ? " (substitute)" : "");
        return ok;
    }

    // ============================================
    // Simple fonts
    // ============================================

    bool PdfFont::loadSimple(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict,
        const std::string& fontDirectory, std::string& why)
    {
        (void)why;
        _kind = PdfFontKind::Simple;
        _family = StandardFamilyOf(_baseFont);

        auto descriptor = doc.getDict(dict, "/FontDescriptor");
        _flags = static_cast<int>(doc.getNumberOr(descriptor, "/Flags", 0));

        bool embedded = loadEmbeddedProgram(doc, descriptor);
        if (!embedded)
        {
            _substitute = true;
            loadSubstituteProgram(fontDirectory);
        }

        loadEncoding(doc, dict, embedded);
        buildSimpleGlyphMap(embedded);
        loadSimpleWidths(doc, dict, descriptor);
        return true;
    }

    void PdfFont::loadEncoding(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict, bool embedded)
    {
        bool symbolic = (_flags & FLAG_SYMBOLIC) && !(_flags & FLAG_NONSYMBOLIC);
        if (_family == StandardFamily::Symbol || _family == StandardFamily::ZapfDingbats)
            symbolic = true;

        PdfBaseEncoding base = (embedded || symbolic) ? PdfBaseEncoding::Builtin : PdfBaseEncoding::Standard;

        auto encObj = doc.get(dict, "/Encoding");
        std::shared_ptr<PdfArray> differences;
        if (!IsNull(encObj))
        {
            std::string name = NameOf(encObj);
            if (!name.empty())
            {
                BaseEncodingFromName(name, base);
            }
            else if (auto encDict = AsDict(encObj))
            {
                std::string baseName = doc.getName(encDict, "/BaseEncoding");
                if (!BaseEncodingFromName(baseName, base) && !embedded && !symbolic)
                    base = PdfBaseEncoding::Standard;
                differences = doc.getArray(encDict, "/Differences");
            }
        }

        // a TrueType font without a usable base still needs names for its
        // Unicode cmap
        if (base == PdfBaseEncoding::Builtin && _subtype == "/TrueType" && !symbolic)
            base = PdfBaseEncoding::Standard;

        for (int code = 0; code < 256; ++code)
        {
            const char* n = EncodingGlyphName(base, static_cast<uint8_t>(code));
            _glyphNames[code] = n ? n : "";
        }

        if (differences)
        {
            int code = 0;
            for (const auto& item : differences->items)
            {
                auto v = doc.resolveIndirect(item);
                double num;
                if (AsNumber(v, num))
                {
                    code = static_cast<int>(num);
                    continue;
                }
                std::string glyph = NameOf(v);
                if (!glyph.empty() && code >= 0 && code < 256)
                    _glyphNames[code] = glyph.substr(1);
                ++code;
            }
        }
    }

    void PdfFont::buildSimpleGlyphMap(bool embedded)
    {
        if (!_face)
            return;

        std::lock_guard<std::mutex> lock(_faceMutex);

        FT_CharMap unicodeMap = nullptr;
        FT_CharMap symbolMap = nullptr;  // (3,0)
        FT_CharMap macMap = nullptr;     // (1,0)
        FT_CharMap builtinMap = nullptr; // Type1 built-in encoding
        for (int i = 0; i < _face->num_charmaps; ++i)
        {
            FT_CharMap cm = _face->charmaps[i];
            if (cm->encoding == FT_ENCODING_UNICODE && !unicodeMap)
                unicodeMap = cm;
            else if (cm->platform_id == 3 && cm->encoding_id == 0)
                symbolMap = cm;
            else if (cm->platform_id == 1 && cm->encoding_id == 0)
                macMap = cm;
            else if ((cm->encoding == FT_ENCODING_ADOBE_CUSTOM || cm->encoding == FT_ENCODING_ADOBE_STANDARD ||
                cm->encoding == FT_ENCODING_ADOBE_EXPERT) && !builtinMap)
                builtinMap = cm;
        }

        auto viaMap = [&](FT_CharMap cm, FT_ULong charcode) -> FT_UInt {
            if (!cm || FT_Set_Charmap(_face, cm) != 0)
                return 0;
            return FT_Get_Char_Index(_face, charcode);
        };

        for (int code = 0; code < 256; ++code)
        {
            const std::string& name = _glyphNames[code];
            FT_UInt gid = 0;

            if (!name.empty() && FT_HAS_GLYPH_NAMES(_face))
                gid = FT_Get_Name_Index(_face, const_cast<FT_String*>(name.c_str()));

            if (!gid && !name.empty())
            {
                uint32_t uni = GlyphNameToUnicode(name);
                if (uni)
                    gid = viaMap(unicodeMap, uni);
            }

            if (!gid && name.empty())
                gid = viaMap(builtinMap, static_cast<FT_ULong>(code));

            if (!gid && symbolMap)
            {
                gid = viaMap(symbolMap, 0xF000 + code);
                if (!gid)
                    gid = viaMap(symbolMap, static_cast<FT_ULong>(code));
            }

            if (!gid && macMap)
                gid = viaMap(macMap, static_cast<FT_ULong>(code));

            if (!gid && embedded && code < _face->num_glyphs && !unicodeMap && !symbolMap)
                gid = static_cast<FT_UInt>(code);

            _gids[code] = gid ? static_cast<int32_t>(gid) : -1;
        }
    }

    void PdfFont::loadSimpleWidths(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict,
        const std::shared_ptr<PdfDictionary>& descriptor)
    {
        int firstChar = static_cast<int>(doc.getNumberOr(dict, "/FirstChar", 0));
        auto widths = doc.numbers(doc.getArray(dict, "/Widths"));
        double missing = 0;
        bool hasMissing = doc.getNumber(descriptor, "/MissingWidth", missing);
        bool standardMetrics = _substitute && _family != StandardFamily::None;

        for (int code = 0; code < 256; ++code)
        {
            int idx = code - firstChar;
            if (idx >= 0 && idx < static_cast<int>(widths.size()))
            {
                _widths[code] = widths[idx];
                _hasWidth[code] = true;
                continue;
            }
            if (hasMissing)
            {
                _widths[code] = missing;
                continue;
            }

            double w;
            if (standardMetrics && !_glyphNames[code].empty() &&
                StandardGlyphWidth(_family, _glyphNames[code], w))
            {
                _widths[code] = w;
                continue;
            }
            if (_gids[code] > 0)
                _widths[code] = programAdvance(static_cast<uint32_t>(_gids[code]));
        }
    }

    // ============================================
    // Composite fonts
    // ============================================

    bool PdfFont::loadComposite(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict,
        const std::string& fontDirectory, std::string& why)
    {
        (void)fontDirectory;
        _kind = PdfFontKind::Composite;

        std::string cmapWhy;
        _cmap = PdfCMap::Parse(doc, doc.get(dict, "/Encoding"), cmapWhy);
        if (!_cmap)
        {
            LogDebug("PdfFont: %s, using Identity-H", cmapWhy.c_str());
            _cmap = PdfCMap::Identity(false);
        }

        auto descendants = doc.getArray(dict, "/DescendantFonts");
        std::shared_ptr<PdfDictionary> cidFont;
        if (descendants && !descendants->items.empty())
            cidFont = AsDict(doc.resolveIndirect(descendants->items[0]));
        if (!cidFont)
        {
            why = "Type0 font without a descendant CIDFont";
            return false;
        }

        std::string cidSubtype = doc.getName(cidFont, "/Subtype");
        auto descriptor = doc.getDict(cidFont, "/FontDescriptor");
        _flags = static_cast<int>(doc.getNumberOr(descriptor, "/Flags", 0));

        loadCidWidths(doc, cidFont);

        auto mapObj = doc.get(cidFont, "/CIDToGIDMap");
        if (auto mapStream = AsStream(mapObj))
        {
            std::vector<uint8_t> bytes;
            if (doc.decodeStream(mapStream, bytes))
            {
                _cidToGidIdentity = false;
                _cidToGid.resize(bytes.size() / 2);
                for (size_t i = 0; i < _cidToGid.size(); ++i)
                    _cidToGid[i] = static_cast<uint16_t>((bytes[2 * i] << 8) | bytes[2 * i + 1]);
            }
        }

        if (!loadEmbeddedProgram(doc, descriptor))
        {
            // no outlines: CIDs render as boxes with their PDF widths
            _substitute = true;
            return true;
        }

        if (cidSubtype == "/CIDFontType0" && _face)
        {
            std::lock_guard<std::mutex> lock(_faceMutex);
            FT_Bool cidKeyed = 0;
            if (FT_Get_CID_Is_Internally_CID_Keyed(_face, &cidKeyed) == 0 && cidKeyed)
            {
                for (FT_Long gid = 0; gid < _face->num_glyphs; ++gid)
                {
                    FT_UInt cid = 0;
                    if (FT_Get_CID_From_Glyph_Index(_face, static_cast<FT_UInt>(gid), &cid) == 0)
                        _cffCidToGid.emplace(cid, static_cast<uint32_t>(gid));
                }
            }
        }
        return true;
    }

    void PdfFont::loadCidWidths(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& cidFont)
    {
        _defaultWidth = doc.getNumberOr(cidFont, "/DW", 1000.0);

        auto w = doc.getArray(cidFont, "/W");
        if (!w)
            return;

        // c [w1 w2 ...]  or  c_first c_last w
        size_t i = 0;
        while (i < w->items.size())
        {
            double first;
            if (!AsNumber(doc.resolveIndirect(w->items[i]), first))
                break;
            if (i + 1 >= w->items.size())
                break;

            auto next = doc.resolveIndirect(w->items[i + 1]);
            if (auto list = AsArray(next))
            {
                uint32_t cid = static_cast<uint32_t>(first);
                for (const auto& item : list->items)
                    _cidWidths[cid++] = NumberOr(doc.resolveIndirect(item), _defaultWidth);
                i += 2;
                continue;
            }

            double last;
            if (!AsNumber(next, last) || i + 2 >= w->items.size())
                break;
            double width = NumberOr(doc.resolveIndirect(w->items[i + 2]), _defaultWidth);
            // guard against absurd ranges
            if (last - first > 65535)
                last = first + 65535;
            for (uint32_t cid = static_cast<uint32_t>(first); cid <= static_cast<uint32_t>(last); ++cid)
                _cidWidths[cid] = width;
            i += 3;
        }
    }

    // ============================================
    // Type3
    // ============================================

    bool PdfFont::loadType3(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict, std::string& why)
    {
        _kind = PdfFontKind::Type3;

        auto m = doc.numbers(doc.getArray(dict, "/FontMatrix"));
        if (m.size() >= 6)
            _fontMatrix = PdfMatrix(m[0], m[1], m[2], m[3], m[4], m[5]);

        int firstChar = static_cast<int>(doc.getNumberOr(dict, "/FirstChar", 0));
        auto widths = doc.numbers(doc.getArray(dict, "/Widths"));
        if (widths.empty())
        {
            why = "Type3 font without /Widths";
            return false;
        }

        // glyph space widths to 1/1000 text space
        for (size_t i = 0; i < widths.size(); ++i)
        {
            int code = firstChar + static_cast<int>(i);
            if (code >= 0 && code < 256)
            {
                _widths[code] = widths[i] * _fontMatrix.a * 1000.0;
                _hasWidth[code] = true;
            }
        }
        return true;
    }

    // ============================================
    // Font programs
    // ============================================

    bool PdfFont::loadEmbeddedProgram(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& descriptor)
    {
        if (!descriptor)
            return false;

        static const char* keys[] = { "/FontFile2", "/FontFile3", "/FontFile" };
        for (const char* key : keys)
        {
            auto stream = doc.getStream(descriptor, key);
            if (!stream)
                continue;
            if (!doc.decodeStream(stream, _program) || _program.empty())
            {
                LogDebug("PdfFont: %s %s failed to decode", _baseFont.c_str(), key);
                continue;
            }
            if (openFace())
                return true;
        }
        _program.clear();
        return false;
    }

    bool PdfFont::loadSubstituteProgram(const std::string& fontDirectory)
    {
        bool serif = (_flags & FLAG_SERIF) != 0;
        bool fixed = (_flags & FLAG_FIXED_PITCH) != 0;

        for (const auto& path : SubstituteFontCandidates(_baseFont, fontDirectory, serif, fixed))
        {
            if (!readFile(path, _program))
                continue;
            if (openFace())
            {
                LogDebug("PdfFont: %s substituted by %s", _baseFont.c_str(), path.c_str());
                return true;
            }
        }
        _program.clear();
        LogDebug("PdfFont: no substitute for %s, glyphs render as boxes", _baseFont.c_str());
        return false;
    }

    bool PdfFont::openFace()
    {
        if (!_library || !_library->lib || _program.empty())
            return false;

        std::lock_guard<std::mutex> lock(_library->mutex);
        FT_Face face = nullptr;
        FT_Error err = FT_New_Memory_Face(_library->lib, _program.data(),
            static_cast<FT_Long>(_program.size()), 0, &face);
        if (err != 0 || !face)
        {
            LogDebug("PdfFont: FT_New_Memory_Face failed (%d) for %s", err, _baseFont.c_str());
            return false;
        }
        if (_face)
            FT_Done_Face(_face);
        _face = face;
        _unitsPerEm = face->units_per_EM ? face->units_per_EM : 1000.0;
        return true;
    }

    double PdfFont::programAdvance(uint32_t gid) const
    {
        if (!_face)
            return 0.0;
        std::lock_guard<std::mutex> lock(_faceMutex);
        if (FT_Load_Glyph(_face, gid, FT_LOAD_NO_SCALE | FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP) != 0)
            return 0.0;
        return _face->glyph->metrics.horiAdvance * 1000.0 / _unitsPerEm;
    }

    // ============================================
    // Queries
    // ============================================

    void PdfFont::decode(const std::string& s, std::vector<PdfCharCode>& out) const
    {
        out.clear();
        if (_kind != PdfFontKind::Composite)
        {
            out.reserve(s.size());
            for (unsigned char c : s)
                out.push_back({ c, 1 });
            return;
        }

        size_t pos = 0;
        while (pos < s.size())
        {
            PdfCharCode c;
            c.bytes = _cmap->readCode(s, pos, c.code);
            if (c.bytes == 0)
                break;
            out.push_back(c);
            pos += c.bytes;
        }
    }

    double PdfFont::width(const PdfCharCode& c) const
    {
        if (_kind != PdfFontKind::Composite)
            return _widths[c.code & 0xFF];

        uint32_t cid;
        if (!_cmap->lookup(c.code, c.bytes, cid))
            return _defaultWidth;
        auto it = _cidWidths.find(cid);
        return it != _cidWidths.end() ? it->second : _defaultWidth;
    }

    bool PdfFont::glyphIndex(const PdfCharCode& c, uint32_t& gid) const
    {
        if (!_face || _kind == PdfFontKind::Type3)
            return false;

        if (_kind == PdfFontKind::Simple)
        {
            int32_t g = _gids[c.code & 0xFF];
            if (g <= 0)
                return false;
            gid = static_cast<uint32_t>(g);
            return true;
        }

        uint32_t cid;
        if (!_cmap->lookup(c.code, c.bytes, cid))
            return false;

        if (!_cffCidToGid.empty())
        {
            auto it = _cffCidToGid.find(cid);
            if (it == _cffCidToGid.end())
                return false;
            gid = it->second;
        }
        else if (_cidToGidIdentity)
        {
            gid = cid;
        }
        else
        {
            if (cid >= _cidToGid.size())
                return false;
            gid = _cidToGid[cid];
        }

        return gid != 0 && gid < static_cast<uint32_t>(_face->num_glyphs);
    }

    bool PdfFont::outline(uint32_t gid, PdfGlyph& out) const
    {
        if (!_face)
            return false;

        std::lock_guard<std::mutex> lock(_faceMutex);
        if (FT_Load_Glyph(_face, gid, FT_LOAD_NO_SCALE | FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP) != 0)
            return false;

        FT_GlyphSlot slot = _face->glyph;
        if (slot->format != FT_GLYPH_FORMAT_OUTLINE)
            return false;

        FT_Outline_Funcs funcs;
        funcs.move_to = sinkMoveTo;
        funcs.line_to = sinkLineTo;
        funcs.conic_to = sinkConicTo;
        funcs.cubic_to = sinkCubicTo;
        funcs.shift = 0;
        funcs.delta = 0;

        OutlineSink sink;
        sink.path = &out.outline;
        sink.scale = 1.0 / _unitsPerEm;

        out.outline.clear();
        if (FT_Outline_Decompose(&slot->outline, &funcs, &sink) != 0)
            return false;
        if (sink.open)
            out.outline.emplace_back();

        out.advance = slot->metrics.horiAdvance * 1000.0 / _unitsPerEm;
        return true;
    }
}
