#include "PdfDocument.h"
#include "PdfParser.h"
#include "PdfDebug.h"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace pdfraster
{
    namespace
    {
        size_t rfindString(const std::vector<uint8_t>& data, const char* str)
        {
            size_t len = std::strlen(str);
            if (data.size() < len)
                return std::string::npos;

            for (size_t i = data.size() - len + 1; i-- > 0;)
            {
                if (std::memcmp(data.data() + i, str, len) == 0)
                    return i;
            }
            return std::string::npos;
        }

        bool startsWith(const std::vector<uint8_t>& data, size_t pos, const char* word)
        {
            size_t len = std::strlen(word);
            return pos + len <= data.size() && std::memcmp(data.data() + pos, word, len) == 0;
        }

        size_t skipWhitespaceXRef(const std::vector<uint8_t>& data, size_t pos)
        {
            while (pos < data.size() && IsPdfWhitespace(data[pos]))
                ++pos;
            return pos;
        }

        // Returns npos when no digits are found
        size_t readIntegerXRef(const std::vector<uint8_t>& data, size_t pos, int64_t& value)
        {
            pos = skipWhitespaceXRef(data, pos);
            value = 0;
            bool negative = false;

            if (pos < data.size() && (data[pos] == '-' || data[pos] == '+'))
            {
                negative = data[pos] == '-';
                ++pos;
            }

            size_t start = pos;
            while (pos < data.size() && data[pos] >= '0' && data[pos] <= '9' && pos - start < 18)
            {
                value = value * 10 + (data[pos] - '0');
                ++pos;
            }

            if (pos == start)
                return std::string::npos;

            if (negative)
                value = -value;
            return pos;
        }

        void appendUtf8(std::string& out, uint32_t cp)
        {
            if (cp < 0x80)
            {
                out.push_back(static_cast<char>(cp));
            }
            else if (cp < 0x800)
            {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            else if (cp < 0x10000)
            {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            else
            {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        // PDF text string (UTF-16BE with BOM, UTF-8 with BOM, or
        // PDFDocEncoding treated as Latin-1) to UTF-8
        std::string decodeTextString(const std::string& raw)
        {
            std::string out;
            if (raw.size() >= 2 && static_cast<uint8_t>(raw[0]) == 0xFE && static_cast<uint8_t>(raw[1]) == 0xFF)
            {
                for (size_t i = 2; i + 1 < raw.size(); i += 2)
                {
                    uint32_t u = (static_cast<uint8_t>(raw[i]) << 8) | static_cast<uint8_t>(raw[i + 1]);
                    if (u >= 0xD800 && u < 0xDC00 && i + 3 < raw.size())
                    {
                        uint32_t lo = (static_cast<uint8_t>(raw[i + 2]) << 8) | static_cast<uint8_t>(raw[i + 3]);
                        if (lo >= 0xDC00 && lo < 0xE000)
                        {
                            u = 0x10000 + ((u - 0xD800) << 10) + (lo - 0xDC00);
                            i += 2;
                        }
                    }
                    appendUtf8(out, u);
                }
                return out;
            }
            if (raw.size() >= 3 && static_cast<uint8_t>(raw[0]) == 0xEF &&
                static_cast<uint8_t>(raw[1]) == 0xBB && static_cast<uint8_t>(raw[2]) == 0xBF)
            {
                return raw.substr(3);
            }
            for (char c : raw)
                appendUtf8(out, static_cast<uint8_t>(c));
            return out;
        }

        PdfFilterParams filterParamsFrom(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& d)
        {
            PdfFilterParams p;
            if (!d)
                return p;
            p.predictor = static_cast<int>(doc.getNumberOr(d, "/Predictor", 1));
            p.colors = static_cast<int>(doc.getNumberOr(d, "/Colors", 1));
            p.bitsPerComponent = static_cast<int>(doc.getNumberOr(d, "/BitsPerComponent", 8));
            p.columns = static_cast<int>(doc.getNumberOr(d, "/Columns", 1));
            p.earlyChange = static_cast<int>(doc.getNumberOr(d, "/EarlyChange", 1));
            return p;
        }
    }

    PdfRect PdfPage::box() const
    {
        PdfRect r;
        r.x0 = std::max(cropBox.x0, mediaBox.x0);
        r.y0 = std::max(cropBox.y0, mediaBox.y0);
        r.x1 = std::min(cropBox.x1, mediaBox.x1);
        r.y1 = std::min(cropBox.y1, mediaBox.y1);
        if (r.empty())
            return mediaBox;
        return r;
    }

    PdfDocument::PdfDocument() = default;
    PdfDocument::~PdfDocument() = default;

    // =====================================================
    // Loading
    // =====================================================

    bool PdfDocument::loadFromBytes(const std::vector<uint8_t>& data, PdfError& err)
    {
        _objects.clear();
        _xrefTable.clear();
        _objStmEntries.clear();
        _trailer.reset();
        _root.reset();
        _pages.reset();
        _pageList.clear();
        _info = PdfDocumentInfo{};

        if (data.size() < 8)
        {
            err.set(PdfErrorCode::MalformedDocument, "input is too short to be a PDF");
            return false;
        }

        _data = &data;

        // 1. Cross-reference data from startxref
        if (loadXRefTable())
            LogDebug("PDF: XRef table loaded with %zu entries", _xrefTable.size());
        else
            LogDebug("PDF: XRef table not found or invalid, using linear scan only");

        // 2. Linear scan recovers everything with an "N G obj" header
        PdfParser parser(data);
        parser.parse();
        _objects = parser.objects();

        // 3. Objects the scan missed but the xref points at
        int loadedFromXref = 0;
        for (const auto& kv : _xrefTable)
        {
            if (_objects.count(kv.first))
                continue;
            auto obj = loadObjectAtOffset(kv.second, kv.first);
            if (obj)
            {
                _objects[kv.first] = obj;
                loadedFromXref++;
            }
        }
        if (loadedFromXref)
            LogDebug("PDF: Loaded %d additional objects from XRef", loadedFromXref);

        // 4. Object streams. Entries the xref assigns to a stream take
        //    precedence over stale top-level copies.
        std::set<int> objStmNums;
        for (const auto& kv : _objStmEntries)
            objStmNums.insert(kv.second.objStmNum);
        for (const auto& kv : _objects)
        {
            auto stream = AsStream(kv.second);
            if (stream && NameOf(stream->dict->get("/Type")) == "/ObjStm")
                objStmNums.insert(kv.first);
        }

        int loadedFromObjStm = 0;
        for (int num : objStmNums)
        {
            std::map<int, PdfObjectPtr> contained;
            if (!loadObjectStream(num, contained))
                continue;
            for (auto& kv : contained)
            {
                auto entry = _objStmEntries.find(kv.first);
                bool authoritative = entry != _objStmEntries.end() && entry->second.objStmNum == num;
                if (authoritative || !_objects.count(kv.first))
                {
                    _objects[kv.first] = kv.second;
                    loadedFromObjStm++;
                }
            }
        }
        if (loadedFromObjStm)
            LogDebug("PDF: Loaded %d objects from Object Streams", loadedFromObjStm);

        if (_objects.empty())
        {
            _data = nullptr;
            err.set(PdfErrorCode::MalformedDocument, "no objects found");
            return false;
        }

        // 5. Trailer: from the xref, else the last "trailer" keyword
        if (!_trailer)
        {
            size_t pos = rfindString(data, "trailer");
            if (pos != std::string::npos)
                _trailer = parseTrailerAt(pos);
        }

        _data = nullptr;

        if (_trailer && _trailer->get("/Encrypt"))
        {
            err.set(PdfErrorCode::MalformedDocument, "encrypted documents are not supported");
            return false;
        }

        // 6. Catalog and page tree root
        if (_trailer)
            _root = AsDict(resolveIndirect(_trailer->get("/Root")));

        if (!_root || NameOf(resolveIndirect(_root->get("/Type"))) != "/Catalog")
        {
            std::shared_ptr<PdfDictionary> found;
            for (const auto& kv : _objects)
            {
                auto dict = std::dynamic_pointer_cast<PdfDictionary>(kv.second);
                if (dict && NameOf(resolveIndirect(dict->get("/Type"))) == "/Catalog")
                    found = dict;
            }
            if (found)
                _root = found;
        }

        if (_root)
            _pages = getDict(_root, "/Pages");

        if (!_pages)
        {
            for (const auto& kv : _objects)
            {
                auto dict = std::dynamic_pointer_cast<PdfDictionary>(kv.second);
                if (dict && NameOf(resolveIndirect(dict->get("/Type"))) == "/Pages" && !dict->get("/Parent"))
                {
                    _pages = dict;
                    break;
                }
            }
        }

        if (!buildPageList(err))
            return false;

        if (!_root && _pageList.empty())
        {
            err.set(PdfErrorCode::MalformedDocument, "no document catalog or pages found");
            return false;
        }

        loadInfo();

        LogDebug("PDF: loaded %zu objects, %zu pages", _objects.size(), _pageList.size());
        return true;
    }

    PdfObjectPtr PdfDocument::loadObjectAtOffset(size_t offset, int expectedNum)
    {
        if (!_data || offset >= _data->size())
            return nullptr;

        // The offset must point at the object's own header
        int64_t num = 0;
        size_t p = readIntegerXRef(*_data, offset, num);
        if (p == std::string::npos || num != expectedNum)
        {
            LogDebug("XRef: offset %zu does not start object %d", offset, expectedNum);
            return nullptr;
        }

        PdfParser parser(*_data);
        return parser.parseObjectAt(offset);
    }

    bool PdfDocument::loadObjectStream(int objStmNum, std::map<int, PdfObjectPtr>& out)
    {
        auto it = _objects.find(objStmNum);
        if (it == _objects.end())
            return false;

        auto stream = AsStream(it->second);
        if (!stream || !stream->dict)
            return false;

        int n = static_cast<int>(getNumberOr(stream->dict, "/N", 0));
        int first = static_cast<int>(getNumberOr(stream->dict, "/First", 0));
        if (n <= 0 || first <= 0)
            return false;

        std::vector<uint8_t> decoded;
        if (!decodeStream(stream, decoded) || decoded.empty())
        {
            LogDebug("[ObjStm] stream %d could not be decoded", objStmNum);
            return false;
        }

        // Header: N pairs of "objNum offset"
        std::vector<std::pair<int64_t, int64_t>> entries;
        size_t pos = 0;
        for (int i = 0; i < n && pos < static_cast<size_t>(first); i++)
        {
            int64_t oNum = 0;
            int64_t off = 0;
            pos = readIntegerXRef(decoded, pos, oNum);
            if (pos == std::string::npos)
                break;
            pos = readIntegerXRef(decoded, pos, off);
            if (pos == std::string::npos)
                break;
            entries.push_back({ oNum, off });
        }

        PdfParser parser(decoded);
        for (const auto& e : entries)
        {
            size_t target = static_cast<size_t>(first) + static_cast<size_t>(e.second);
            if (e.first <= 0 || target >= decoded.size())
                continue;
            auto obj = parser.parseObjectAt(target);
            if (obj)
                out[static_cast<int>(e.first)] = obj;
        }

        LogDebug("[ObjStm] stream %d yielded %zu objects", objStmNum, out.size());
        return !out.empty();
    }

    // =====================================================
    // XRef table parsing, incremental updates included
    // =====================================================

    bool PdfDocument::parseXRefTableAt(size_t offset, std::map<int, size_t>& xrefEntries)
    {
        const auto& data = *_data;
        if (!startsWith(data, offset, "xref"))
            return false;

        size_t pos = offset + 4;
        while (pos < data.size())
        {
            pos = skipWhitespaceXRef(data, pos);
            if (startsWith(data, pos, "trailer"))
                break;

            int64_t firstObj = 0;
            int64_t count = 0;
            pos = readIntegerXRef(data, pos, firstObj);
            if (pos == std::string::npos)
                break;
            pos = readIntegerXRef(data, pos, count);
            if (pos == std::string::npos)
                break;

            for (int64_t i = 0; i < count && pos < data.size(); ++i)
            {
                // offset(10) generation(5) n|f
                int64_t entryOffset = 0;
                int64_t generation = 0;
                pos = readIntegerXRef(data, pos, entryOffset);
                if (pos == std::string::npos)
                    return !xrefEntries.empty();
                pos = readIntegerXRef(data, pos, generation);
                if (pos == std::string::npos)
                    return !xrefEntries.empty();

                pos = skipWhitespaceXRef(data, pos);
                if (pos >= data.size())
                    break;
                char flag = static_cast<char>(data[pos++]);

                int objNum = static_cast<int>(firstObj + i);
                if (flag == 'n' && entryOffset > 0 && xrefEntries.find(objNum) == xrefEntries.end())
                    xrefEntries[objNum] = static_cast<size_t>(entryOffset);
            }
        }

        return true;
    }

    // PDF 1.5 cross-reference stream
    bool PdfDocument::parseXRefStreamAt(size_t offset, std::map<int, size_t>& xrefEntries,
        std::shared_ptr<PdfDictionary>& trailer)
    {
        PdfParser parser(*_data);
        auto stream = AsStream(parser.parseObjectAt(offset));
        if (!stream || !stream->dict)
            return false;

        auto dict = stream->dict;
        if (NameOf(dict->get("/Type")) != "/XRef")
            return false;

        int xrefSize = static_cast<int>(NumberOr(dict->get("/Size"), 0));
        auto wArr = AsArray(dict->get("/W"));
        if (!wArr || wArr->items.size() < 3)
            return false;

        int w[3];
        for (int i = 0; i < 3; i++)
            w[i] = static_cast<int>(NumberOr(wArr->items[i], 0));
        if (w[0] < 0 || w[1] < 0 || w[2] < 0 || w[0] > 8 || w[1] > 8 || w[2] > 8)
            return false;
        int entrySize = w[0] + w[1] + w[2];
        if (entrySize == 0)
            return false;

        std::vector<std::pair<int, int>> subsections;
        auto indexArr = AsArray(dict->get("/Index"));
        if (indexArr && indexArr->items.size() >= 2)
        {
            for (size_t i = 0; i + 1 < indexArr->items.size(); i += 2)
            {
                subsections.push_back({
                    static_cast<int>(NumberOr(indexArr->items[i], 0)),
                    static_cast<int>(NumberOr(indexArr->items[i + 1], 0)) });
            }
        }
        else
        {
            subsections.push_back({ 0, xrefSize });
        }

        // Filters of an xref stream are always direct objects
        std::vector<uint8_t> streamData;
        std::vector<std::string> filters;
        std::vector<PdfFilterParams> params;
        auto filterObj = dict->get("/Filter");
        if (auto name = std::dynamic_pointer_cast<PdfName>(filterObj))
            filters.push_back(name->value);
        else if (auto arr = AsArray(filterObj))
            for (auto& f : arr->items)
                filters.push_back(NameOf(f));
        auto parmsObj = dict->get("/DecodeParms");
        if (auto pd = AsDict(parmsObj))
            params.push_back(filterParamsFrom(*this, pd));
        else if (auto pa = AsArray(parmsObj))
            for (auto& p : pa->items)
                params.push_back(filterParamsFrom(*this, AsDict(p)));

        if (!PdfFilters::Decode(stream->data, filters, params, streamData) || streamData.empty())
            return false;

        auto readField = [&](size_t& dataPos, int width, uint64_t fallback) {
            if (width == 0)
                return fallback;
            uint64_t v = 0;
            for (int j = 0; j < width; ++j)
                v = (v << 8) | streamData[dataPos++];
            return v;
        };

        size_t dataPos = 0;
        for (const auto& sub : subsections)
        {
            for (int i = 0; i < sub.second && dataPos + entrySize <= streamData.size(); ++i)
            {
                uint64_t type = readField(dataPos, w[0], 1);
                uint64_t field2 = readField(dataPos, w[1], 0);
                uint64_t field3 = readField(dataPos, w[2], 0);

                int objNum = sub.first + i;
                if (type == 1)
                {
                    if (xrefEntries.find(objNum) == xrefEntries.end() && !_objStmEntries.count(objNum))
                        xrefEntries[objNum] = static_cast<size_t>(field2);
                }
                else if (type == 2)
                {
                    if (_objStmEntries.find(objNum) == _objStmEntries.end() && !xrefEntries.count(objNum))
                        _objStmEntries[objNum] = { static_cast<int>(field2), static_cast<int>(field3) };
                }
            }
        }

        trailer = dict;
        return true;
    }

    std::shared_ptr<PdfDictionary> PdfDocument::parseTrailerAt(size_t xrefOffset)
    {
        const auto& data = *_data;
        for (size_t pos = xrefOffset; pos + 7 <= data.size(); ++pos)
        {
            if (!startsWith(data, pos, "trailer"))
                continue;

            pos = skipWhitespaceXRef(data, pos + 7);
            if (!startsWith(data, pos, "<<"))
                return nullptr;

            PdfParser parser(data);
            return std::dynamic_pointer_cast<PdfDictionary>(parser.parseObjectAt(pos));
        }
        return nullptr;
    }

    bool PdfDocument::loadXRefTable()
    {
        const auto& data = *_data;

        size_t startxrefPos = rfindString(data, "startxref");
        if (startxrefPos == std::string::npos)
        {
            LogDebug("XRef: startxref not found");
            return false;
        }

        int64_t xrefOffset = 0;
        if (readIntegerXRef(data, startxrefPos + 9, xrefOffset) == std::string::npos || xrefOffset <= 0)
        {
            LogDebug("XRef: invalid startxref offset");
            return false;
        }

        // Newest section first; earlier entries win while following /Prev
        std::set<int64_t> visitedOffsets;
        std::map<int, size_t> allEntries;

        while (xrefOffset > 0 && xrefOffset < static_cast<int64_t>(data.size()))
        {
            if (!visitedOffsets.insert(xrefOffset).second)
            {
                LogDebug("XRef: /Prev loop at offset %lld", static_cast<long long>(xrefOffset));
                break;
            }

            size_t checkPos = skipWhitespaceXRef(data, static_cast<size_t>(xrefOffset));
            std::shared_ptr<PdfDictionary> currentTrailer;

            if (startsWith(data, checkPos, "xref"))
            {
                if (parseXRefTableAt(checkPos, allEntries))
                    currentTrailer = parseTrailerAt(checkPos);

                // hybrid files: /XRefStm carries the compressed entries
                double xrefStm = 0;
                if (currentTrailer && AsNumber(currentTrailer->get("/XRefStm"), xrefStm) && xrefStm > 0)
                {
                    std::shared_ptr<PdfDictionary> ignored;
                    parseXRefStreamAt(static_cast<size_t>(xrefStm), allEntries, ignored);
                }
            }
            else
            {
                parseXRefStreamAt(checkPos, allEntries, currentTrailer);
            }

            if (!currentTrailer)
            {
                LogDebug("XRef: no trailer for section at %lld", static_cast<long long>(xrefOffset));
                break;
            }

            if (!_trailer)
                _trailer = currentTrailer;

            double prev = 0;
            xrefOffset = AsNumber(currentTrailer->get("/Prev"), prev) ? static_cast<int64_t>(prev) : -1;
        }

        _xrefTable = std::move(allEntries);
        return !_xrefTable.empty() || !_objStmEntries.empty();
    }

    // =====================================================
    // References
    // =====================================================

    bool PdfDocument::resolve(const PdfIndirectRef& ref, PdfObjectPtr& out, PdfError& err) const
    {
        auto it = _objects.find(ref.objNum);
        if (it == _objects.end())
        {
            err.set(PdfErrorCode::DanglingReference,
                "object " + std::to_string(ref.objNum) + " " + std::to_string(ref.genNum) + " R does not exist");
            return false;
        }
        out = it->second;
        return true;
    }

    PdfObjectPtr PdfDocument::resolveIndirect(const PdfObjectPtr& obj) const
    {
        PdfObjectPtr cur = obj;
        for (int depth = 0; depth < MAX_REF_DEPTH; ++depth)
        {
            if (!cur || cur->type() != PdfObjectType::IndirectRef)
                return cur;

            auto ref = std::static_pointer_cast<PdfIndirectRef>(cur);
            auto it = _objects.find(ref->objNum);
            if (it == _objects.end())
                return nullptr;
            cur = it->second;
        }
        LogDebug("PdfDocument: reference chain deeper than %d", MAX_REF_DEPTH);
        return nullptr;
    }

    PdfObjectPtr PdfDocument::get(const std::shared_ptr<PdfDictionary>& dict, const char* key) const
    {
        if (!dict)
            return nullptr;
        return resolveIndirect(dict->get(key));
    }

    std::shared_ptr<PdfDictionary> PdfDocument::getDict(const std::shared_ptr<PdfDictionary>& dict, const char* key) const
    {
        return AsDict(get(dict, key));
    }

    std::shared_ptr<PdfArray> PdfDocument::getArray(const std::shared_ptr<PdfDictionary>& dict, const char* key) const
    {
        return AsArray(get(dict, key));
    }

    std::shared_ptr<PdfStream> PdfDocument::getStream(const std::shared_ptr<PdfDictionary>& dict, const char* key) const
    {
        return AsStream(get(dict, key));
    }

    bool PdfDocument::getNumber(const std::shared_ptr<PdfDictionary>& dict, const char* key, double& out) const
    {
        return AsNumber(get(dict, key), out);
    }

    double PdfDocument::getNumberOr(const std::shared_ptr<PdfDictionary>& dict, const char* key, double fallback) const
    {
        double v = fallback;
        getNumber(dict, key, v);
        return v;
    }

    std::string PdfDocument::getName(const std::shared_ptr<PdfDictionary>& dict, const char* key) const
    {
        return NameOf(get(dict, key));
    }

    std::vector<double> PdfDocument::numbers(const std::shared_ptr<PdfArray>& arr) const
    {
        std::vector<double> out;
        if (!arr)
            return out;
        out.reserve(arr->items.size());
        for (const auto& item : arr->items)
        {
            double v = 0;
            if (AsNumber(resolveIndirect(item), v))
                out.push_back(v);
        }
        return out;
    }

    // =====================================================
    // Page tree
    // =====================================================

    bool PdfDocument::isPageObject(const std::shared_ptr<PdfDictionary>& dict) const
    {
        if (!dict)
            return false;

        std::string type = getName(dict, "/Type");
        if (!type.empty())
            return type == "/Page";

        // untyped leaf written by a sloppy producer
        return dict->has("/Contents") || dict->has("/MediaBox");
    }

    bool PdfDocument::walkPageTree(const std::shared_ptr<PdfDictionary>& node,
        std::vector<std::shared_ptr<PdfDictionary>>& path,
        std::set<const PdfDictionary*>& onPath,
        std::set<const PdfDictionary*>& seen,
        PdfError& err)
    {
        if (onPath.count(node.get()))
        {
            err.set(PdfErrorCode::CyclicPageTree,
                "page tree node reappears on its own ancestry path at depth " + std::to_string(path.size()));
            return false;
        }
        if (static_cast<int>(path.size()) > MAX_TREE_DEPTH)
        {
            err.set(PdfErrorCode::MalformedDocument, "page tree deeper than " + std::to_string(MAX_TREE_DEPTH));
            return false;
        }
        if (!seen.insert(node.get()).second)
        {
            // shared subtree: pages are listed once
            LogDebug("PdfDocument: page tree node visited twice, skipped");
            return true;
        }

        auto kids = getArray(node, "/Kids");
        std::string type = getName(node, "/Type");
        bool intermediate = type == "/Pages" || (type != "/Page" && kids);

        if (!intermediate)
        {
            if (isPageObject(node))
            {
                PageNode pn;
                pn.dict = node;
                pn.ancestors.push_back(node);
                for (auto it = path.rbegin(); it != path.rend(); ++it)
                    pn.ancestors.push_back(*it);
                _pageList.push_back(std::move(pn));
            }
            return true;
        }

        if (!kids)
            return true;

        path.push_back(node);
        onPath.insert(node.get());

        for (const auto& kid : kids->items)
        {
            auto child = AsDict(resolveIndirect(kid));
            if (!child)
            {
                LogDebug("PdfDocument: /Kids entry is not a dictionary, skipped");
                continue;
            }
            if (!walkPageTree(child, path, onPath, seen, err))
                return false;
        }

        onPath.erase(node.get());
        path.pop_back();
        return true;
    }

    void PdfDocument::collectPagesByScan()
    {
        for (const auto& kv : _objects)
        {
            auto dict = std::dynamic_pointer_cast<PdfDictionary>(kv.second);
            if (!dict || getName(dict, "/Type") != "/Page")
                continue;

            PageNode pn;
            pn.dict = dict;
            pn.ancestors.push_back(dict);

            std::set<const PdfDictionary*> visited{ dict.get() };
            auto parent = getDict(dict, "/Parent");
            while (parent && visited.insert(parent.get()).second &&
                static_cast<int>(pn.ancestors.size()) < MAX_TREE_DEPTH)
            {
                pn.ancestors.push_back(parent);
                parent = getDict(parent, "/Parent");
            }
            _pageList.push_back(std::move(pn));
        }
    }

    bool PdfDocument::buildPageList(PdfError& err)
    {
        _pageList.clear();

        if (_pages)
        {
            std::vector<std::shared_ptr<PdfDictionary>> path;
            std::set<const PdfDictionary*> onPath;
            std::set<const PdfDictionary*> seen;
            if (!walkPageTree(_pages, path, onPath, seen, err))
            {
                _pageList.clear();
                LogDebug("PdfDocument: %s", err.message.c_str());
                return false;
            }
        }

        if (_pageList.empty())
        {
            collectPagesByScan();
            if (!_pageList.empty())
                LogDebug("PdfDocument: page tree unusable, %zu pages found by scan", _pageList.size());
        }
        return true;
    }

    PdfObjectPtr PdfDocument::inherited(const PdfPage& page, const char* key) const
    {
        for (const auto& node : page.ancestors)
        {
            auto v = get(node, key);
            if (!IsNull(v))
                return v;
        }
        return nullptr;
    }

    bool PdfDocument::extractBox(const PdfPage& page, const char* key, PdfRect& out) const
    {
        auto vals = numbers(AsArray(inherited(page, key)));
        if (vals.size() < 4)
            return false;

        PdfRect r;
        r.x0 = std::min(vals[0], vals[2]);
        r.y0 = std::min(vals[1], vals[3]);
        r.x1 = std::max(vals[0], vals[2]);
        r.y1 = std::max(vals[1], vals[3]);
        if (r.empty())
            return false;
        out = r;
        return true;
    }

    bool PdfDocument::page(int index, PdfPage& out, PdfError& err) const
    {
        if (index < 0 || index >= pageCount())
        {
            err.set(PdfErrorCode::PageIndexOutOfRange,
                "page index " + std::to_string(index) + " outside 0.." + std::to_string(pageCount() - 1));
            return false;
        }

        const PageNode& node = _pageList[static_cast<size_t>(index)];
        out = PdfPage{};
        out.index = index;
        out.dict = node.dict;
        out.ancestors = node.ancestors;

        // US Letter when nothing usable is given
        out.mediaBox = PdfRect{ 0, 0, 612, 792 };
        extractBox(out, "/MediaBox", out.mediaBox);
        out.cropBox = out.mediaBox;
        extractBox(out, "/CropBox", out.cropBox);

        double rot = 0;
        AsNumber(inherited(out, "/Rotate"), rot);
        int r = static_cast<int>(std::lround(rot / 90.0)) * 90;
        out.rotate = ((r % 360) + 360) % 360;
        return true;
    }

    bool PdfDocument::pageSize(int index, double& wPt, double& hPt, PdfError& err) const
    {
        PdfPage p;
        if (!page(index, p, err))
            return false;

        PdfRect b = p.box();
        wPt = b.width();
        hPt = b.height();
        if (p.rotate == 90 || p.rotate == 270)
            std::swap(wPt, hPt);
        return true;
    }

    // =====================================================
    // Streams
    // =====================================================

    bool PdfDocument::decodeStream(const std::shared_ptr<PdfStream>& stream,
        std::vector<uint8_t>& out,
        std::string* imageCodec) const
    {
        out.clear();
        if (!stream)
            return false;

        std::vector<std::string> filters;
        std::vector<PdfFilterParams> params;

        auto filterObj = get(stream->dict, "/Filter");
        if (auto name = std::dynamic_pointer_cast<PdfName>(filterObj))
        {
            filters.push_back(name->value);
        }
        else if (auto arr = AsArray(filterObj))
        {
            for (const auto& f : arr->items)
                filters.push_back(NameOf(resolveIndirect(f)));
        }

        auto parmsObj = get(stream->dict, "/DecodeParms");
        if (auto arr = AsArray(parmsObj))
        {
            for (const auto& p : arr->items)
                params.push_back(filterParamsFrom(*this, AsDict(resolveIndirect(p))));
        }
        else
        {
            params.push_back(filterParamsFrom(*this, AsDict(parmsObj)));
        }

        if (filters.empty())
        {
            out = stream->data;
            return true;
        }

        return PdfFilters::Decode(stream->data, filters, params, out, imageCodec);
    }

    bool PdfDocument::pageContents(const PdfPage& page, std::vector<uint8_t>& out, PdfError& err) const
    {
        out.clear();
        if (!page.dict)
        {
            err.set(PdfErrorCode::RenderPageFault, "page has no dictionary");
            return false;
        }

        std::vector<std::shared_ptr<PdfStream>> streams;
        auto contents = get(page.dict, "/Contents");
        if (auto s = AsStream(contents))
        {
            streams.push_back(s);
        }
        else if (auto arr = AsArray(contents))
        {
            for (const auto& item : arr->items)
            {
                auto s2 = AsStream(resolveIndirect(item));
                if (s2)
                    streams.push_back(s2);
            }
        }

        int failed = 0;
        for (const auto& s : streams)
        {
            std::vector<uint8_t> decoded;
            if (!decodeStream(s, decoded))
            {
                failed++;
                LogDebug("PdfDocument: content stream of page %d could not be decoded", page.index);
                continue;
            }
            out.insert(out.end(), decoded.begin(), decoded.end());
            out.push_back('\n');
        }

        if (!streams.empty() && failed == static_cast<int>(streams.size()))
        {
            err.set(PdfErrorCode::RenderPageFault,
                "content of page " + std::to_string(page.index) + " could not be decoded");
            return false;
        }
        return true;
    }

    void PdfDocument::loadInfo()
    {
        auto infoDict = _trailer ? AsDict(resolveIndirect(_trailer->get("/Info"))) : nullptr;
        if (!infoDict)
            return;

        auto text = [&](const char* key) -> std::string {
            auto s = AsString(get(infoDict, key));
            return s ? decodeTextString(s->value) : std::string();
        };

        _info.title = text("/Title");
        _info.author = text("/Author");
        _info.subject = text("/Subject");
    }
}
