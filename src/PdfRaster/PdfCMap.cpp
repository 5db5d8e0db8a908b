#include "PdfCMap.h"
#include "PdfDocument.h"
#include "PdfLexer.h"
#include "PdfDebug.h"

#include <algorithm>
#include <cstdlib>

namespace pdfraster
{
    namespace
    {
        uint32_t bytesToCode(const std::string& s)
        {
            uint32_t v = 0;
            for (size_t i = 0; i < s.size() && i < 4; ++i)
                v = (v << 8) | static_cast<uint8_t>(s[i]);
            return v;
        }
    }

    PdfCMapPtr PdfCMap::Identity(bool vertical)
    {
        static const PdfCMapPtr horizontal = [] {
            auto cmap = std::make_shared<PdfCMap>();
            cmap->_identity = true;
            cmap->_codespaces.push_back({ 2, 0x0000, 0xFFFF });
            return cmap;
        }();
        static const PdfCMapPtr verticalMap = [] {
            auto cmap = std::make_shared<PdfCMap>();
            cmap->_identity = true;
            cmap->_vertical = true;
            cmap->_codespaces.push_back({ 2, 0x0000, 0xFFFF });
            return cmap;
        }();
        return vertical ? verticalMap : horizontal;
    }

    PdfCMapPtr PdfCMap::FromProgram(const std::vector<uint8_t>& program, const PdfCMapPtr& parent)
    {
        auto cmap = std::make_shared<PdfCMap>();
        cmap->_parent = parent;
        if (parent)
            cmap->_vertical = parent->_vertical;

        PdfLexer lexer(program);
        std::string lastName;

        while (true)
        {
            Token t = lexer.nextToken();
            if (t.type == TokenType::EndOfFile)
                break;

            if (t.type == TokenType::Name)
            {
                lastName = t.text;
                if (t.text == "/WMode")
                {
                    Token v = lexer.nextToken();
                    if (v.type == TokenType::Number)
                        cmap->_vertical = std::atoi(v.text.c_str()) == 1;
                }
                continue;
            }

            if (t.type != TokenType::Keyword)
                continue;

            if (t.text == "usecmap")
            {
                if (lastName == "/Identity-H" || lastName == "/Identity-V")
                    cmap->_parent = Identity(lastName == "/Identity-V");
                else
                    LogDebug("PdfCMap: usecmap %s is not a known CMap", lastName.c_str());
                continue;
            }

            if (t.text == "begincodespacerange")
            {
                while (true)
                {
                    Token lo = lexer.nextToken();
                    if (lo.type != TokenType::HexString)
                        break;
                    Token hi = lexer.nextToken();
                    if (hi.type != TokenType::HexString || lo.text.empty() || lo.text.size() > 4)
                        break;
                    cmap->_codespaces.push_back({ lo.text.size(), bytesToCode(lo.text), bytesToCode(hi.text) });
                }
                continue;
            }

            if (t.text == "begincidrange")
            {
                while (true)
                {
                    Token lo = lexer.nextToken();
                    if (lo.type != TokenType::HexString)
                        break;
                    Token hi = lexer.nextToken();
                    Token cid = lexer.nextToken();
                    if (hi.type != TokenType::HexString || cid.type != TokenType::Number)
                        break;
                    cmap->_ranges.push_back({ lo.text.size(), bytesToCode(lo.text), bytesToCode(hi.text),
                        static_cast<uint32_t>(std::atol(cid.text.c_str())) });
                }
                continue;
            }

            if (t.text == "begincidchar")
            {
                while (true)
                {
                    Token code = lexer.nextToken();
                    if (code.type != TokenType::HexString)
                        break;
                    Token cid = lexer.nextToken();
                    if (cid.type != TokenType::Number)
                        break;
                    uint32_t c = bytesToCode(code.text);
                    cmap->_ranges.push_back({ code.text.size(), c, c,
                        static_cast<uint32_t>(std::atol(cid.text.c_str())) });
                }
                continue;
            }
        }

        LogDebug("PdfCMap: %zu codespace ranges, %zu cid ranges", cmap->_codespaces.size(), cmap->_ranges.size());
        return cmap;
    }

    namespace
    {
        PdfCMapPtr parseWithDepth(const PdfDocument& doc, const PdfObjectPtr& encodingIn, std::string& why, int depth)
        {
            if (depth > PdfCMap::MAX_USECMAP_DEPTH)
            {
                why = "usecmap chain too deep";
                return nullptr;
            }

            auto encoding = doc.resolveIndirect(encodingIn);
            std::string name = NameOf(encoding);
            if (name == "/Identity-H" || name == "/Identity")
                return PdfCMap::Identity(false);
            if (name == "/Identity-V")
                return PdfCMap::Identity(true);
            if (!name.empty())
            {
                why = "predefined CMap " + name + " is not available";
                return nullptr;
            }

            auto stream = AsStream(encoding);
            if (!stream)
            {
                why = "Type0 /Encoding is neither a name nor a stream";
                return nullptr;
            }

            PdfCMapPtr parent;
            auto use = doc.get(stream->dict, "/UseCMap");
            if (!IsNull(use))
            {
                parent = parseWithDepth(doc, use, why, depth + 1);
                if (!parent)
                    return nullptr;
            }

            std::vector<uint8_t> program;
            if (!doc.decodeStream(stream, program))
            {
                why = "CMap stream failed to decode";
                return nullptr;
            }
            return PdfCMap::FromProgram(program, parent);
        }
    }

    PdfCMapPtr PdfCMap::Parse(const PdfDocument& doc, const PdfObjectPtr& encoding, std::string& why)
    {
        return parseWithDepth(doc, encoding, why, 0);
    }

    bool PdfCMap::inCodespace(uint32_t code, size_t bytes) const
    {
        for (const auto& cs : _codespaces)
        {
            if (cs.bytes == bytes && code >= cs.lo && code <= cs.hi)
                return true;
        }
        return false;
    }

    size_t PdfCMap::readCode(const std::string& s, size_t pos, uint32_t& code) const
    {
        const PdfCMap* spaces = this;
        while (spaces && spaces->_codespaces.empty())
            spaces = spaces->_parent.get();

        if (pos >= s.size())
        {
            code = 0;
            return 0;
        }

        if (!spaces)
        {
            code = static_cast<uint8_t>(s[pos]);
            return 1;
        }

        uint32_t v = 0;
        for (size_t n = 1; n <= 4 && pos + n <= s.size(); ++n)
        {
            v = (v << 8) | static_cast<uint8_t>(s[pos + n - 1]);
            if (spaces->inCodespace(v, n))
            {
                code = v;
                return n;
            }
        }

        // No codespace matched: consume as many bytes as the shortest range
        size_t shortest = 4;
        for (const auto& cs : spaces->_codespaces)
            shortest = std::min(shortest, cs.bytes);
        shortest = std::min(shortest, s.size() - pos);

        v = 0;
        for (size_t i = 0; i < shortest; ++i)
            v = (v << 8) | static_cast<uint8_t>(s[pos + i]);
        code = v;
        return shortest;
    }

    bool PdfCMap::lookup(uint32_t code, size_t bytes, uint32_t& cid) const
    {
        if (_identity)
        {
            cid = code;
            return true;
        }

        // later definitions override earlier ones
        for (auto it = _ranges.rbegin(); it != _ranges.rend(); ++it)
        {
            if (it->bytes == bytes && code >= it->lo && code <= it->hi)
            {
                cid = it->cid + (code - it->lo);
                return true;
            }
        }

        if (_parent)
            return _parent->lookup(code, bytes, cid);
        return false;
    }
}
