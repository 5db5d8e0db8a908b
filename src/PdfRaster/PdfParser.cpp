#include "PdfParser.h"
#include "PdfDebug.h"
#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace pdfraster
{
    namespace
    {
        bool isInteger(const Token& t)
        {
            return t.type == TokenType::Number && !t.text.empty() &&
                t.text.find('.') == std::string::npos;
        }

        bool matchesAt(const std::vector<uint8_t>& data, size_t pos, const char* word)
        {
            size_t n = std::strlen(word);
            if (pos + n > data.size())
                return false;
            return std::memcmp(data.data() + pos, word, n) == 0;
        }
    }

    PdfParser::PdfParser(const std::vector<uint8_t>& data)
        : _data(data), _lexer(data)
    {
    }

    bool PdfParser::parse()
    {
        LogDebug("PdfParser::parse() started, %zu bytes", _data.size());

        _lexer.setPosition(0);

        size_t safetyCounter = 0;
        const size_t MAX_ITERATIONS = 50000000;

        Token prev2;
        Token prev1;

        while (++safetyCounter < MAX_ITERATIONS)
        {
            Token tok = _lexer.nextToken();
            if (tok.type == TokenType::EndOfFile)
                break;

            if (tok.type == TokenType::Keyword && tok.text == "obj" &&
                isInteger(prev2) && isInteger(prev1))
            {
                int objNum = std::atoi(prev2.text.c_str());
                prev2 = Token{};
                prev1 = Token{};

                _depth = 0;
                PdfObjectPtr obj = parseNextObject();
                if (obj && objNum > 0)
                    _objects[objNum] = obj;

                Token endTok = _lexer.peekToken();
                if (endTok.type == TokenType::Keyword && endTok.text == "endobj")
                    _lexer.nextToken();
                continue;
            }

            prev2 = prev1;
            prev1 = tok;
        }

        if (safetyCounter >= MAX_ITERATIONS)
            LogDebug("PdfParser::parse() hit iteration cap");

        LogDebug("PdfParser::parse() finished - found %zu objects", _objects.size());
        return !_objects.empty();
    }

    PdfObjectPtr PdfParser::parseNextObject()
    {
        Token tok = _lexer.nextToken();
        if (tok.type == TokenType::EndOfFile)
            return nullptr;
        return parseObjectFrom(tok);
    }

    PdfObjectPtr PdfParser::parseObjectFrom(const Token& tok)
    {
        if (_depth > MAX_NESTING)
        {
            LogDebug("PdfParser: nesting deeper than %d, value dropped", MAX_NESTING);
            return std::make_shared<PdfNull>();
        }

        if (tok.type == TokenType::Delimiter && tok.text == "<<")
        {
            ++_depth;
            auto dict = parseDictionary();
            --_depth;

            Token next = _lexer.peekToken();
            if (next.type == TokenType::Keyword && next.text == "stream")
            {
                _lexer.nextToken();
                return parseStream(dict);
            }
            return dict;
        }

        if (tok.type == TokenType::Delimiter && tok.text == "[")
        {
            ++_depth;
            auto arr = parseArray();
            --_depth;
            return arr;
        }

        if (tok.type == TokenType::Number)
            return parseNumberOrReference(tok);

        return parseAtomicObject(tok);
    }

    PdfObjectPtr PdfParser::parseAtomicObject(const Token& tok)
    {
        switch (tok.type)
        {
        case TokenType::Number:
            return std::make_shared<PdfNumber>(std::atof(tok.text.c_str()));
        case TokenType::String:
            return std::make_shared<PdfString>(tok.text, false);
        case TokenType::HexString:
            return std::make_shared<PdfString>(tok.text, true);
        case TokenType::Name:
            return std::make_shared<PdfName>(tok.text);
        case TokenType::Keyword:
            if (tok.text == "true")  return std::make_shared<PdfBoolean>(true);
            if (tok.text == "false") return std::make_shared<PdfBoolean>(false);
            return std::make_shared<PdfNull>();
        default:
            break;
        }
        return nullptr;
    }

    // "n g R" is detected by lookahead; anything else rewinds
    PdfObjectPtr PdfParser::parseNumberOrReference(const Token& tok)
    {
        if (isInteger(tok))
        {
            size_t savePos = _lexer.getPosition();

            Token t2 = _lexer.nextToken();
            if (isInteger(t2))
            {
                Token t3 = _lexer.nextToken();
                if (t3.type == TokenType::Keyword && t3.text == "R")
                {
                    return std::make_shared<PdfIndirectRef>(
                        std::atoi(tok.text.c_str()),
                        std::atoi(t2.text.c_str()));
                }
            }

            _lexer.setPosition(savePos);
        }
        return parseAtomicObject(tok);
    }

    std::shared_ptr<PdfArray> PdfParser::parseArray()
    {
        auto arr = std::make_shared<PdfArray>();
        int safety = 0;
        const int MAX_ITEMS = 1 << 20;

        while (safety++ < MAX_ITEMS)
        {
            Token tok = _lexer.nextToken();
            if (tok.type == TokenType::EndOfFile)
                break;
            if (tok.type == TokenType::Delimiter && tok.text == "]")
                break;
            // a stray keyword ends a truncated array
            if (tok.type == TokenType::Keyword &&
                (tok.text == "endobj" || tok.text == "stream" || tok.text == "obj"))
            {
                break;
            }

            PdfObjectPtr item = parseObjectFrom(tok);
            if (item)
                arr->items.push_back(item);
        }

        return arr;
    }

    std::shared_ptr<PdfDictionary> PdfParser::parseDictionary()
    {
        auto dict = std::make_shared<PdfDictionary>();
        int safety = 0;

        while (safety++ < 100000)
        {
            Token key = _lexer.peekToken();
            if (key.type == TokenType::Delimiter && key.text == ">>")
            {
                _lexer.nextToken();
                break;
            }
            if (key.type != TokenType::Name)
            {
                // malformed: leave the token for the caller
                break;
            }
            _lexer.nextToken();

            Token val = _lexer.peekToken();
            if (val.type == TokenType::EndOfFile)
                break;
            if (val.type == TokenType::Delimiter && val.text == ">>")
            {
                // key without value
                dict->entries[key.text] = std::make_shared<PdfNull>();
                continue;
            }
            _lexer.nextToken();

            PdfObjectPtr v = parseObjectFrom(val);
            if (v)
                dict->entries[key.text] = v;
        }

        return dict;
    }

    std::shared_ptr<PdfStream> PdfParser::parseStream(std::shared_ptr<PdfDictionary> dict)
    {
        // "stream" is followed by CRLF or LF (some writers use a bare CR)
        size_t pos = _lexer.getPosition();
        while (pos < _data.size() && (_data[pos] == ' ' || _data[pos] == '\t'))
            ++pos;
        if (pos < _data.size() && _data[pos] == '\r')
            ++pos;
        if (pos < _data.size() && _data[pos] == '\n')
            ++pos;

        size_t length = 0;
        bool haveLength = false;
        double lenValue = 0;
        if (AsNumber(dict->get("/Length"), lenValue) && lenValue >= 0)
        {
            length = static_cast<size_t>(lenValue);
            haveLength = true;
        }

        size_t endPos = 0;
        bool trusted = false;

        if (haveLength && pos + length <= _data.size())
        {
            // trust /Length only when endstream follows it
            size_t check = pos + length;
            while (check < _data.size() && IsPdfWhitespace(_data[check]))
                ++check;
            if (matchesAt(_data, check, "endstream"))
            {
                endPos = pos + length;
                trusted = true;
            }
        }

        if (!trusted)
        {
            static const char marker[] = "endstream";
            auto it = std::search(_data.begin() + pos, _data.end(),
                marker, marker + sizeof(marker) - 1);
            endPos = static_cast<size_t>(it - _data.begin());

            // the EOL before endstream is not data
            size_t trimmed = endPos;
            if (trimmed > pos && _data[trimmed - 1] == '\n')
                --trimmed;
            if (trimmed > pos && _data[trimmed - 1] == '\r')
                --trimmed;
            if (it != _data.end())
            {
                _lexer.setPosition(endPos);
                endPos = trimmed;
            }
            else
            {
                _lexer.setPosition(_data.size());
            }
        }
        else
        {
            _lexer.setPosition(endPos);
        }

        std::vector<uint8_t> bytes;
        if (endPos > pos)
            bytes.assign(_data.begin() + pos, _data.begin() + endPos);

        Token end = _lexer.peekToken();
        if (end.type == TokenType::Keyword && end.text == "endstream")
            _lexer.nextToken();

        return std::make_shared<PdfStream>(dict, std::move(bytes));
    }

    const std::map<int, PdfObjectPtr>& PdfParser::objects() const
    {
        return _objects;
    }

    PdfObjectPtr PdfParser::parseObjectAt(size_t offset)
    {
        _lexer.setPosition(offset);
        _depth = 0;

        Token t1 = _lexer.nextToken();
        if (isInteger(t1))
        {
            size_t afterFirst = _lexer.getPosition();
            Token t2 = _lexer.nextToken();
            if (isInteger(t2))
            {
                Token t3 = _lexer.nextToken();
                if (t3.type == TokenType::Keyword && t3.text == "obj")
                    return parseNextObject();
            }
            _lexer.setPosition(afterFirst);
        }
        return parseObjectFrom(t1);
    }
}
