#include "PdfLexer.h"
#include "PdfDebug.h"
#include <cctype>

namespace pdfraster
{
    namespace
    {
        int hexValue(unsigned char ch)
        {
            if (ch >= '0' && ch <= '9') return ch - '0';
            if (ch >= 'A' && ch <= 'F') return 10 + ch - 'A';
            if (ch >= 'a' && ch <= 'f') return 10 + ch - 'a';
            return -1;
        }
    }

    PdfLexer::PdfLexer(const std::vector<uint8_t>& data)
        : _data(data)
        , _pos(0)
        , _hasPeek(false)
    {
    }

    void PdfLexer::setPosition(size_t pos)
    {
        _pos = pos > _data.size() ? _data.size() : pos;
        _hasPeek = false;
    }

    void PdfLexer::skipWhitespace()
    {
        while (_pos < _data.size())
        {
            unsigned char c = _data[_pos];
            if (c == '%')
            {
                // comment runs to end of line
                while (_pos < _data.size() && _data[_pos] != '\n' && _data[_pos] != '\r')
                    ++_pos;
            }
            else if (IsPdfWhitespace(c))
            {
                ++_pos;
            }
            else
            {
                break;
            }
        }
    }

    Token PdfLexer::peekToken()
    {
        if (_hasPeek)
            return _peekToken;

        _peekToken = nextToken();
        _hasPeek = true;
        return _peekToken;
    }

    Token PdfLexer::nextToken()
    {
        if (_hasPeek)
        {
            _hasPeek = false;
            return _peekToken;
        }

        skipWhitespace();

        Token tok{};
        if (_pos >= _data.size())
            return tok;

        unsigned char c = _data[_pos];

        if (std::isdigit(c) || c == '+' || c == '-' || c == '.')
            return readNumber();

        if (c == '/')
            return readName();

        if (c == '(')
            return readString();

        return readKeywordOrDelimiter();
    }

    Token PdfLexer::readNumber()
    {
        Token tok;
        tok.type = TokenType::Number;

        // Numbers are never this long in a sane file
        size_t limit = 0;

        unsigned char c = _data[_pos];
        if (c == '+' || c == '-')
        {
            tok.text.push_back(static_cast<char>(c));
            ++_pos;
            // "--5" style garbage from broken producers
            while (_pos < _data.size() && (_data[_pos] == '-' || _data[_pos] == '+'))
                ++_pos;
        }

        bool seenDot = false;
        while (_pos < _data.size() && limit++ < 255)
        {
            c = _data[_pos];
            if (std::isdigit(c))
            {
                tok.text.push_back(static_cast<char>(c));
                ++_pos;
            }
            else if (c == '.' && !seenDot)
            {
                seenDot = true;
                tok.text.push_back('.');
                ++_pos;
            }
            else
            {
                break;
            }
        }

        return tok;
    }

    Token PdfLexer::readName()
    {
        Token tok;
        tok.type = TokenType::Name;
        tok.text.push_back('/');
        ++_pos;

        size_t limit = 0;
        while (_pos < _data.size() && limit++ < 1024)
        {
            unsigned char c = _data[_pos];
            if (IsPdfWhitespace(c) || IsPdfDelimiter(c))
                break;

            // #xx escape
            if (c == '#' && _pos + 2 < _data.size())
            {
                int hi = hexValue(_data[_pos + 1]);
                int lo = hexValue(_data[_pos + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    tok.text.push_back(static_cast<char>((hi << 4) | lo));
                    _pos += 3;
                    continue;
                }
            }

            tok.text.push_back(static_cast<char>(c));
            ++_pos;
        }

        return tok;
    }

    Token PdfLexer::readString()
    {
        Token tok;
        tok.type = TokenType::String;
        std::string& s = tok.text;

        ++_pos;
        int depth = 1;

        const size_t MAX_STRING_LEN = 1 << 20;

        while (_pos < _data.size() && depth > 0)
        {
            if (s.size() > MAX_STRING_LEN)
            {
                LogDebug("PdfLexer: string literal exceeds %zu bytes, truncating", MAX_STRING_LEN);
                break;
            }

            char c = static_cast<char>(_data[_pos++]);

            if (c == '\\')
            {
                if (_pos >= _data.size())
                    break;

                char n = static_cast<char>(_data[_pos]);
                if (n >= '0' && n <= '7')
                {
                    // \ddd, one to three octal digits
                    int value = 0;
                    int digits = 0;
                    while (_pos < _data.size() && digits < 3)
                    {
                        char d = static_cast<char>(_data[_pos]);
                        if (d < '0' || d > '7')
                            break;
                        value = value * 8 + (d - '0');
                        ++_pos;
                        ++digits;
                    }
                    s.push_back(static_cast<char>(value & 0xFF));
                    continue;
                }

                ++_pos;
                switch (n)
                {
                case 'n': s.push_back('\n'); break;
                case 'r': s.push_back('\r'); break;
                case 't': s.push_back('\t'); break;
                case 'b': s.push_back('\b'); break;
                case 'f': s.push_back('\f'); break;
                case '\r':
                    // line continuation
                    if (_pos < _data.size() && _data[_pos] == '\n')
                        ++_pos;
                    break;
                case '\n':
                    break;
                default:
                    // \\ \( \) and unknown escapes keep the character
                    s.push_back(n);
                    break;
                }
            }
            else if (c == '(')
            {
                depth++;
                s.push_back(c);
            }
            else if (c == ')')
            {
                depth--;
                if (depth > 0)
                    s.push_back(c);
            }
            else
            {
                s.push_back(c);
            }
        }

        return tok;
    }

    // <48656C6C6F> -> "Hello"
    Token PdfLexer::readHexString()
    {
        Token tok;
        tok.type = TokenType::HexString;

        ++_pos; // '<'

        int pending = -1;
        while (_pos < _data.size())
        {
            unsigned char c = _data[_pos++];
            if (c == '>')
                break;

            int v = hexValue(c);
            if (v < 0)
                continue; // whitespace and junk are ignored

            if (pending < 0)
            {
                pending = v;
            }
            else
            {
                tok.text.push_back(static_cast<char>((pending << 4) | v));
                pending = -1;
            }
        }

        // odd digit count: final digit is followed by an implied 0
        if (pending >= 0)
            tok.text.push_back(static_cast<char>(pending << 4));

        return tok;
    }

    Token PdfLexer::readKeywordOrDelimiter()
    {
        Token tok;
        unsigned char c = _data[_pos];

        if (c == '<')
        {
            if (_pos + 1 < _data.size() && _data[_pos + 1] == '<')
            {
                tok.type = TokenType::Delimiter;
                tok.text = "<<";
                _pos += 2;
                return tok;
            }
            return readHexString();
        }

        if (c == '>')
        {
            tok.type = TokenType::Delimiter;
            if (_pos + 1 < _data.size() && _data[_pos + 1] == '>')
            {
                tok.text = ">>";
                _pos += 2;
            }
            else
            {
                tok.text = ">";
                ++_pos;
            }
            return tok;
        }

        if (c == '[' || c == ']' || c == '{' || c == '}' || c == ')')
        {
            tok.type = TokenType::Delimiter;
            tok.text = std::string(1, static_cast<char>(c));
            ++_pos;
            return tok;
        }

        tok.type = TokenType::Keyword;
        size_t limit = 0;
        while (_pos < _data.size() && limit++ < 255)
        {
            c = _data[_pos];
            if (IsPdfWhitespace(c) || IsPdfDelimiter(c))
                break;
            tok.text.push_back(static_cast<char>(c));
            ++_pos;
        }

        return tok;
    }
}
