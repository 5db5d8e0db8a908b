#pragma once

#include <vector>
#include <string>
#include <cstdint>

namespace pdfraster
{
    enum class TokenType
    {
        EndOfFile,
        Number,
        String,
        HexString,
        Name,
        Keyword,
        Delimiter
    };

    struct Token
    {
        TokenType type{ TokenType::EndOfFile };
        std::string text;
    };

    inline bool IsPdfWhitespace(unsigned char c)
    {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\0';
    }

    inline bool IsPdfDelimiter(unsigned char c)
    {
        return c == '(' || c == ')' || c == '<' || c == '>' || c == '[' || c == ']' ||
            c == '{' || c == '}' || c == '/' || c == '%';
    }

    // Tokenizer shared by the file parser and the content stream reader
    class PdfLexer
    {
    public:
        explicit PdfLexer(const std::vector<uint8_t>& data);

        Token nextToken();
        Token peekToken();

        void setPosition(size_t pos);
        size_t getPosition() const { return _pos; }
        const std::vector<uint8_t>& data() const { return _data; }

    private:
        const std::vector<uint8_t>& _data;
        size_t _pos{ 0 };

        bool _hasPeek{ false };
        Token _peekToken;

        void skipWhitespace();
        Token readNumber();
        Token readName();
        Token readString();
        Token readHexString();
        Token readKeywordOrDelimiter();
    };
}
