#pragma once

#include <map>
#include <memory>
#include <vector>
#include "PdfObject.h"
#include "PdfLexer.h"

namespace pdfraster
{
    class PdfParser
    {
    public:
        explicit PdfParser(const std::vector<uint8_t>& data);

        // Recovery scan: walks the whole buffer looking for "N G obj"
        // markers. Later definitions of the same number win.
        bool parse();
        const std::map<int, PdfObjectPtr>& objects() const;

        // Parses "N G obj <value>" (or a bare value) starting at offset
        PdfObjectPtr parseObjectAt(size_t offset);

        // Parses one value at the lexer position; null at end of data
        PdfObjectPtr parseNextObject();

        // Continues a value whose first token was already read
        PdfObjectPtr parseObjectFrom(const Token& first);

        PdfLexer& lexer() { return _lexer; }

        static constexpr int MAX_NESTING = 256;

    private:
        const std::vector<uint8_t>& _data;
        PdfLexer _lexer;
        std::map<int, PdfObjectPtr> _objects;
        int _depth = 0;

        PdfObjectPtr parseAtomicObject(const Token& tok);
        PdfObjectPtr parseNumberOrReference(const Token& tok);

        std::shared_ptr<PdfArray> parseArray();
        std::shared_ptr<PdfDictionary> parseDictionary();
        std::shared_ptr<PdfStream> parseStream(std::shared_ptr<PdfDictionary> dict);
    };
}
