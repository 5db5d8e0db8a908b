#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "PdfObject.h"

namespace pdfraster
{
    class PdfDocument;

    class PdfCMap;
    using PdfCMapPtr = std::shared_ptr<const PdfCMap>;

    // Character code to CID mapping of a composite font
    class PdfCMap
    {
    public:
        // Identity-H / Identity-V: two-byte codes, CID = code
        static PdfCMapPtr Identity(bool vertical);

        // /Encoding of a Type0 font: a predefined name or an embedded
        // CMap stream. Only the Identity names are predefined.
        static PdfCMapPtr Parse(const PdfDocument& doc, const PdfObjectPtr& encoding, std::string& why);

        // Parses CMap program text; parent handles usecmap
        static PdfCMapPtr FromProgram(const std::vector<uint8_t>& program, const PdfCMapPtr& parent);

        // Reads one code at pos using the codespace ranges. Returns the
        // number of bytes consumed, never 0 while pos < s.size().
        size_t readCode(const std::string& s, size_t pos, uint32_t& code) const;

        // False for a code no range maps (an undefined CID)
        bool lookup(uint32_t code, size_t bytes, uint32_t& cid) const;

        bool isVertical() const { return _vertical; }

        static constexpr int MAX_USECMAP_DEPTH = 8;

    private:
        struct Codespace
        {
            size_t bytes;
            uint32_t lo;
            uint32_t hi;
        };

        struct Range
        {
            size_t bytes;
            uint32_t lo;
            uint32_t hi;
            uint32_t cid;
        };

        std::vector<Codespace> _codespaces;
        std::vector<Range> _ranges;
        PdfCMapPtr _parent;
        bool _identity = false;
        bool _vertical = false;

        bool inCodespace(uint32_t code, size_t bytes) const;
    };
}
