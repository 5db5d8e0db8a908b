#pragma once
#include <cstdint>
#include <string>

namespace pdfraster
{
    enum class PdfBaseEncoding
    {
        Builtin,
        Standard,
        WinAnsi,
        MacRoman
    };

    // "/WinAnsiEncoding" etc. MacExpertEncoding maps to Standard.
    bool BaseEncodingFromName(const std::string& name, PdfBaseEncoding& out);

    // Glyph name for a single-byte code, or nullptr where the table has
    // none. Builtin has no table.
    const char* EncodingGlyphName(PdfBaseEncoding encoding, uint8_t code);

    // Adobe glyph list subset plus "uniXXXX" and "uXXXX" forms; 0 when
    // the name is unknown
    uint32_t GlyphNameToUnicode(const std::string& name);
}
