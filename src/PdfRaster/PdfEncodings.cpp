#include "PdfEncodings.h"

#include <array>
#include <cstdlib>
#include <unordered_map>

namespace pdfraster
{
    namespace
    {
        struct CodeName
        {
            uint8_t code;
            const char* name;
        };

        using EncodingTable = std::array<const char*, 256>;

        // 32..126 shared by every Latin table apart from two codes
        void fillAscii(EncodingTable& t, const char* code39, const char* code96)
        {
            static const char* ascii[] = {
                "space", "exclam", "quotedbl", "numbersign", "dollar", "percent", "ampersand", nullptr,
                "parenleft", "parenright", "asterisk", "plus", "comma", "hyphen", "period", "slash",
                "zero", "one", "two", "three", "four", "five", "six", "seven",
                "eight", "nine", "colon", "semicolon", "less", "equal", "greater", "question",
                "at", "A", "B", "C", "D", "E", "F", "G",
                "H", "I", "J", "K", "L", "M", "N", "O",
                "P", "Q", "R", "S", "T", "U", "V", "W",
                "X", "Y", "Z", "bracketleft", "backslash", "bracketright", "asciicircum", "underscore",
                nullptr, "a", "b", "c", "d", "e", "f", "g",
                "h", "i", "j", "k", "l", "m", "n", "o",
                "p", "q", "r", "s", "t", "u", "v", "w",
                "x", "y", "z", "braceleft", "bar", "braceright", "asciitilde"
            };
            for (int i = 0; i < 95; ++i)
                t[32 + i] = ascii[i];
            t[39] = code39;
            t[96] = code96;
        }

        EncodingTable buildTable(const char* code39, const char* code96,
            const CodeName* high, size_t count)
        {
            EncodingTable t{};
            fillAscii(t, code39, code96);
            for (size_t i = 0; i < count; ++i)
                t[high[i].code] = high[i].name;
            return t;
        }

        const CodeName kStandardHigh[] = {
            { 161, "exclamdown" }, { 162, "cent" }, { 163, "sterling" }, { 164, "fraction" },
            { 165, "yen" }, { 166, "florin" }, { 167, "section" }, { 168, "currency" },
            { 169, "quotesingle" }, { 170, "quotedblleft" }, { 171, "guillemotleft" },
            { 172, "guilsinglleft" }, { 173, "guilsinglright" }, { 174, "fi" }, { 175, "fl" },
            { 177, "endash" }, { 178, "dagger" }, { 179, "daggerdbl" }, { 180, "periodcentered" },
            { 182, "paragraph" }, { 183, "bullet" }, { 184, "quotesinglbase" },
            { 185, "quotedblbase" }, { 186, "quotedblright" }, { 187, "guillemotright" },
            { 188, "ellipsis" }, { 189, "perthousand" }, { 191, "questiondown" },
            { 193, "grave" }, { 194, "acute" }, { 195, "circumflex" }, { 196, "tilde" },
            { 197, "macron" }, { 198, "breve" }, { 199, "dotaccent" }, { 200, "dieresis" },
            { 202, "ring" }, { 203, "cedilla" }, { 205, "hungarumlaut" }, { 206, "ogonek" },
            { 207, "caron" }, { 208, "emdash" }, { 225, "AE" }, { 227, "ordfeminine" },
            { 232, "Lslash" }, { 233, "Oslash" }, { 234, "OE" }, { 235, "ordmasculine" },
            { 241, "ae" }, { 245, "dotlessi" }, { 248, "lslash" }, { 249, "oslash" },
            { 250, "oe" }, { 251, "germandbls" },
        };

        const CodeName kWinAnsiHigh[] = {
            { 128, "Euro" }, { 130, "quotesinglbase" }, { 131, "florin" }, { 132, "quotedblbase" },
            { 133, "ellipsis" }, { 134, "dagger" }, { 135, "daggerdbl" }, { 136, "circumflex" },
            { 137, "perthousand" }, { 138, "Scaron" }, { 139, "guilsinglleft" }, { 140, "OE" },
            { 142, "Zcaron" }, { 145, "quoteleft" }, { 146, "quoteright" }, { 147, "quotedblleft" },
            { 148, "quotedblright" }, { 149, "bullet" }, { 150, "endash" }, { 151, "emdash" },
            { 152, "tilde" }, { 153, "trademark" }, { 154, "scaron" }, { 155, "guilsinglright" },
            { 156, "oe" }, { 158, "zcaron" }, { 159, "Ydieresis" }, { 160, "space" },
            { 161, "exclamdown" }, { 162, "cent" }, { 163, "sterling" }, { 164, "currency" },
            { 165, "yen" }, { 166, "brokenbar" }, { 167, "section" }, { 168, "dieresis" },
            { 169, "copyright" }, { 170, "ordfeminine" }, { 171, "guillemotleft" },
            { 172, "logicalnot" }, { 173, "hyphen" }, { 174, "registered" }, { 175, "macron" },
            { 176, "degree" }, { 177, "plusminus" }, { 178, "twosuperior" }, { 179, "threesuperior" },
            { 180, "acute" }, { 181, "mu" }, { 182, "paragraph" }, { 183, "periodcentered" },
            { 184, "cedilla" }, { 185, "onesuperior" }, { 186, "ordmasculine" },
            { 187, "guillemotright" }, { 188, "onequarter" }, { 189, "onehalf" },
            { 190, "threequarters" }, { 191, "questiondown" }, { 192, "Agrave" }, { 193, "Aacute" },
            { 194, "Acircumflex" }, { 195, "Atilde" }, { 196, "Adieresis" }, { 197, "Aring" },
            { 198, "AE" }, { 199, "Ccedilla" }, { 200, "Egrave" }, { 201, "Eacute" },
            { 202, "Ecircumflex" }, { 203, "Edieresis" }, { 204, "Igrave" }, { 205, "Iacute" },
            { 206, "Icircumflex" }, { 207, "Idieresis" }, { 208, "Eth" }, { 209, "Ntilde" },
            { 210, "Ograve" }, { 211, "Oacute" }, { 212, "Ocircumflex" }, { 213, "Otilde" },
            { 214, "Odieresis" }, { 215, "multiply" }, { 216, "Oslash" }, { 217, "Ugrave" },
            { 218, "Uacute" }, { 219, "Ucircumflex" }, { 220, "Udieresis" }, { 221, "Yacute" },
            { 222, "Thorn" }, { 223, "germandbls" }, { 224, "agrave" }, { 225, "aacute" },
            { 226, "acircumflex" }, { 227, "atilde" }, { 228, "adieresis" }, { 229, "aring" },
            { 230, "ae" }, { 231, "ccedilla" }, { 232, "egrave" }, { 233, "eacute" },
            { 234, "ecircumflex" }, { 235, "edieresis" }, { 236, "igrave" }, { 237, "iacute" },
            { 238, "icircumflex" }, { 239, "idieresis" }, { 240, "eth" }, { 241, "ntilde" },
            { 242, "ograve" }, { 243, "oacute" }, { 244, "ocircumflex" }, { 245, "otilde" },
            { 246, "odieresis" }, { 247, "divide" }, { 248, "oslash" }, { 249, "ugrave" },
            { 250, "uacute" }, { 251, "ucircumflex" }, { 252, "udieresis" }, { 253, "yacute" },
            { 254, "thorn" }, { 255, "ydieresis" },
        };

        const CodeName kMacRomanHigh[] = {
            { 128, "Adieresis" }, { 129, "Aring" }, { 130, "Ccedilla" }, { 131, "Eacute" },
            { 132, "Ntilde" }, { 133, "Odieresis" }, { 134, "Udieresis" }, { 135, "aacute" },
            { 136, "agrave" }, { 137, "acircumflex" }, { 138, "adieresis" }, { 139, "atilde" },
            { 140, "aring" }, { 141, "ccedilla" }, { 142, "eacute" }, { 143, "egrave" },
            { 144, "ecircumflex" }, { 145, "edieresis" }, { 146, "iacute" }, { 147, "igrave" },
            { 148, "icircumflex" }, { 149, "idieresis" }, { 150, "ntilde" }, { 151, "oacute" },
            { 152, "ograve" }, { 153, "ocircumflex" }, { 154, "odieresis" }, { 155, "otilde" },
            { 156, "uacute" }, { 157, "ugrave" }, { 158, "ucircumflex" }, { 159, "udieresis" },
            { 160, "dagger" }, { 161, "degree" }, { 162, "cent" }, { 163, "sterling" },
            { 164, "section" }, { 165, "bullet" }, { 166, "paragraph" }, { 167, "germandbls" },
            { 168, "registered" }, { 169, "copyright" }, { 170, "trademark" }, { 171, "acute" },
            { 172, "dieresis" }, { 174, "AE" }, { 175, "Oslash" }, { 177, "plusminus" },
            { 180, "yen" }, { 181, "mu" }, { 187, "ordfeminine" }, { 188, "ordmasculine" },
            { 190, "ae" }, { 191, "oslash" }, { 192, "questiondown" }, { 193, "exclamdown" },
            { 194, "logicalnot" }, { 196, "florin" }, { 199, "guillemotleft" },
            { 200, "guillemotright" }, { 201, "ellipsis" }, { 202, "space" }, { 203, "Agrave" },
            { 204, "Atilde" }, { 205, "Otilde" }, { 206, "OE" }, { 207, "oe" }, { 208, "endash" },
            { 209, "emdash" }, { 210, "quotedblleft" }, { 211, "quotedblright" },
            { 212, "quoteleft" }, { 213, "quoteright" }, { 214, "divide" }, { 216, "ydieresis" },
            { 217, "Ydieresis" }, { 218, "fraction" }, { 219, "currency" }, { 220, "guilsinglleft" },
            { 221, "guilsinglright" }, { 222, "fi" }, { 223, "fl" }, { 224, "daggerdbl" },
            { 225, "periodcentered" }, { 226, "quotesinglbase" }, { 227, "quotedblbase" },
            { 228, "perthousand" }, { 229, "Acircumflex" }, { 230, "Ecircumflex" }, { 231, "Aacute" },
            { 232, "Edieresis" }, { 233, "Egrave" }, { 234, "Iacute" }, { 235, "Icircumflex" },
            { 236, "Idieresis" }, { 237, "Igrave" }, { 238, "Oacute" }, { 239, "Ocircumflex" },
            { 241, "Ograve" }, { 242, "Uacute" }, { 243, "Ucircumflex" }, { 244, "Ugrave" },
            { 245, "dotlessi" }, { 246, "circumflex" }, { 247, "tilde" }, { 248, "macron" },
            { 249, "breve" }, { 250, "dotaccent" }, { 251, "ring" }, { 252, "cedilla" },
            { 253, "hungarumlaut" }, { 254, "ogonek" }, { 255, "caron" },
        };

        template <size_t N>
        EncodingTable makeTable(const char* code39, const char* code96, const CodeName (&high)[N])
        {
            return buildTable(code39, code96, high, N);
        }

        const EncodingTable& standardTable()
        {
            static const EncodingTable t = makeTable("quoteright", "quoteleft", kStandardHigh);
            return t;
        }

        const EncodingTable& winAnsiTable()
        {
            static const EncodingTable t = makeTable("quotesingle", "grave", kWinAnsiHigh);
            return t;
        }

        const EncodingTable& macRomanTable()
        {
            static const EncodingTable t = makeTable("quotesingle", "grave", kMacRomanHigh);
            return t;
        }

        // CP1252 code points for 0x80..0x9F
        const uint16_t kWinAnsiC1[32] = {
            0x20AC, 0, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
            0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0, 0x017D, 0,
            0, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
            0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0, 0x017E, 0x0178
        };

        const std::unordered_map<std::string, uint32_t>& glyphUnicodeMap()
        {
            static const std::unordered_map<std::string, uint32_t> map = [] {
                std::unordered_map<std::string, uint32_t> m;
                const EncodingTable& win = winAnsiTable();
                for (int code = 32; code < 256; ++code)
                {
                    if (!win[code])
                        continue;
                    uint32_t uni = code >= 0x80 && code < 0xA0 ? kWinAnsiC1[code - 0x80] : static_cast<uint32_t>(code);
                    if (uni)
                        m.emplace(win[code], uni);
                }

                static const struct { const char* name; uint32_t uni; } extra[] = {
                    { "quoteright", 0x2019 }, { "quoteleft", 0x2018 }, { "fi", 0xFB01 },
                    { "fl", 0xFB02 }, { "fraction", 0x2044 }, { "dotlessi", 0x0131 },
                    { "Lslash", 0x0141 }, { "lslash", 0x0142 }, { "breve", 0x02D8 },
                    { "dotaccent", 0x02D9 }, { "ring", 0x02DA }, { "ogonek", 0x02DB },
                    { "caron", 0x02C7 }, { "hungarumlaut", 0x02DD }, { "minus", 0x2212 },
                    { "notequal", 0x2260 }, { "infinity", 0x221E }, { "lessequal", 0x2264 },
                    { "greaterequal", 0x2265 }, { "partialdiff", 0x2202 }, { "summation", 0x2211 },
                    { "product", 0x220F }, { "pi", 0x03C0 }, { "integral", 0x222B },
                    { "Omega", 0x2126 }, { "radical", 0x221A }, { "approxequal", 0x2248 },
                    { "Delta", 0x2206 }, { "lozenge", 0x25CA }, { "Gbreve", 0x011E },
                    { "gbreve", 0x011F }, { "Scedilla", 0x015E }, { "scedilla", 0x015F },
                    { "Idotaccent", 0x0130 }, { "nbspace", 0x00A0 }, { "sfthyphen", 0x00AD },
                    { "ff", 0xFB00 }, { "ffi", 0xFB03 }, { "ffl", 0xFB04 }, { "apple", 0xF8FF },
                };
                for (const auto& e : extra)
                    m.emplace(e.name, e.uni);
                return m;
            }();
            return map;
        }

        bool parseHex(const std::string& s, size_t from, size_t len, uint32_t& out)
        {
            if (from + len > s.size() || len == 0)
                return false;
            out = 0;
            for (size_t i = from; i < from + len; ++i)
            {
                char c = s[i];
                uint32_t v;
                if (c >= '0' && c <= '9') v = c - '0';
                else if (c >= 'A' && c <= 'F') v = c - 'A' + 10;
                else if (c >= 'a' && c <= 'f') v = c - 'a' + 10;
                else return false;
                out = (out << 4) | v;
            }
            return true;
        }
    }

    bool BaseEncodingFromName(const std::string& name, PdfBaseEncoding& out)
    {
        if (name == "/StandardEncoding" || name == "/MacExpertEncoding")
            out = PdfBaseEncoding::Standard;
        else if (name == "/WinAnsiEncoding")
            out = PdfBaseEncoding::WinAnsi;
        else if (name == "/MacRomanEncoding")
            out = PdfBaseEncoding::MacRoman;
        else
            return false;
        return true;
    }

    const char* EncodingGlyphName(PdfBaseEncoding encoding, uint8_t code)
    {
        switch (encoding)
        {
        case PdfBaseEncoding::Standard: return standardTable()[code];
        case PdfBaseEncoding::WinAnsi: return winAnsiTable()[code];
        case PdfBaseEncoding::MacRoman: return macRomanTable()[code];
        case PdfBaseEncoding::Builtin: return nullptr;
        }
        return nullptr;
    }

    uint32_t GlyphNameToUnicode(const std::string& nameIn)
    {
        std::string name = (!nameIn.empty() && nameIn[0] == '/') ? nameIn.substr(1) : nameIn;

        // "a.sc", "f_i.alt": the part before the first dot decides
        size_t dot = name.find('.');
        if (dot != std::string::npos && dot > 0)
            name = name.substr(0, dot);

        const auto& map = glyphUnicodeMap();
        auto it = map.find(name);
        if (it != map.end())
            return it->second;

        uint32_t uni = 0;
        if (name.size() == 7 && name.compare(0, 3, "uni") == 0 && parseHex(name, 3, 4, uni))
            return uni;
        if (name.size() >= 5 && name.size() <= 7 && name[0] == 'u' && parseHex(name, 1, name.size() - 1, uni))
            return uni;
        return 0;
    }
}
