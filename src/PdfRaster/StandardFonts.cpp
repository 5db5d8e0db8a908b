#include "StandardFonts.h"

#include <unordered_map>

namespace pdfraster
{
    namespace
    {
        // Widths for codes 32..126 in WinAnsi naming order
        const short kHelvetica[95] = {
            278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
            556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
            1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
            667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
            333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
            556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584
        };

        const short kHelveticaBold[95] = {
            278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
            556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333, 584, 584, 584, 611,
            975, 722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833, 722, 778,
            667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 333, 278, 333, 584, 556,
            333, 556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889, 611, 611,
            611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584
        };

        const short kTimesRoman[95] = {
            250, 333, 408, 500, 500, 833, 778, 180, 333, 333, 500, 564, 250, 333, 250, 278,
            500, 500, 500, 500, 500, 500, 500, 500, 500, 500, 278, 278, 564, 564, 564, 444,
            921, 722, 667, 667, 722, 611, 556, 722, 722, 333, 389, 722, 611, 889, 722, 722,
            556, 722, 667, 556, 611, 722, 722, 944, 722, 722, 611, 333, 278, 333, 469, 500,
            333, 444, 500, 444, 500, 444, 333, 500, 500, 278, 278, 500, 278, 778, 500, 500,
            500, 500, 333, 389, 278, 500, 500, 722, 500, 500, 444, 480, 200, 480, 541
        };

        const short kTimesBold[95] = {
            250, 333, 555, 500, 500, 1000, 833, 278, 333, 333, 500, 570, 250, 333, 250, 278,
            500, 500, 500, 500, 500, 500, 500, 500, 500, 500, 333, 333, 570, 570, 570, 500,
            930, 722, 667, 722, 722, 667, 611, 778, 778, 389, 500, 778, 667, 944, 722, 778,
            611, 778, 722, 556, 667, 722, 722, 1000, 722, 722, 667, 333, 278, 333, 581, 500,
            333, 500, 556, 444, 556, 444, 333, 500, 556, 278, 333, 556, 278, 833, 556, 500,
            556, 556, 444, 389, 333, 556, 500, 722, 500, 500, 444, 394, 220, 394, 520
        };

        const char* const kAsciiNames[95] = {
            "space", "exclam", "quotedbl", "numbersign", "dollar", "percent", "ampersand", "quotesingle",
            "parenleft", "parenright", "asterisk", "plus", "comma", "hyphen", "period", "slash",
            "zero", "one", "two", "three", "four", "five", "six", "seven",
            "eight", "nine", "colon", "semicolon", "less", "equal", "greater", "question",
            "at", "A", "B", "C", "D", "E", "F", "G",
            "H", "I", "J", "K", "L", "M", "N", "O",
            "P", "Q", "R", "S", "T", "U", "V", "W",
            "X", "Y", "Z", "bracketleft", "backslash", "bracketright", "asciicircum", "underscore",
            "grave", "a", "b", "c", "d", "e", "f", "g",
            "h", "i", "j", "k", "l", "m", "n", "o",
            "p", "q", "r", "s", "t", "u", "v", "w",
            "x", "y", "z", "braceleft", "bar", "braceright", "asciitilde"
        };

        struct FamilyMetrics
        {
            const short* ascii;
            short quoteright;
            short quoteleft;
            short bullet;
            short endash;
            short emdash;
            short quotedbl; // curly double quotes
            short missing;
        };

        const FamilyMetrics* metricsFor(StandardFamily family)
        {
            static const FamilyMetrics helvetica{ kHelvetica, 222, 222, 350, 556, 1000, 333, 556 };
            static const FamilyMetrics helveticaBold{ kHelveticaBold, 278, 278, 350, 556, 1000, 500, 556 };
            static const FamilyMetrics times{ kTimesRoman, 333, 333, 350, 500, 1000, 444, 500 };
            static const FamilyMetrics timesBold{ kTimesBold, 333, 333, 350, 500, 1000, 500, 500 };

            switch (family)
            {
            case StandardFamily::Helvetica: return &helvetica;
            case StandardFamily::HelveticaBold: return &helveticaBold;
            case StandardFamily::TimesRoman: return &times;
            case StandardFamily::TimesBold: return &timesBold;
            default: return nullptr;
            }
        }

        const std::unordered_map<std::string, int>& asciiIndex()
        {
            static const std::unordered_map<std::string, int> index = [] {
                std::unordered_map<std::string, int> m;
                for (int i = 0; i < 95; ++i)
                    m.emplace(kAsciiNames[i], i);
                return m;
            }();
            return index;
        }

        bool contains(const std::string& s, const char* part)
        {
            return s.find(part) != std::string::npos;
        }

        // "Aacute" -> "A", "ccedilla" -> "c"
        bool accentedBase(const std::string& name, std::string& base)
        {
            static const char* accents[] = {
                "acute", "grave", "circumflex", "dieresis", "tilde", "ring", "cedilla", "caron", "breve"
            };
            if (name.size() < 2)
                return false;
            std::string rest = name.substr(1);
            for (const char* a : accents)
            {
                if (rest == a)
                {
                    base = name.substr(0, 1);
                    return true;
                }
            }
            return false;
        }
    }

    std::string StripSubsetPrefix(const std::string& baseFont)
    {
        std::string name = (!baseFont.empty() && baseFont[0] == '/') ? baseFont.substr(1) : baseFont;
        size_t plus = name.find('+');
        if (plus == 6)
            name = name.substr(plus + 1);
        return name;
    }

    StandardFamily StandardFamilyOf(const std::string& baseFont)
    {
        std::string name = StripSubsetPrefix(baseFont);
        bool bold = contains(name, "Bold") || contains(name, "Black") || contains(name, "Heavy");

        if (contains(name, "Courier"))
            return StandardFamily::Courier;
        if (contains(name, "Symbol"))
            return StandardFamily::Symbol;
        if (contains(name, "ZapfDingbats") || contains(name, "Dingbats"))
            return StandardFamily::ZapfDingbats;
        if (contains(name, "Helvetica") || contains(name, "Arial"))
            return bold ? StandardFamily::HelveticaBold : StandardFamily::Helvetica;
        if (contains(name, "Times"))
            return bold ? StandardFamily::TimesBold : StandardFamily::TimesRoman;
        return StandardFamily::None;
    }

    bool IsStandard14(const std::string& baseFont)
    {
        static const char* names[] = {
            "Helvetica", "Helvetica-Bold", "Helvetica-Oblique", "Helvetica-BoldOblique",
            "Times-Roman", "Times-Bold", "Times-Italic", "Times-BoldItalic",
            "Courier", "Courier-Bold", "Courier-Oblique", "Courier-BoldOblique",
            "Symbol", "ZapfDingbats"
        };
        std::string name = StripSubsetPrefix(baseFont);
        for (const char* n : names)
        {
            if (name == n)
                return true;
        }
        return false;
    }

    bool StandardGlyphWidth(StandardFamily family, const std::string& glyphNameIn, double& width)
    {
        if (family == StandardFamily::Courier)
        {
            width = 600;
            return true;
        }

        const FamilyMetrics* metrics = metricsFor(family);
        if (!metrics)
            return false;

        std::string glyphName = (!glyphNameIn.empty() && glyphNameIn[0] == '/') ? glyphNameIn.substr(1) : glyphNameIn;

        const auto& index = asciiIndex();
        auto it = index.find(glyphName);
        if (it != index.end())
        {
            width = metrics->ascii[it->second];
            return true;
        }

        std::string base;
        if (accentedBase(glyphName, base))
        {
            it = index.find(base);
            if (it != index.end())
            {
                width = metrics->ascii[it->second];
                return true;
            }
        }

        if (glyphName == "quoteright" || glyphName == "quotesinglbase")
            width = metrics->quoteright;
        else if (glyphName == "quoteleft")
            width = metrics->quoteleft;
        else if (glyphName == "quotedblleft" || glyphName == "quotedblright" || glyphName == "quotedblbase")
            width = metrics->quotedbl;
        else if (glyphName == "bullet")
            width = metrics->bullet;
        else if (glyphName == "endash")
            width = metrics->endash;
        else if (glyphName == "emdash" || glyphName == "ellipsis" || glyphName == "perthousand")
            width = metrics->emdash;
        else
            width = metrics->missing;
        return true;
    }

    std::vector<std::string> SubstituteFontCandidates(const std::string& baseFont,
        const std::string& fontDirectory,
        bool serif,
        bool fixedPitch)
    {
        std::vector<std::string> out;
        std::string name = StripSubsetPrefix(baseFont);
        StandardFamily family = StandardFamilyOf(name);

        bool bold = contains(name, "Bold") || contains(name, "Black");
        bool italic = contains(name, "Italic") || contains(name, "Oblique");

        if (family == StandardFamily::None)
        {
            if (fixedPitch)
                family = StandardFamily::Courier;
            else if (serif)
                family = bold ? StandardFamily::TimesBold : StandardFamily::TimesRoman;
            else
                family = bold ? StandardFamily::HelveticaBold : StandardFamily::Helvetica;
        }

        std::string style = bold && italic ? "BoldItalic" : bold ? "Bold" : italic ? "Italic" : "Regular";

        if (!fontDirectory.empty())
        {
            std::string dir = fontDirectory;
            if (dir.back() != '/')
                dir.push_back('/');

            static const char* extensions[] = { ".ttf", ".otf", ".pfb", ".t1", ".cff" };
            for (const char* ext : extensions)
                out.push_back(dir + name + ext);

            // standard-14 file names as shipped with the usual font packs
            const char* std14 = nullptr;
            switch (family)
            {
            case StandardFamily::Helvetica:
            case StandardFamily::HelveticaBold:
                std14 = "LiberationSans-";
                break;
            case StandardFamily::TimesRoman:
            case StandardFamily::TimesBold:
                std14 = "LiberationSerif-";
                break;
            case StandardFamily::Courier:
                std14 = "LiberationMono-";
                break;
            default:
                break;
            }
            if (std14)
                out.push_back(dir + std14 + style + ".ttf");
            if (family == StandardFamily::Symbol)
                out.push_back(dir + "FoxitSymbol.pfb");
            if (family == StandardFamily::ZapfDingbats)
                out.push_back(dir + "FoxitDingbats.pfb");
        }

        // the built-in minimal substitute set
        const char* liberation = nullptr;
        const char* dejavu = nullptr;
        const char* nimbus = nullptr;
        switch (family)
        {
        case StandardFamily::Helvetica:
        case StandardFamily::HelveticaBold:
            liberation = "LiberationSans-";
            dejavu = bold ? "DejaVuSans-Bold.ttf" : "DejaVuSans.ttf";
            nimbus = bold ? "NimbusSans-Bold.otf" : "NimbusSans-Regular.otf";
            break;
        case StandardFamily::TimesRoman:
        case StandardFamily::TimesBold:
            liberation = "LiberationSerif-";
            dejavu = bold ? "DejaVuSerif-Bold.ttf" : "DejaVuSerif.ttf";
            nimbus = bold ? "NimbusRoman-Bold.otf" : "NimbusRoman-Regular.otf";
            break;
        case StandardFamily::Courier:
            liberation = "LiberationMono-";
            dejavu = bold ? "DejaVuSansMono-Bold.ttf" : "DejaVuSansMono.ttf";
            nimbus = bold ? "NimbusMonoPS-Bold.otf" : "NimbusMonoPS-Regular.otf";
            break;
        default:
            break;
        }

        if (liberation)
        {
            out.push_back(std::string("/usr/share/fonts/truetype/liberation/") + liberation + style + ".ttf");
            out.push_back(std::string("/usr/share/fonts/truetype/liberation2/") + liberation + style + ".ttf");
            out.push_back(std::string("/usr/share/fonts/liberation/") + liberation + style + ".ttf");
        }
        if (nimbus)
            out.push_back(std::string("/usr/share/fonts/opentype/urw-base35/") + nimbus);
        if (dejavu)
        {
            out.push_back(std::string("/usr/share/fonts/truetype/dejavu/") + dejavu);
            out.push_back(std::string("/usr/share/fonts/dejavu/") + dejavu);
        }
        return out;
    }
}
