#pragma once
#include <string>
#include <vector>

namespace pdfraster
{
    enum class StandardFamily
    {
        None,
        Helvetica,
        HelveticaBold,
        TimesRoman,
        TimesBold,
        Courier,
        Symbol,
        ZapfDingbats
    };

    // Strips a subset tag ("ABCDEF+") and a leading slash
    std::string StripSubsetPrefix(const std::string& baseFont);

    // Maps standard-14 names and their common aliases (Arial,
    // TimesNewRoman, CourierNew). Obliques share the upright family,
    // italics are approximated by the upright face.
    StandardFamily StandardFamilyOf(const std::string& baseFont);

    bool IsStandard14(const std::string& baseFont);

    // Built-in AFM width in 1/1000 em; false when the family has no table
    bool StandardGlyphWidth(StandardFamily family, const std::string& glyphName, double& width);

    // Files to try for a non-embedded font, best first: the override
    // directory by base name and standard-14 file names, then well-known
    // system fonts with matching metrics
    std::vector<std::string> SubstituteFontCandidates(const std::string& baseFont,
        const std::string& fontDirectory,
        bool serif,
        bool fixedPitch);
}
