#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <ft2build.h>
#include FT_FREETYPE_H

#include "PdfObject.h"
#include "PdfPath.h"
#include "PdfCMap.h"
#include "PdfEncodings.h"
#include "StandardFonts.h"

namespace pdfraster
{
    class PdfDocument;

    // An outline in em units (1.0 = one em, y up) and the advance the
    // font program gives it, in 1/1000 em
    struct PdfGlyph
    {
        PdfPath outline;
        double advance = 0.0;
    };

    using PdfGlyphPtr = std::shared_ptr<const PdfGlyph>;

    // FT_Library shared by every face of a FontCache. Faces keep it alive
    // so it is released after the last of them.
    struct FtLibrary
    {
        FT_Library lib = nullptr;
        std::mutex mutex; // FT_New_Memory_Face / FT_Done_Face

        FtLibrary() = default;
        ~FtLibrary()
        {
            if (lib)
                FT_Done_FreeType(lib);
        }

        FtLibrary(const FtLibrary&) = delete;
        FtLibrary& operator=(const FtLibrary&) = delete;
    };

    enum class PdfFontKind
    {
        Simple,   // Type1, MMType1, TrueType
        Composite,
        Type3
    };

    struct PdfCharCode
    {
        uint32_t code = 0;
        size_t bytes = 1;
    };

    // A loaded font resource: encoding, widths and an optional FreeType
    // face for outlines. Immutable after load apart from the face, which
    // is guarded by its own mutex.
    class PdfFont
    {
    public:
        PdfFont(uint64_t id, std::shared_ptr<FtLibrary> library);
        ~PdfFont();

        PdfFont(const PdfFont&) = delete;
        PdfFont& operator=(const PdfFont&) = delete;

        bool load(const PdfDocument& doc,
            const std::shared_ptr<PdfDictionary>& fontDict,
            const std::string& fontDirectory,
            std::string& why);

        uint64_t id() const { return _id; }
        PdfFontKind kind() const { return _kind; }
        bool isComposite() const { return _kind == PdfFontKind::Composite; }
        const std::string& baseFont() const { return _baseFont; }

        // No embedded program: outlines come from a substitute face,
        // which is scaled to the PDF widths
        bool isSubstitute() const { return _substitute; }
        bool hasFace() const { return _face != nullptr; }

        // Splits a shown string into character codes
        void decode(const std::string& s, std::vector<PdfCharCode>& out) const;

        // Advance in 1/1000 text space units
        double width(const PdfCharCode& c) const;

        // False for an undefined glyph: an unmapped CID, a code with no
        // glyph in the program, or a font without outlines
        bool glyphIndex(const PdfCharCode& c, uint32_t& gid) const;

        // Unhinted outline in em units
        bool outline(uint32_t gid, PdfGlyph& out) const;

        // Type3 glyph space to text space
        const PdfMatrix& fontMatrix() const { return _fontMatrix; }

    private:
        uint64_t _id;
        std::shared_ptr<FtLibrary> _library;

        PdfFontKind _kind = PdfFontKind::Simple;
        std::string _subtype;
        std::string _baseFont;
        StandardFamily _family = StandardFamily::None;
        int _flags = 0;
        bool _substitute = false;

        // simple fonts
        std::string _glyphNames[256];
        double _widths[256];
        bool _hasWidth[256];
        int32_t _gids[256];

        // composite fonts
        PdfCMapPtr _cmap;
        double _defaultWidth = 1000.0;
        std::map<uint32_t, double> _cidWidths;
        bool _cidToGidIdentity = true;
        std::vector<uint16_t> _cidToGid;
        std::map<uint32_t, uint32_t> _cffCidToGid;

        // Type3
        PdfMatrix _fontMatrix;

        // FreeType
        std::vector<uint8_t> _program;
        FT_Face _face = nullptr;
        mutable std::mutex _faceMutex;
        double _unitsPerEm = 1000.0;

        bool loadSimple(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict,
            const std::string& fontDirectory, std::string& why);
        bool loadComposite(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict,
            const std::string& fontDirectory, std::string& why);
        bool loadType3(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict, std::string& why);

        void loadEncoding(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict, bool embedded);
        void loadSimpleWidths(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& dict,
            const std::shared_ptr<PdfDictionary>& descriptor);
        void loadCidWidths(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& cidFont);

        bool loadEmbeddedProgram(const PdfDocument& doc, const std::shared_ptr<PdfDictionary>& descriptor);
        bool loadSubstituteProgram(const std::string& fontDirectory);
        bool openFace();
        void buildSimpleGlyphMap(bool embedded);
        double programAdvance(uint32_t gid) const;
    };

    using PdfFontPtr = std::shared_ptr<const PdfFont>;
}
