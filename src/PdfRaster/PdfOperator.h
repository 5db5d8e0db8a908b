#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "PdfObject.h"

namespace pdfraster
{
    class PdfParser;

    // Content stream operators. BI/ID/EI decode to a single InlineImage
    // operation carrying its dictionary and data.
    enum class PdfOp
    {
        // graphics state
        Save,               // q
        Restore,            // Q
        Concat,             // cm
        SetLineWidth,       // w
        SetLineCap,         // J
        SetLineJoin,        // j
        SetMiterLimit,      // M
        SetDash,            // d
        SetRenderingIntent, // ri
        SetFlatness,        // i
        SetExtGState,       // gs

        // path construction
        MoveTo,             // m
        LineTo,             // l
        CurveTo,            // c
        CurveToV,           // v
        CurveToY,           // y
        ClosePath,          // h
        Rectangle,          // re

        // path painting
        Stroke,                 // S
        CloseStroke,            // s
        Fill,                   // f
        FillObsolete,           // F
        FillEvenOdd,            // f*
        FillStroke,             // B
        FillStrokeEvenOdd,      // B*
        CloseFillStroke,        // b
        CloseFillStrokeEvenOdd, // b*
        EndPath,                // n

        // clipping
        Clip,               // W
        ClipEvenOdd,        // W*

        // text objects and state
        BeginText,          // BT
        EndText,            // ET
        SetCharSpacing,     // Tc
        SetWordSpacing,     // Tw
        SetHorizScale,      // Tz
        SetLeading,         // TL
        SetFont,            // Tf
        SetRenderMode,      // Tr
        SetRise,            // Ts

        // text positioning and showing
        MoveText,           // Td
        MoveTextSetLeading, // TD
        SetTextMatrix,      // Tm
        NextLine,           // T*
        ShowText,           // Tj
        ShowTextArray,      // TJ
        NextLineShow,       // '
        NextLineSpacingShow,// "

        // Type3 glyph metrics
        SetCharWidth,       // d0
        SetCacheDevice,     // d1

        // colour
        SetStrokeColorSpace,// CS
        SetFillColorSpace,  // cs
        SetStrokeColor,     // SC
        SetStrokeColorN,    // SCN
        SetFillColor,       // sc
        SetFillColorN,      // scn
        SetStrokeGray,      // G
        SetFillGray,        // g
        SetStrokeRGB,       // RG
        SetFillRGB,         // rg
        SetStrokeCMYK,      // K
        SetFillCMYK,        // k

        PaintShading,       // sh
        PaintXObject,       // Do
        InlineImage,        // BI ... ID ... EI

        // marked content
        MarkedContentPoint,      // MP
        MarkedContentPointProps, // DP
        BeginMarkedContent,      // BMC
        BeginMarkedContentProps, // BDC
        EndMarkedContent,        // EMC

        // compatibility
        BeginCompat,        // BX
        EndCompat,          // EX

        Unknown
    };

    struct PdfOperation
    {
        PdfOp op = PdfOp::Unknown;
        std::string keyword; // as written in the stream
        std::vector<PdfObjectPtr> operands;

        // InlineImage only: expanded dictionary over the raw ID..EI bytes
        std::shared_ptr<PdfStream> inlineImage;
    };

    // Decodes a whole content stream up front. Operands preceding an
    // unknown keyword stay attached to its Unknown operation.
    class PdfOperationReader
    {
    public:
        explicit PdfOperationReader(const std::vector<uint8_t>& data);

        void readAll(std::vector<PdfOperation>& out);

        static PdfOp Lookup(const std::string& keyword);

        static constexpr size_t MAX_OPERANDS = 4096;
        static constexpr size_t MAX_OPERATIONS = 1u << 24;

    private:
        const std::vector<uint8_t>& _data;

        bool readInlineImage(PdfParser& parser, PdfOperation& op);
        size_t findInlineImageEnd(size_t start, const std::shared_ptr<PdfDictionary>& dict, size_t& dataEnd) const;
    };
}
