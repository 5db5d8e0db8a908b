#pragma once
#include <memory>
#include <string>
#include <vector>

#include "PdfPath.h"
#include "PdfColor.h"
#include "PdfShading.h"
#include "PdfFont.h"

namespace pdfraster
{
    // One W/W* (or text clip) intersection. Entries are shared between
    // saved states and never modified, so the scene builder can compare
    // clip lists by pointer.
    struct PdfClip
    {
        PdfPath path;   // user space
        PdfMatrix ctm;  // user -> page default space
        bool evenOdd = false;
    };

    using PdfClipPtr = std::shared_ptr<const PdfClip>;

    struct PdfDash
    {
        std::vector<double> array;
        double phase = 0.0;
    };

    // Fill or stroke paint: a colour, or a shading pattern
    struct PdfPaint
    {
        PdfColorSpacePtr colorSpace;
        std::vector<double> components;
        PdfRGB rgb;

        PdfShadingPtr shading;
        PdfMatrix shadingMatrix; // shading space -> page default space
    };

    struct PdfGraphicsState
    {
        PdfMatrix ctm;
        std::vector<PdfClipPtr> clips;

        PdfPaint fill;
        PdfPaint stroke;

        // ===== STROKE STATE =====
        double lineWidth = 1.0;
        int lineCap = 0;          // 0=butt 1=round 2=square
        int lineJoin = 0;         // 0=miter 1=round 2=bevel
        double miterLimit = 10.0;
        PdfDash dash;

        // ===== TEXT STATE =====
        PdfFontPtr font;
        double fontSize = 0.0;
        double charSpacing = 0.0;
        double wordSpacing = 0.0;
        double horizontalScale = 100.0;
        double leading = 0.0;
        double textRise = 0.0;
        int renderMode = 0;

        // ===== TRANSPARENCY =====
        double fillAlpha = 1.0;   // ca
        double strokeAlpha = 1.0; // CA
        std::string blendMode = "/Normal";

        PdfGraphicsState()
        {
            fill.colorSpace = PdfColorSpace::Device(PdfColorSpaceKind::DeviceGray);
            fill.components = { 0.0 };
            stroke = fill;
        }
    };
}
