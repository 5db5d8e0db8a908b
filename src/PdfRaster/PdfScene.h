#pragma once
#include <memory>
#include <string>
#include <vector>

#include "PdfPath.h"
#include "PdfError.h"
#include "PdfDocument.h"
#include "PdfGraphicsState.h"
#include "PdfImage.h"

namespace pdfraster
{
    enum class PdfPrimitiveType
    {
        FillPath,
        StrokePath,
        GlyphRun,
        Image,
        Shading,
        ClipPush,
        ClipPop
    };

    // Paint copied from the graphics state when a primitive is emitted
    struct PdfPaintState
    {
        PdfRGB color;
        double alpha = 1.0;

        // set for shading patterns and sh
        PdfShadingPtr shading;
        PdfMatrix shadingMatrix; // shading space -> page default space
    };

    struct PdfStrokeStyle
    {
        double width = 1.0;
        int cap = 0;
        int join = 0;
        double miterLimit = 10.0;
        PdfDash dash;
    };

    struct PdfGlyphInstance
    {
        PdfGlyphPtr glyph;
        PdfMatrix matrix; // em space -> page default space
    };

    // Page default space is PDF user space at the start of the page:
    // points, y up, origin at the MediaBox origin.
    struct PdfScenePrimitive
    {
        PdfPrimitiveType type = PdfPrimitiveType::FillPath;

        // FillPath, StrokePath, ClipPush: path in user space under ctm
        PdfPath path;
        PdfMatrix ctm;
        bool evenOdd = false;

        PdfPaintState paint;
        PdfStrokeStyle stroke;

        // GlyphRun: each outline under its own matrix; ctm is still the
        // user space of the text for stroked glyphs
        std::vector<PdfGlyphInstance> glyphs;
        bool strokeGlyphs = false;

        // Image: the unit square under ctm
        PdfImagePtr image;
    };

    class PdfScene
    {
    public:
        PdfRect pageBox;
        int rotate = 0;
        std::vector<PdfScenePrimitive> primitives;
        PdfDiagnostics diagnostics;

        size_t count(PdfPrimitiveType type) const
        {
            size_t n = 0;
            for (const auto& p : primitives)
            {
                if (p.type == type)
                    ++n;
            }
            return n;
        }

        bool hasDiagnostic(PdfErrorCode code) const
        {
            for (const auto& d : diagnostics)
            {
                if (d.code == code)
                    return true;
            }
            return false;
        }
    };

    using PdfScenePtr = std::shared_ptr<const PdfScene>;

    // Append-only. Every paint call carries the clip list in force; the
    // builder brackets primitives with the fewest ClipPop/ClipPush needed
    // to make the open clips match it.
    class PdfSceneBuilder
    {
    public:
        PdfSceneBuilder(const PdfRect& pageBox, int rotate);

        void fillPath(const PdfPath& path, const PdfMatrix& ctm, bool evenOdd,
            const PdfPaintState& paint, const std::vector<PdfClipPtr>& clips);

        void strokePath(const PdfPath& path, const PdfMatrix& ctm, const PdfStrokeStyle& style,
            const PdfPaintState& paint, const std::vector<PdfClipPtr>& clips);

        // ctm is the user space the stroke style is measured in
        void glyphRun(std::vector<PdfGlyphInstance> glyphs, const PdfMatrix& ctm, bool stroke,
            const PdfStrokeStyle& style, const PdfPaintState& paint, const std::vector<PdfClipPtr>& clips);

        void image(const PdfImagePtr& image, const PdfMatrix& ctm, double alpha,
            const std::vector<PdfClipPtr>& clips);

        // Covers the whole clip region
        void shading(const PdfPaintState& paint, const std::vector<PdfClipPtr>& clips);

        void pushClip(const PdfClipPtr& clip);
        void popClip();

        void diagnostic(PdfErrorCode code, const std::string& message);

        size_t primitiveCount() const { return _scene ? _scene->primitives.size() : 0; }

        // Pops the clips still open; the builder is empty afterwards
        PdfScenePtr finish();

    private:
        std::shared_ptr<PdfScene> _scene;
        std::vector<PdfClipPtr> _open;

        void syncClips(const std::vector<PdfClipPtr>& clips);
    };
}
