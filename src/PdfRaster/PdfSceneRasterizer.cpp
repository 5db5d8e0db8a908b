#include "PdfSceneRasterizer.h"
#include "PdfTessellator.h"
#include "PdfDebug.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace pdfraster
{
    namespace
    {
        int normalizedRotation(int rotate)
        {
            int r = rotate % 360;
            if (r < 0)
                r += 360;
            return r;
        }
    }

    bool PdfSceneRasterizer::ViewportFor(const PdfRect& box, int rotate, double scale,
        PdfViewport& out, PdfError& err, int maxSide, int64_t maxPixels)
    {
        if (!(scale > 0) || !std::isfinite(scale))
        {
            err.set(PdfErrorCode::RenderBackendFault, "invalid scale " + std::to_string(scale));
            return false;
        }

        double w = std::max(1.0, std::round(box.width() * scale));
        double h = std::max(1.0, std::round(box.height() * scale));
        int r = normalizedRotation(rotate);
        if (r == 90 || r == 270)
            std::swap(w, h);

        maxSide = std::min(maxSide, MAX_VIEWPORT_SIDE);
        maxPixels = std::min(maxPixels, MAX_VIEWPORT_PIXELS);
        if (w > maxSide || h > maxSide || w * h > static_cast<double>(maxPixels))
        {
            err.set(PdfErrorCode::RenderBackendFault,
                "viewport " + std::to_string(static_cast<int64_t>(w)) + "x" +
                std::to_string(static_cast<int64_t>(h)) + " is too large");
            return false;
        }

        out.width = static_cast<int>(w);
        out.height = static_cast<int>(h);
        return true;
    }

    PdfMatrix PdfSceneRasterizer::BaseTransform(const PdfRect& box, int rotate, const PdfViewport& viewport)
    {
        int r = normalizedRotation(rotate);
        bool swapped = r == 90 || r == 270;

        // unrotated device size
        double uw = swapped ? viewport.height : viewport.width;
        double uh = swapped ? viewport.width : viewport.height;

        double sx = box.width() > 0 ? uw / box.width() : 1.0;
        double sy = box.height() > 0 ? uh / box.height() : 1.0;

        PdfMatrix flip(sx, 0, 0, -sy, -box.x0 * sx, box.y1 * sy);

        // pages rotate clockwise on display
        PdfMatrix rot;
        switch (r)
        {
        case 90:
            rot = PdfMatrix(0, 1, -1, 0, uh, 0);
            break;
        case 180:
            rot = PdfMatrix(-1, 0, 0, -1, uw, uh);
            break;
        case 270:
            rot = PdfMatrix(0, -1, 1, 0, 0, uw);
            break;
        default:
            break;
        }
        return PdfMul(flip, rot);
    }

    PdfPaintSource PdfSceneRasterizer::sourceFor(const PdfPaintState& paint, const PdfMatrix& base)
    {
        PdfPaintSource src;
        src.alpha = static_cast<float>(paint.alpha);

        PdfMatrix toShading;
        if (paint.shading && PdfMul(paint.shadingMatrix, base).invert(toShading))
        {
            src.kind = PdfPaintSource::Shading;
            src.shading = paint.shading;
            src.deviceToShading = toShading;
            return src;
        }

        src.kind = PdfPaintSource::Solid;
        src.r = static_cast<float>(paint.color.r);
        src.g = static_cast<float>(paint.color.g);
        src.b = static_cast<float>(paint.color.b);
        return src;
    }

    bool PdfSceneRasterizer::Rasterize(const PdfScene& scene,
        const PdfViewport& viewport,
        const float background[4],
        IPdfPainter& painter,
        PdfRenderTarget& out,
        PdfError& err,
        const std::atomic<bool>* cancel)
    {
        auto isCancelled = [&]() { return cancel && cancel->load(std::memory_order_relaxed); };

        painter.setCancelFlag(cancel);
        if (!painter.beginPage(viewport.width, viewport.height, background, err))
            return false;

        const PdfMatrix base = BaseTransform(scene.pageBox, scene.rotate, viewport);
        PdfContours contours;

        for (const auto& p : scene.primitives)
        {
            if (isCancelled())
            {
                err.set(PdfErrorCode::Cancelled, "render cancelled");
                return false;
            }

            contours.clear();
            const PdfMatrix toDevice = PdfMul(p.ctm, base);

            switch (p.type)
            {
            case PdfPrimitiveType::FillPath:
                PdfTessellator::FlattenFill(p.path, toDevice, contours);
                painter.fill(contours, p.evenOdd, sourceFor(p.paint, base));
                break;

            case PdfPrimitiveType::StrokePath:
                PdfTessellator::StrokeOutline(p.path, toDevice, p.stroke, contours);
                painter.fill(contours, false, sourceFor(p.paint, base));
                break;

            case PdfPrimitiveType::GlyphRun:
            {
                const PdfPaintSource src = sourceFor(p.paint, base);
                PdfMatrix userFromPage;
                const bool strokable = p.strokeGlyphs && p.ctm.invert(userFromPage);

                for (const auto& g : p.glyphs)
                {
                    if (!g.glyph || g.glyph->outline.empty())
                        continue;
                    contours.clear();
                    if (strokable)
                    {
                        // the outline in text user space, stroked under the ctm
                        PdfPath user = TransformPath(g.glyph->outline, PdfMul(g.matrix, userFromPage));
                        PdfTessellator::StrokeOutline(user, toDevice, p.stroke, contours);
                    }
                    else if (!p.strokeGlyphs)
                    {
                        PdfTessellator::FlattenFill(g.glyph->outline, PdfMul(g.matrix, base), contours);
                    }
                    painter.fill(contours, false, src);
                }
                break;
            }

            case PdfPrimitiveType::Image:
            {
                PdfMatrix inverse;
                if (!p.image || !toDevice.invert(inverse))
                    break;
                PdfPath square;
                AppendRect(square, 0, 0, 1, 1);
                PdfTessellator::FlattenFill(square, toDevice, contours);

                PdfPaintSource src;
                src.kind = PdfPaintSource::Image;
                src.alpha = static_cast<float>(p.paint.alpha);
                src.image = p.image;
                src.deviceToImage = inverse;
                painter.fill(contours, false, src);
                break;
            }

            case PdfPrimitiveType::Shading:
                // everything the clip lets through
                contours.push_back(PdfTessellator::Rect(0, 0, viewport.width, viewport.height));
                painter.fill(contours, false, sourceFor(p.paint, base));
                break;

            case PdfPrimitiveType::ClipPush:
                PdfTessellator::FlattenFill(p.path, toDevice, contours);
                painter.pushClip(contours, p.evenOdd);
                break;

            case PdfPrimitiveType::ClipPop:
                painter.popClip();
                break;
            }
        }

        if (isCancelled())
        {
            err.set(PdfErrorCode::Cancelled, "render cancelled");
            return false;
        }

        PdfRenderTarget target;
        if (!painter.endPage(target.rgba, err))
            return false;
        if (isCancelled())
        {
            err.set(PdfErrorCode::Cancelled, "render cancelled");
            return false;
        }

        target.width = viewport.width;
        target.height = viewport.height;
        target.diagnostics = scene.diagnostics;
        out = std::move(target);

        LogDebug("[Rasterizer] %s %dx%d, %zu primitives", painter.name(),
            out.width, out.height, scene.primitives.size());
        return true;
    }
}
