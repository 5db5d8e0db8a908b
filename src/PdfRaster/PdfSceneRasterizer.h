#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "PdfScene.h"
#include "IPdfPainter.h"

namespace pdfraster
{
    // width x height RGBA8, non-premultiplied, top row first
    struct PdfRenderTarget
    {
        int width = 0;
        int height = 0;
        std::vector<uint8_t> rgba;

        // recoverable problems met while building the page
        PdfDiagnostics diagnostics;

        size_t memorySize() const { return rgba.size(); }

        const uint8_t* pixel(int x, int y) const
        {
            return &rgba[(static_cast<size_t>(y) * width + x) * 4];
        }
    };

    using PdfRenderTargetPtr = std::shared_ptr<const PdfRenderTarget>;

    struct PdfViewport
    {
        int width = 0;
        int height = 0;
    };

    // =====================================================
    // PdfSceneRasterizer - plays a scene into a painter
    // =====================================================
    class PdfSceneRasterizer
    {
    public:
        static constexpr int MAX_VIEWPORT_SIDE = 16384;
        static constexpr int64_t MAX_VIEWPORT_PIXELS = int64_t(1) << 28;

        // Pixel size of the rotated page box at scale; fails with
        // RenderBackendFault above the viewport limits
        static bool ViewportFor(const PdfRect& box, int rotate, double scale,
            PdfViewport& out, PdfError& err,
            int maxSide = MAX_VIEWPORT_SIDE,
            int64_t maxPixels = MAX_VIEWPORT_PIXELS);

        // Page default space -> device pixels: y flipped, /Rotate applied
        // and the page box stretched over the viewport
        static PdfMatrix BaseTransform(const PdfRect& box, int rotate, const PdfViewport& viewport);

        // Fails with RenderBackendFault or Cancelled; a cancelled render
        // leaves out untouched
        static bool Rasterize(const PdfScene& scene,
            const PdfViewport& viewport,
            const float background[4],
            IPdfPainter& painter,
            PdfRenderTarget& out,
            PdfError& err,
            const std::atomic<bool>* cancel = nullptr);

    private:
        static PdfPaintSource sourceFor(const PdfPaintState& paint, const PdfMatrix& base);
    };
}
