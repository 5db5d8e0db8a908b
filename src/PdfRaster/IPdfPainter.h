#pragma once
// =====================================================
// IPdfPainter.h - GPU/CPU rasterization interface
// =====================================================

#include <atomic>
#include <cstdint>
#include <vector>

#include "PdfPath.h"
#include "PdfError.h"
#include "PdfShading.h"
#include "PdfImage.h"
#include "PdfTessellator.h"

namespace pdfraster
{
    // What a fill paints. Device space is pixels, y down, origin at the
    // top-left corner of the target.
    struct PdfPaintSource
    {
        enum Kind
        {
            Solid,
            Shading,
            Image
        };

        Kind kind = Solid;

        // Solid: straight colour; alpha applies to every kind
        float r = 0, g = 0, b = 0;
        float alpha = 1.0f;

        PdfShadingPtr shading;
        PdfMatrix deviceToShading;

        // device -> image unit square; v = 1 is row 0
        PdfImagePtr image;
        PdfMatrix deviceToImage;
    };

    class IPdfPainter
    {
    public:
        virtual ~IPdfPainter() = default;

        // Allocates a width x height target cleared to background
        // (straight RGBA, 0..1). Fails with RenderBackendFault.
        virtual bool beginPage(int width, int height, const float background[4], PdfError& err) = 0;

        virtual int width() const = 0;
        virtual int height() const = 0;

        // Composites paint over the region covered by contours, masked by
        // the current clip
        virtual void fill(const PdfContours& contours, bool evenOdd, const PdfPaintSource& paint) = 0;

        // Intersects the clip with the region; popClip restores the
        // previous one
        virtual void pushClip(const PdfContours& contours, bool evenOdd) = 0;
        virtual void popClip() = 0;

        // Non-premultiplied RGBA8, top row first. Fails with
        // RenderBackendFault when the device was lost.
        virtual bool endPage(std::vector<uint8_t>& rgba, PdfError& err) = 0;

        // Checked between scanline bands
        void setCancelFlag(const std::atomic<bool>* cancel) { _cancel = cancel; }
        bool cancelled() const { return _cancel && _cancel->load(std::memory_order_relaxed); }

        virtual bool isGPU() const { return false; }
        virtual const char* name() const = 0;

    protected:
        const std::atomic<bool>* _cancel = nullptr;
    };
}
