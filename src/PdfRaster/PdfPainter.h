#pragma once
#include <cstdint>
#include <vector>

#include "IPdfPainter.h"

namespace pdfraster
{
    // =====================================================
    // PdfPainter - CPU software rendering
    // Implements IPdfPainter
    // =====================================================
    class PdfPainter : public IPdfPainter
    {
    public:
        PdfPainter() = default;
        ~PdfPainter() override = default;

        // ==================== IPdfPainter Implementation ====================
        bool beginPage(int width, int height, const float background[4], PdfError& err) override;

        int width() const override { return _w; }
        int height() const override { return _h; }

        void fill(const PdfContours& contours, bool evenOdd, const PdfPaintSource& paint) override;

        void pushClip(const PdfContours& contours, bool evenOdd) override;
        void popClip() override;

        bool endPage(std::vector<uint8_t>& rgba, PdfError& err) override;

        const char* name() const override { return "cpu"; }

        // Sub-scanlines per pixel row
        static constexpr int SUBSAMPLES = 16;

        // Rows between cancellation checks
        static constexpr int BAND_ROWS = 16;

    private:
        // Coverage over [x0, x1) x [y0, y1); zero outside
        struct CoverageMask
        {
            int x0 = 0, y0 = 0, x1 = 0, y1 = 0;
            std::vector<float> cov;

            float at(int x, int y) const
            {
                if (x < x0 || x >= x1 || y < y0 || y >= y1)
                    return 0.0f;
                return cov[static_cast<size_t>(y - y0) * (x1 - x0) + (x - x0)];
            }
        };

        int _w = 0;
        int _h = 0;
        std::vector<float> _buffer; // premultiplied RGBA
        std::vector<CoverageMask> _clips;
        bool _allocFailed = false;

        // Device pixel bounds of contours, clipped to the target and the
        // current clip; false when nothing can be painted
        bool paintBounds(const PdfContours& contours, int& x0, int& y0, int& x1, int& y1) const;

        // False when cancelled part way
        bool rasterize(const PdfContours& contours, bool evenOdd, CoverageMask& mask) const;

        bool sample(const PdfPaintSource& paint, int x, int y, float out[4]) const;
    };
}
