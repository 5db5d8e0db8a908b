#pragma once
#include <vector>

#include "PdfPath.h"
#include "PdfScene.h"

namespace pdfraster
{
    struct DPoint { double x, y; };

    // Closed polygons in device pixels (y down). Every contour is closed
    // implicitly; fill rules apply to the set as a whole.
    using PdfContour = std::vector<DPoint>;
    using PdfContours = std::vector<PdfContour>;

    // =====================================================
    // PdfTessellator - path flattening and stroke-to-fill
    // shared by the CPU and GPU painters
    // =====================================================
    class PdfTessellator
    {
    public:
        // Maximum distance between a curve and its polyline, device px
        static constexpr double FLATTEN_TOLERANCE = 0.05;

        // Dash patterns producing more pieces than this are drawn solid
        static constexpr size_t MAX_DASH_PIECES = 1u << 20;

        // Path under toDevice, one contour per subpath (open subpaths are
        // closed for filling)
        static void FlattenFill(const PdfPath& path, const PdfMatrix& toDevice, PdfContours& out);

        // Stroke outline of path under toDevice. The outline is a union of
        // consistently oriented pieces and must be filled nonzero.
        static void StrokeOutline(const PdfPath& path, const PdfMatrix& toDevice,
            const PdfStrokeStyle& style, PdfContours& out);

        // Device bounds of a contour set; false when empty
        static bool Bounds(const PdfContours& contours, double& x0, double& y0, double& x1, double& y1);

        // Quad covering the device rectangle
        static PdfContour Rect(double x0, double y0, double x1, double y1);

    private:
        struct Polyline
        {
            std::vector<DPoint> points;
            bool closed = false;
        };

        // Flattens in the path's own space; tolerance in that space
        static void flatten(const PdfPath& path, const PdfMatrix& m, double tolerance,
            std::vector<Polyline>& out);

        static void applyDash(const std::vector<Polyline>& in, const PdfDash& dash,
            std::vector<Polyline>& out);

        static void strokePolyline(const Polyline& line, double halfWidth, const PdfStrokeStyle& style,
            double tolerance, PdfContours& out);
    };
}
