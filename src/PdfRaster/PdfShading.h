#pragma once
// ============================================
// PdfShading - function-based, axial and radial shadings
// ============================================

#include <memory>
#include <string>
#include <vector>

#include "PdfObject.h"
#include "PdfColor.h"
#include "PdfFunction.h"
#include "PdfPath.h"

namespace pdfraster
{
    class PdfDocument;
    class PdfResources;

    class PdfShading
    {
    public:
        int type = 2; // 1 function-based, 2 axial, 3 radial

        // axial end points, radial circle centres
        double x0 = 0, y0 = 0, x1 = 1, y1 = 0;
        double r0 = 0, r1 = 1;

        double t0 = 0, t1 = 1;
        bool extendStart = false;
        bool extendEnd = false;

        // type 1
        double domain[4] = { 0, 1, 0, 1 };
        PdfMatrix matrix;

        PdfColorSpacePtr colorSpace;
        PdfFunctionPtr function;

        // Colour at a point of shading space; false where the shading
        // paints nothing (outside the domain and not extended)
        bool evaluate(double x, double y, PdfRGB& out) const;

        // Colour for the parametric value s in [0, 1] of types 2 and 3
        PdfRGB colorAt(double s) const;

        static std::shared_ptr<const PdfShading> Parse(const PdfDocument& doc,
            const PdfResources* resources,
            const PdfObjectPtr& obj,
            std::string& why);

        static const int LUT_SIZE = 4096;

    private:
        std::vector<float> _lut; // LUT_SIZE * 3
        PdfMatrix _inverseMatrix;

        void buildLUT();
        PdfRGB colorFromComponents(const std::vector<double>& in) const;
        bool radialParameter(double x, double y, double& s) const;
    };

    using PdfShadingPtr = std::shared_ptr<const PdfShading>;
}
