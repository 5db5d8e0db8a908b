#pragma once
#include <memory>
#include <string>
#include <vector>

#include "PdfObject.h"
#include "PdfFunction.h"

namespace pdfraster
{
    class PdfDocument;
    class PdfResources;

    struct PdfRGB
    {
        double r = 0, g = 0, b = 0;
    };

    // SWOP-like CMYK approximation with ink impurity corrections
    void CmykToRgb(double c, double m, double y, double k, double out[3]);

    enum class PdfColorSpaceKind
    {
        DeviceGray,
        DeviceRGB,
        DeviceCMYK,
        Lab,
        Indexed,
        Separation, // also DeviceN
        Pattern
    };

    class PdfColorSpace;
    using PdfColorSpacePtr = std::shared_ptr<const PdfColorSpace>;

    class PdfColorSpace
    {
    public:
        PdfColorSpaceKind kind = PdfColorSpaceKind::DeviceGray;

        // Indexed base, Separation/DeviceN alternate, uncoloured pattern base
        PdfColorSpacePtr base;

        // Indexed
        int hival = 0;
        std::vector<uint8_t> lookup;

        // Separation / DeviceN
        int colorants = 1;
        PdfFunctionPtr tint;
        bool none = false; // the /None colorant paints nothing

        // Lab
        double whitePoint[3] = { 0.9505, 1.0, 1.089 };
        double range[4] = { -100, 100, -100, 100 };

        int components() const;

        // Initial colour after CS/cs
        std::vector<double> defaultColor() const;

        void toRGB(const double* comps, size_t count, PdfRGB& out) const;
        PdfRGB toRGB(const std::vector<double>& comps) const
        {
            PdfRGB rgb;
            toRGB(comps.data(), comps.size(), rgb);
            return rgb;
        }

        // Decode array default for images: [0 1] per component, [0 hival]
        // for Indexed, the Lab ranges for Lab
        std::vector<double> defaultDecode(int bitsPerComponent) const;

        static PdfColorSpacePtr Device(PdfColorSpaceKind kind);

        // Accepts a family name, a resource name or a colour space array.
        // On failure why holds a short reason.
        static PdfColorSpacePtr Parse(const PdfDocument& doc,
            const PdfResources* resources,
            const PdfObjectPtr& obj,
            std::string& why,
            int depth = 0);

        static constexpr int MAX_NESTING = 8;
    };
}
