#include "PdfColor.h"
#include "PdfDocument.h"
#include "PdfResources.h"
#include "PdfDebug.h"

#include <algorithm>
#include <cmath>

namespace pdfraster
{
    namespace
    {
        double clamp01(double v)
        {
            return std::min(1.0, std::max(0.0, v));
        }

        double srgbGamma(double v)
        {
            v = clamp01(v);
            return v <= 0.0031308 ? 12.92 * v : 1.055 * std::pow(v, 1.0 / 2.4) - 0.055;
        }

        double labInverse(double t)
        {
            const double d = 6.0 / 29.0;
            return t > d ? t * t * t : 3.0 * d * d * (t - 4.0 / 29.0);
        }

        PdfColorSpacePtr fromFamilyName(const std::string& name)
        {
            if (name == "/DeviceGray" || name == "/G" || name == "/CalGray")
                return PdfColorSpace::Device(PdfColorSpaceKind::DeviceGray);
            if (name == "/DeviceRGB" || name == "/RGB" || name == "/CalRGB")
                return PdfColorSpace::Device(PdfColorSpaceKind::DeviceRGB);
            if (name == "/DeviceCMYK" || name == "/CMYK")
                return PdfColorSpace::Device(PdfColorSpaceKind::DeviceCMYK);
            if (name == "/Pattern")
                return PdfColorSpace::Device(PdfColorSpaceKind::Pattern);
            return nullptr;
        }

        PdfColorSpacePtr deviceByComponents(int n)
        {
            switch (n)
            {
            case 1: return PdfColorSpace::Device(PdfColorSpaceKind::DeviceGray);
            case 3: return PdfColorSpace::Device(PdfColorSpaceKind::DeviceRGB);
            case 4: return PdfColorSpace::Device(PdfColorSpaceKind::DeviceCMYK);
            default: return nullptr;
            }
        }
    }

    void CmykToRgb(double c, double m, double y, double k, double out[3])
    {
        c = clamp01(c);
        m = clamp01(m);
        y = clamp01(y);
        k = clamp01(k);

        double r = (1.0 - c) * (1.0 - k);
        double g = (1.0 - m) * (1.0 - k);
        double b = (1.0 - y) * (1.0 - k);

        // cyan leaks red, yellow absorbs some green and leaks blue
        r += 0.12 * c * (1.0 - k);
        g -= 0.15 * y * (1.0 - m) * (1.0 - k);
        b += 0.20 * y * (1.0 - k);

        out[0] = clamp01(r);
        out[1] = clamp01(g);
        out[2] = clamp01(b);
    }

    // ============================================
    // PdfColorSpace
    // ============================================

    PdfColorSpacePtr PdfColorSpace::Device(PdfColorSpaceKind kind)
    {
        static const PdfColorSpacePtr gray = [] {
            auto cs = std::make_shared<PdfColorSpace>();
            cs->kind = PdfColorSpaceKind::DeviceGray;
            return cs;
        }();
        static const PdfColorSpacePtr rgb = [] {
            auto cs = std::make_shared<PdfColorSpace>();
            cs->kind = PdfColorSpaceKind::DeviceRGB;
            return cs;
        }();
        static const PdfColorSpacePtr cmyk = [] {
            auto cs = std::make_shared<PdfColorSpace>();
            cs->kind = PdfColorSpaceKind::DeviceCMYK;
            return cs;
        }();
        static const PdfColorSpacePtr pattern = [] {
            auto cs = std::make_shared<PdfColorSpace>();
            cs->kind = PdfColorSpaceKind::Pattern;
            return cs;
        }();

        switch (kind)
        {
        case PdfColorSpaceKind::DeviceRGB: return rgb;
        case PdfColorSpaceKind::DeviceCMYK: return cmyk;
        case PdfColorSpaceKind::Pattern: return pattern;
        default: return gray;
        }
    }

    int PdfColorSpace::components() const
    {
        switch (kind)
        {
        case PdfColorSpaceKind::DeviceGray: return 1;
        case PdfColorSpaceKind::DeviceRGB: return 3;
        case PdfColorSpaceKind::DeviceCMYK: return 4;
        case PdfColorSpaceKind::Lab: return 3;
        case PdfColorSpaceKind::Indexed: return 1;
        case PdfColorSpaceKind::Separation: return colorants;
        case PdfColorSpaceKind::Pattern: return base ? base->components() : 0;
        }
        return 1;
    }

    std::vector<double> PdfColorSpace::defaultColor() const
    {
        switch (kind)
        {
        case PdfColorSpaceKind::DeviceCMYK:
            return { 0, 0, 0, 1 };
        case PdfColorSpaceKind::Lab:
        {
            // L = 0 clipped into the a/b ranges
            double a = std::min(range[1], std::max(range[0], 0.0));
            double b = std::min(range[3], std::max(range[2], 0.0));
            return { 0, a, b };
        }
        case PdfColorSpaceKind::Separation:
            return std::vector<double>(static_cast<size_t>(colorants), 1.0);
        case PdfColorSpaceKind::Pattern:
            return std::vector<double>(static_cast<size_t>(components()), 0.0);
        default:
            return std::vector<double>(static_cast<size_t>(components()), 0.0);
        }
    }

    std::vector<double> PdfColorSpace::defaultDecode(int bitsPerComponent) const
    {
        std::vector<double> decode;
        if (kind == PdfColorSpaceKind::Indexed)
        {
            decode = { 0.0, std::ldexp(1.0, bitsPerComponent) - 1.0 };
            return decode;
        }
        if (kind == PdfColorSpaceKind::Lab)
        {
            decode = { 0, 100, range[0], range[1], range[2], range[3] };
            return decode;
        }
        for (int i = 0; i < components(); ++i)
        {
            decode.push_back(0.0);
            decode.push_back(1.0);
        }
        return decode;
    }

    void PdfColorSpace::toRGB(const double* comps, size_t count, PdfRGB& out) const
    {
        auto at = [&](size_t i, double fallback) {
            return i < count ? comps[i] : fallback;
        };

        switch (kind)
        {
        case PdfColorSpaceKind::DeviceGray:
        {
            double g = clamp01(at(0, 0));
            out = { g, g, g };
            return;
        }
        case PdfColorSpaceKind::DeviceRGB:
            out = { clamp01(at(0, 0)), clamp01(at(1, 0)), clamp01(at(2, 0)) };
            return;
        case PdfColorSpaceKind::DeviceCMYK:
        {
            double rgb[3];
            CmykToRgb(at(0, 0), at(1, 0), at(2, 0), at(3, 1), rgb);
            out = { rgb[0], rgb[1], rgb[2] };
            return;
        }
        case PdfColorSpaceKind::Lab:
        {
            double L = std::min(100.0, std::max(0.0, at(0, 0)));
            double a = std::min(range[1], std::max(range[0], at(1, 0)));
            double b = std::min(range[3], std::max(range[2], at(2, 0)));

            double fy = (L + 16.0) / 116.0;
            double fx = fy + a / 500.0;
            double fz = fy - b / 200.0;

            // adapt the white point to D65 by per-axis scaling
            double X = labInverse(fx) * 0.9505;
            double Y = labInverse(fy);
            double Z = labInverse(fz) * 1.089;

            double r = 3.2406 * X - 1.5372 * Y - 0.4986 * Z;
            double g = -0.9689 * X + 1.8758 * Y + 0.0415 * Z;
            double bl = 0.0557 * X - 0.2040 * Y + 1.0570 * Z;
            out = { srgbGamma(r), srgbGamma(g), srgbGamma(bl) };
            return;
        }
        case PdfColorSpaceKind::Indexed:
        {
            int index = static_cast<int>(std::lround(at(0, 0)));
            index = std::min(hival, std::max(0, index));
            int n = base ? base->components() : 1;
            std::vector<double> baseComps(static_cast<size_t>(n), 0.0);
            for (int i = 0; i < n; ++i)
            {
                size_t pos = static_cast<size_t>(index) * n + i;
                baseComps[i] = pos < lookup.size() ? lookup[pos] / 255.0 : 0.0;
            }
            if (base && base->kind == PdfColorSpaceKind::Lab)
            {
                // Lab lookup bytes span the decode ranges
                baseComps[0] *= 100.0;
                for (int i = 1; i < 3 && i < n; ++i)
                    baseComps[i] = base->range[(i - 1) * 2] + baseComps[i] * (base->range[(i - 1) * 2 + 1] - base->range[(i - 1) * 2]);
            }
            if (base)
                base->toRGB(baseComps.data(), baseComps.size(), out);
            else
                out = { baseComps[0], baseComps[0], baseComps[0] };
            return;
        }
        case PdfColorSpaceKind::Separation:
        {
            if (tint && base)
            {
                std::vector<double> in(comps, comps + std::min(count, static_cast<size_t>(colorants)));
                in.resize(static_cast<size_t>(colorants), 0.0);
                std::vector<double> alt;
                tint->evaluate(in, alt);
                base->toRGB(alt.data(), alt.size(), out);
                return;
            }
            // no usable tint transform: treat the tint as a grey ink
            double t = clamp01(at(0, 1));
            out = { 1.0 - t, 1.0 - t, 1.0 - t };
            return;
        }
        case PdfColorSpaceKind::Pattern:
            if (base)
            {
                base->toRGB(comps, count, out);
                return;
            }
            out = { 0.5, 0.5, 0.5 };
            return;
        }
    }

    PdfColorSpacePtr PdfColorSpace::Parse(const PdfDocument& doc,
        const PdfResources* resources,
        const PdfObjectPtr& objIn,
        std::string& why,
        int depth)
    {
        if (depth > MAX_NESTING)
        {
            why = "colour space nesting too deep";
            return nullptr;
        }

        auto obj = doc.resolveIndirect(objIn);
        if (IsNull(obj))
        {
            why = "missing colour space";
            return nullptr;
        }

        std::string name = NameOf(obj);
        if (!name.empty())
        {
            if (auto cs = fromFamilyName(name))
                return cs;

            // a named entry of the /ColorSpace resource category
            if (resources)
            {
                PdfObjectPtr value;
                PdfError err;
                if (resources->resource(ResourceCategory::ColorSpace, name, value, err))
                    return Parse(doc, resources, value, why, depth + 1);
            }
            why = "unknown colour space " + name;
            return nullptr;
        }

        auto arr = AsArray(obj);
        if (!arr || arr->items.empty())
        {
            why = "colour space is neither a name nor an array";
            return nullptr;
        }

        std::string family = NameOf(doc.resolveIndirect(arr->items[0]));
        auto item = [&](size_t i) -> PdfObjectPtr {
            return i < arr->items.size() ? doc.resolveIndirect(arr->items[i]) : nullptr;
        };

        if (family == "/CalGray" || family == "/CalRGB" || family == "/DeviceGray" ||
            family == "/DeviceRGB" || family == "/DeviceCMYK")
            return fromFamilyName(family);

        if (family == "/ICCBased")
        {
            auto dict = AsDict(item(1));
            if (!dict)
            {
                why = "ICCBased without a profile stream";
                return nullptr;
            }
            if (auto cs = deviceByComponents(static_cast<int>(doc.getNumberOr(dict, "/N", 0))))
                return cs;
            auto alt = doc.get(dict, "/Alternate");
            if (!IsNull(alt))
                return Parse(doc, resources, alt, why, depth + 1);
            why = "ICCBased with unsupported /N";
            return nullptr;
        }

        if (family == "/Lab")
        {
            auto cs = std::make_shared<PdfColorSpace>();
            cs->kind = PdfColorSpaceKind::Lab;
            if (auto dict = AsDict(item(1)))
            {
                auto wp = doc.numbers(doc.getArray(dict, "/WhitePoint"));
                for (size_t i = 0; i < 3 && i < wp.size(); ++i)
                    cs->whitePoint[i] = wp[i];
                auto rg = doc.numbers(doc.getArray(dict, "/Range"));
                for (size_t i = 0; i < 4 && i < rg.size(); ++i)
                    cs->range[i] = rg[i];
            }
            return cs;
        }

        if (family == "/Indexed" || family == "/I")
        {
            auto base = Parse(doc, resources, item(1), why, depth + 1);
            if (!base)
                return nullptr;

            auto cs = std::make_shared<PdfColorSpace>();
            cs->kind = PdfColorSpaceKind::Indexed;
            cs->base = base;
            cs->hival = std::min(255, std::max(0, static_cast<int>(NumberOr(item(2), 0))));

            auto table = item(3);
            if (auto str = AsString(table))
            {
                cs->lookup.assign(str->value.begin(), str->value.end());
            }
            else if (auto stream = AsStream(table))
            {
                if (!doc.decodeStream(stream, cs->lookup))
                {
                    why = "Indexed lookup stream failed to decode";
                    return nullptr;
                }
            }
            else
            {
                why = "Indexed without a lookup table";
                return nullptr;
            }
            return cs;
        }

        if (family == "/Separation" || family == "/DeviceN")
        {
            auto cs = std::make_shared<PdfColorSpace>();
            cs->kind = PdfColorSpaceKind::Separation;

            if (family == "/Separation")
            {
                cs->colorants = 1;
                cs->none = NameOf(item(1)) == "/None";
            }
            else
            {
                auto names = AsArray(item(1));
                cs->colorants = names ? static_cast<int>(names->items.size()) : 1;
                if (cs->colorants < 1)
                    cs->colorants = 1;
            }

            std::string altWhy;
            cs->base = Parse(doc, resources, item(2), altWhy, depth + 1);
            cs->tint = PdfFunction::Parse(doc, item(3));
            if (!cs->base || !cs->tint)
                LogDebug("PdfColor: %s alternate or tint transform unusable (%s)", family.c_str(), altWhy.c_str());
            return cs;
        }

        if (family == "/Pattern")
        {
            auto cs = std::make_shared<PdfColorSpace>();
            cs->kind = PdfColorSpaceKind::Pattern;
            if (arr->items.size() > 1)
                cs->base = Parse(doc, resources, item(1), why, depth + 1);
            return cs;
        }

        why = "unsupported colour space family " + family;
        return nullptr;
    }
}
