#include "PdfShading.h"
#include "PdfDocument.h"
#include "PdfDebug.h"

#include <algorithm>
#include <cmath>

namespace pdfraster
{
    PdfRGB PdfShading::colorFromComponents(const std::vector<double>& in) const
    {
        std::vector<double> comps;
        if (function)
            function->evaluate(in, comps);
        else
            comps = in;

        PdfRGB rgb;
        if (colorSpace)
            colorSpace->toRGB(comps.data(), comps.size(), rgb);
        return rgb;
    }

    void PdfShading::buildLUT()
    {
        _lut.resize(LUT_SIZE * 3);
        for (int i = 0; i < LUT_SIZE; ++i)
        {
            double s = static_cast<double>(i) / (LUT_SIZE - 1);
            double t = t0 + s * (t1 - t0);
            PdfRGB rgb = colorFromComponents({ t });
            _lut[i * 3 + 0] = static_cast<float>(rgb.r);
            _lut[i * 3 + 1] = static_cast<float>(rgb.g);
            _lut[i * 3 + 2] = static_cast<float>(rgb.b);
        }
    }

    PdfRGB PdfShading::colorAt(double s) const
    {
        s = std::min(1.0, std::max(0.0, s));
        if (_lut.empty())
            return colorFromComponents({ t0 + s * (t1 - t0) });

        // linear interpolation between neighbouring LUT entries
        double pos = s * (LUT_SIZE - 1);
        int i = static_cast<int>(pos);
        int j = std::min(i + 1, LUT_SIZE - 1);
        double f = pos - i;
        PdfRGB rgb;
        rgb.r = _lut[i * 3 + 0] + f * (_lut[j * 3 + 0] - _lut[i * 3 + 0]);
        rgb.g = _lut[i * 3 + 1] + f * (_lut[j * 3 + 1] - _lut[i * 3 + 1]);
        rgb.b = _lut[i * 3 + 2] + f * (_lut[j * 3 + 2] - _lut[i * 3 + 2]);
        return rgb;
    }

    bool PdfShading::radialParameter(double x, double y, double& s) const
    {
        double cdx = x - x0;
        double cdy = y - y0;
        double pdx = x1 - x0;
        double pdy = y1 - y0;
        double dr = r1 - r0;

        double a = pdx * pdx + pdy * pdy - dr * dr;
        double b = cdx * pdx + cdy * pdy + r0 * dr;
        double c = cdx * cdx + cdy * cdy - r0 * r0;

        auto accept = [&](double t) {
            if (r0 + t * dr < 0)
                return false;
            if (t < 0 && !extendStart)
                return false;
            if (t > 1 && !extendEnd)
                return false;
            s = t;
            return true;
        };

        if (std::fabs(a) < 1e-12)
        {
            if (std::fabs(b) < 1e-12)
                return false;
            return accept(c / (2.0 * b));
        }

        double disc = b * b - a * c;
        if (disc < 0)
            return false;
        double root = std::sqrt(disc);
        double ta = (b + root) / a;
        double tb = (b - root) / a;
        // the larger parameter paints on top
        if (ta < tb)
            std::swap(ta, tb);
        return accept(ta) || accept(tb);
    }

    bool PdfShading::evaluate(double x, double y, PdfRGB& out) const
    {
        switch (type)
        {
        case 1:
        {
            double dx, dy;
            _inverseMatrix.apply(x, y, dx, dy);
            if (dx < domain[0] || dx > domain[1] || dy < domain[2] || dy > domain[3])
                return false;
            out = colorFromComponents({ dx, dy });
            return true;
        }
        case 2:
        {
            double ax = x1 - x0;
            double ay = y1 - y0;
            double len2 = ax * ax + ay * ay;
            double s = len2 > 0 ? ((x - x0) * ax + (y - y0) * ay) / len2 : 0.0;
            if (s < 0 && !extendStart)
                return false;
            if (s > 1 && !extendEnd)
                return false;
            out = colorAt(s);
            return true;
        }
        case 3:
        {
            double s;
            if (!radialParameter(x, y, s))
                return false;
            out = colorAt(s);
            return true;
        }
        default:
            return false;
        }
    }

    std::shared_ptr<const PdfShading> PdfShading::Parse(const PdfDocument& doc,
        const PdfResources* resources,
        const PdfObjectPtr& objIn,
        std::string& why)
    {
        auto obj = doc.resolveIndirect(objIn);
        auto dict = AsDict(obj);
        if (!dict)
        {
            why = "shading is not a dictionary";
            return nullptr;
        }

        auto shading = std::make_shared<PdfShading>();
        shading->type = static_cast<int>(doc.getNumberOr(dict, "/ShadingType", 0));
        if (shading->type < 1 || shading->type > 3)
        {
            why = "shading type " + std::to_string(shading->type) + " is not supported";
            return nullptr;
        }

        shading->colorSpace = PdfColorSpace::Parse(doc, resources, doc.get(dict, "/ColorSpace"), why);
        if (!shading->colorSpace)
            return nullptr;

        shading->function = PdfFunction::Parse(doc, doc.get(dict, "/Function"));
        if (!shading->function)
        {
            why = "shading function missing or unreadable";
            return nullptr;
        }

        if (shading->type == 1)
        {
            auto dom = doc.numbers(doc.getArray(dict, "/Domain"));
            for (size_t i = 0; i < 4 && i < dom.size(); ++i)
                shading->domain[i] = dom[i];
            auto m = doc.numbers(doc.getArray(dict, "/Matrix"));
            if (m.size() >= 6)
                shading->matrix = PdfMatrix(m[0], m[1], m[2], m[3], m[4], m[5]);
            if (!shading->matrix.invert(shading->_inverseMatrix))
            {
                why = "shading matrix is singular";
                return nullptr;
            }
            return shading;
        }

        auto coords = doc.numbers(doc.getArray(dict, "/Coords"));
        if (shading->type == 2 && coords.size() >= 4)
        {
            shading->x0 = coords[0];
            shading->y0 = coords[1];
            shading->x1 = coords[2];
            shading->y1 = coords[3];
        }
        else if (shading->type == 3 && coords.size() >= 6)
        {
            shading->x0 = coords[0];
            shading->y0 = coords[1];
            shading->r0 = coords[2];
            shading->x1 = coords[3];
            shading->y1 = coords[4];
            shading->r1 = coords[5];
        }
        else
        {
            why = "shading /Coords missing";
            return nullptr;
        }

        auto dom = doc.numbers(doc.getArray(dict, "/Domain"));
        if (dom.size() >= 2)
        {
            shading->t0 = dom[0];
            shading->t1 = dom[1];
        }

        if (auto ext = doc.getArray(dict, "/Extend"))
        {
            if (ext->items.size() >= 2)
            {
                auto a = std::dynamic_pointer_cast<PdfBoolean>(doc.resolveIndirect(ext->items[0]));
                auto b = std::dynamic_pointer_cast<PdfBoolean>(doc.resolveIndirect(ext->items[1]));
                shading->extendStart = a && a->value;
                shading->extendEnd = b && b->value;
            }
        }

        shading->buildLUT();
        LogDebug("PdfShading: type %d, LUT built", shading->type);
        return shading;
    }
}
