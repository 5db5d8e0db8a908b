#pragma once
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace pdfraster
{
    struct PdfMatrix
    {
        // a b 0
        // c d 0
        // e f 1
        double a = 1, b = 0, c = 0, d = 1, e = 0, f = 0;

        PdfMatrix() = default;
        PdfMatrix(double a_, double b_, double c_, double d_, double e_, double f_)
            : a(a_), b(b_), c(c_), d(d_), e(e_), f(f_)
        {
        }

        void apply(double x, double y, double& ox, double& oy) const
        {
            ox = a * x + c * y + e;
            oy = b * x + d * y + f;
        }

        double determinant() const { return a * d - b * c; }

        bool invert(PdfMatrix& out) const
        {
            double det = determinant();
            if (std::fabs(det) < 1e-12)
                return false;
            out.a = d / det;
            out.b = -b / det;
            out.c = -c / det;
            out.d = a / det;
            out.e = (c * f - d * e) / det;
            out.f = (b * e - a * f) / det;
            return true;
        }

        // Longest axis scale; used to size line widths in device space
        double maxScale() const
        {
            double sx = std::sqrt(a * a + b * b);
            double sy = std::sqrt(c * c + d * d);
            return std::max(sx, sy);
        }

        bool operator==(const PdfMatrix& o) const
        {
            return a == o.a && b == o.b && c == o.c && d == o.d && e == o.e && f == o.f;
        }
        bool operator!=(const PdfMatrix& o) const { return !(*this == o); }
    };

    // R = A * B: apply A first, then B
    inline PdfMatrix PdfMul(const PdfMatrix& A, const PdfMatrix& B)
    {
        PdfMatrix R;
        R.a = A.a * B.a + A.b * B.c;
        R.b = A.a * B.b + A.b * B.d;
        R.c = A.c * B.a + A.d * B.c;
        R.d = A.c * B.b + A.d * B.d;
        R.e = A.e * B.a + A.f * B.c + B.e;
        R.f = A.e * B.b + A.f * B.d + B.f;
        return R;
    }

    struct PdfPathSegment
    {
        enum Type
        {
            MoveTo,
            LineTo,
            CurveTo,
            Close
        } type;

        // MoveTo / LineTo
        double x = 0;
        double y = 0;

        // CurveTo control points; (x3, y3) is the end point
        double x1 = 0, y1 = 0;
        double x2 = 0, y2 = 0;
        double x3 = 0, y3 = 0;

        PdfPathSegment(Type t, double xx, double yy)
            : type(t), x(xx), y(yy)
        {
        }

        PdfPathSegment(double cx1, double cy1,
            double cx2, double cy2,
            double cx3, double cy3)
            : type(CurveTo),
            x1(cx1), y1(cy1),
            x2(cx2), y2(cy2),
            x3(cx3), y3(cy3)
        {
        }

        PdfPathSegment()
            : type(Close)
        {
        }
    };

    using PdfPath = std::vector<PdfPathSegment>;

    inline PdfPath TransformPath(const PdfPath& path, const PdfMatrix& m)
    {
        PdfPath out;
        out.reserve(path.size());
        for (const auto& s : path)
        {
            PdfPathSegment t = s;
            switch (s.type)
            {
            case PdfPathSegment::MoveTo:
            case PdfPathSegment::LineTo:
                m.apply(s.x, s.y, t.x, t.y);
                break;
            case PdfPathSegment::CurveTo:
                m.apply(s.x1, s.y1, t.x1, t.y1);
                m.apply(s.x2, s.y2, t.x2, t.y2);
                m.apply(s.x3, s.y3, t.x3, t.y3);
                break;
            case PdfPathSegment::Close:
                break;
            }
            out.push_back(t);
        }
        return out;
    }

    // Control-point bounds; false for an empty path
    inline bool PathBounds(const PdfPath& path, double& x0, double& y0, double& x1, double& y1)
    {
        x0 = y0 = std::numeric_limits<double>::max();
        x1 = y1 = std::numeric_limits<double>::lowest();
        bool any = false;
        auto add = [&](double x, double y) {
            x0 = std::min(x0, x); y0 = std::min(y0, y);
            x1 = std::max(x1, x); y1 = std::max(y1, y);
            any = true;
        };
        for (const auto& s : path)
        {
            if (s.type == PdfPathSegment::MoveTo || s.type == PdfPathSegment::LineTo)
            {
                add(s.x, s.y);
            }
            else if (s.type == PdfPathSegment::CurveTo)
            {
                add(s.x1, s.y1);
                add(s.x2, s.y2);
                add(s.x3, s.y3);
            }
        }
        return any;
    }

    inline void AppendRect(PdfPath& path, double x, double y, double w, double h)
    {
        path.emplace_back(PdfPathSegment::MoveTo, x, y);
        path.emplace_back(PdfPathSegment::LineTo, x + w, y);
        path.emplace_back(PdfPathSegment::LineTo, x + w, y + h);
        path.emplace_back(PdfPathSegment::LineTo, x, y + h);
        path.emplace_back();
    }
}
