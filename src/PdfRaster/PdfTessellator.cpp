#include "PdfTessellator.h"

#include <algorithm>
#include <cmath>

namespace pdfraster
{
    namespace
    {
        const double kPi = 3.14159265358979323846;

        inline double dot2(double ax, double ay, double bx, double by) { return ax * bx + ay * by; }
        inline double cross2(double ax, double ay, double bx, double by) { return ax * by - ay * bx; }

        // Squared distance from p to the infinite line a-b; to a when a == b
        inline double distPointLineSq(double px, double py, double ax, double ay, double bx, double by)
        {
            double dx = bx - ax, dy = by - ay;
            double lenSq = dx * dx + dy * dy;
            if (lenSq < 1e-24)
                return (px - ax) * (px - ax) + (py - ay) * (py - ay);
            double c = cross2(dx, dy, px - ax, py - ay);
            return c * c / lenSq;
        }

        void flattenCubic(double x0, double y0, double x1, double y1,
            double x2, double y2, double x3, double y3,
            std::vector<DPoint>& out, double tolSq, int depth = 0)
        {
            const int MAX_DEPTH = 16;

            double flatness = std::max(distPointLineSq(x1, y1, x0, y0, x3, y3),
                distPointLineSq(x2, y2, x0, y0, x3, y3));
            if (depth >= MAX_DEPTH || flatness <= tolSq)
            {
                out.push_back({ x3, y3 });
                return;
            }

            // de Casteljau at t = 0.5
            double x01 = (x0 + x1) * 0.5, y01 = (y0 + y1) * 0.5;
            double x12 = (x1 + x2) * 0.5, y12 = (y1 + y2) * 0.5;
            double x23 = (x2 + x3) * 0.5, y23 = (y2 + y3) * 0.5;
            double x012 = (x01 + x12) * 0.5, y012 = (y01 + y12) * 0.5;
            double x123 = (x12 + x23) * 0.5, y123 = (y12 + y23) * 0.5;
            double xm = (x012 + x123) * 0.5, ym = (y012 + y123) * 0.5;

            flattenCubic(x0, y0, x01, y01, x012, y012, xm, ym, out, tolSq, depth + 1);
            flattenCubic(xm, ym, x123, y123, x23, y23, x3, y3, out, tolSq, depth + 1);
        }

        inline bool samePoint(const DPoint& a, const DPoint& b)
        {
            double dx = a.x - b.x, dy = a.y - b.y;
            return dx * dx + dy * dy < 1e-18;
        }

        double signedArea(const PdfContour& c)
        {
            double area = 0.0;
            for (size_t i = 0, n = c.size(); i < n; ++i)
            {
                const DPoint& p = c[i];
                const DPoint& q = c[(i + 1) % n];
                area += p.x * q.y - q.x * p.y;
            }
            return area * 0.5;
        }

        // Every stroke piece is stored with positive area so the union
        // fills correctly under the nonzero rule
        void addPiece(PdfContours& out, PdfContour piece)
        {
            double area = signedArea(piece);
            if (std::fabs(area) < 1e-18)
                return;
            if (area < 0)
                std::reverse(piece.begin(), piece.end());
            out.push_back(std::move(piece));
        }

        int arcSteps(double radius, double sweep, double tolerance)
        {
            double step = kPi / 4;
            if (radius > tolerance)
                step = 2.0 * std::acos(std::max(-1.0, 1.0 - tolerance / radius));
            step = std::max(step, kPi / 128);
            return std::max(4, std::min(256, static_cast<int>(std::ceil(std::fabs(sweep) / step))));
        }

        void addCircle(PdfContours& out, const DPoint& c, double r, double tolerance)
        {
            int steps = arcSteps(r, 2 * kPi, tolerance);
            PdfContour circle;
            circle.reserve(steps);
            for (int i = 0; i < steps; ++i)
            {
                double a = 2 * kPi * i / steps;
                circle.push_back({ c.x + std::cos(a) * r, c.y + std::sin(a) * r });
            }
            addPiece(out, std::move(circle));
        }

        // Left normal of a unit direction
        inline DPoint normalOf(const DPoint& d) { return { -d.y, d.x }; }

        inline DPoint direction(const DPoint& a, const DPoint& b)
        {
            double dx = b.x - a.x, dy = b.y - a.y;
            double len = std::sqrt(dx * dx + dy * dy);
            if (len < 1e-300)
                return { 1, 0 };
            return { dx / len, dy / len };
        }
    }

    // =========================================================
    // Flattening
    // =========================================================

    void PdfTessellator::flatten(const PdfPath& path, const PdfMatrix& m, double tolerance,
        std::vector<Polyline>& out)
    {
        const double tolSq = tolerance * tolerance;
        Polyline cur;
        DPoint start{ 0, 0 };
        DPoint pt{ 0, 0 };
        bool hasPoint = false;

        auto flush = [&]() {
            if (!cur.points.empty())
                out.push_back(std::move(cur));
            cur = Polyline();
        };

        auto beginAt = [&](const DPoint& p) {
            flush();
            cur.points.push_back(p);
            start = p;
            pt = p;
            hasPoint = true;
        };

        for (const auto& s : path)
        {
            switch (s.type)
            {
            case PdfPathSegment::MoveTo:
            {
                DPoint p;
                m.apply(s.x, s.y, p.x, p.y);
                beginAt(p);
                break;
            }
            case PdfPathSegment::LineTo:
            {
                DPoint p;
                m.apply(s.x, s.y, p.x, p.y);
                if (!hasPoint)
                {
                    beginAt(p);
                    break;
                }
                if (cur.points.empty())
                    cur.points.push_back(pt);
                cur.points.push_back(p);
                pt = p;
                break;
            }
            case PdfPathSegment::CurveTo:
            {
                DPoint c1, c2, p;
                m.apply(s.x1, s.y1, c1.x, c1.y);
                m.apply(s.x2, s.y2, c2.x, c2.y);
                m.apply(s.x3, s.y3, p.x, p.y);
                if (!hasPoint)
                {
                    beginAt(p);
                    break;
                }
                if (cur.points.empty())
                    cur.points.push_back(pt);
                flattenCubic(pt.x, pt.y, c1.x, c1.y, c2.x, c2.y, p.x, p.y, cur.points, tolSq);
                pt = p;
                break;
            }
            case PdfPathSegment::Close:
                if (!cur.points.empty())
                {
                    cur.closed = true;
                    flush();
                }
                // drawing continues from the subpath start
                pt = start;
                break;
            }
        }
        flush();
    }

    void PdfTessellator::FlattenFill(const PdfPath& path, const PdfMatrix& toDevice, PdfContours& out)
    {
        std::vector<Polyline> lines;
        flatten(path, toDevice, FLATTEN_TOLERANCE, lines);
        for (auto& l : lines)
        {
            if (l.points.size() >= 3)
                out.push_back(std::move(l.points));
        }
    }

    bool PdfTessellator::Bounds(const PdfContours& contours, double& x0, double& y0, double& x1, double& y1)
    {
        bool any = false;
        for (const auto& c : contours)
        {
            for (const auto& p : c)
            {
                if (!any)
                {
                    x0 = x1 = p.x;
                    y0 = y1 = p.y;
                    any = true;
                    continue;
                }
                x0 = std::min(x0, p.x);
                y0 = std::min(y0, p.y);
                x1 = std::max(x1, p.x);
                y1 = std::max(y1, p.y);
            }
        }
        return any;
    }

    PdfContour PdfTessellator::Rect(double x0, double y0, double x1, double y1)
    {
        return { { x0, y0 }, { x1, y0 }, { x1, y1 }, { x0, y1 } };
    }

    // =========================================================
    // Stroke-to-fill
    // =========================================================

    void PdfTessellator::StrokeOutline(const PdfPath& path, const PdfMatrix& toDevice,
        const PdfStrokeStyle& style, PdfContours& out)
    {
        double scale = toDevice.maxScale();
        if (scale < 1e-12 || std::fabs(toDevice.determinant()) < 1e-24)
            return;

        // width 0 is the thinnest line the device can show
        double width = style.width > 0 ? style.width : 1.0 / scale;
        double tolerance = FLATTEN_TOLERANCE / scale;

        std::vector<Polyline> lines;
        flatten(path, PdfMatrix(), tolerance, lines);

        std::vector<Polyline> dashed;
        if (!style.dash.array.empty())
        {
            applyDash(lines, style.dash, dashed);
            lines.swap(dashed);
        }

        PdfContours user;
        for (const auto& l : lines)
            strokePolyline(l, width * 0.5, style, tolerance, user);

        out.reserve(out.size() + user.size());
        for (auto& c : user)
        {
            for (auto& p : c)
                toDevice.apply(p.x, p.y, p.x, p.y);
            out.push_back(std::move(c));
        }
    }

    void PdfTessellator::applyDash(const std::vector<Polyline>& in, const PdfDash& dash,
        std::vector<Polyline>& out)
    {
        const auto& arr = dash.array;
        const size_t n = arr.size();
        double sum = 0;
        for (double d : arr)
            sum += d;
        if (sum <= 0)
        {
            out = in;
            return;
        }

        // an odd array repeats with on and off swapped
        double period = (n % 2) ? sum * 2 : sum;
        double phase = std::fmod(dash.phase, period);
        if (phase < 0)
            phase += period;

        size_t startIdx = 0;
        bool startOn = true;
        while (phase >= arr[startIdx] && phase > 0)
        {
            phase -= arr[startIdx];
            startIdx = (startIdx + 1) % n;
            startOn = !startOn;
        }
        const double startRem = arr[startIdx] - phase;

        size_t pieces = 0;
        for (const auto& line : in)
        {
            std::vector<DPoint> pts = line.points;
            if (line.closed && !pts.empty())
                pts.push_back(pts.front());

            size_t idx = startIdx;
            bool on = startOn;
            double rem = startRem;

            Polyline cur;
            if (on && !pts.empty())
                cur.points.push_back(pts[0]);

            for (size_t i = 0; i + 1 < pts.size(); ++i)
            {
                const DPoint a = pts[i];
                const DPoint b = pts[i + 1];
                double len = std::hypot(b.x - a.x, b.y - a.y);
                double t = 0;

                while (true)
                {
                    double step = std::min(rem, len - t);
                    t += step;
                    rem -= step;
                    DPoint q = len > 0 ? DPoint{ a.x + (b.x - a.x) * t / len, a.y + (b.y - a.y) * t / len } : b;
                    if (on)
                        cur.points.push_back(q);

                    if (rem > 1e-12)
                        break;

                    if (on)
                    {
                        out.push_back(std::move(cur));
                        cur = Polyline();
                        if (++pieces > MAX_DASH_PIECES)
                        {
                            out = in;
                            return;
                        }
                    }
                    idx = (idx + 1) % n;
                    on = !on;
                    rem = arr[idx];
                    if (on)
                        cur.points.push_back(q);
                    if (len - t <= 1e-12 && rem > 1e-12)
                        break;
                }
            }

            if (on && !cur.points.empty())
                out.push_back(std::move(cur));
        }
    }

    void PdfTessellator::strokePolyline(const Polyline& line, double hw, const PdfStrokeStyle& style,
        double tolerance, PdfContours& out)
    {
        std::vector<DPoint> pts;
        pts.reserve(line.points.size());
        for (const auto& p : line.points)
        {
            if (pts.empty() || !samePoint(pts.back(), p))
                pts.push_back(p);
        }
        bool closed = line.closed;
        if (closed && pts.size() > 1 && samePoint(pts.front(), pts.back()))
            pts.pop_back();

        if (pts.empty())
            return;

        // zero-length subpath: only round and square caps mark it
        if (pts.size() == 1)
        {
            const DPoint& p = pts[0];
            if (style.cap == 1)
                addCircle(out, p, hw, tolerance);
            else if (style.cap == 2)
                addPiece(out, Rect(p.x - hw, p.y - hw, p.x + hw, p.y + hw));
            return;
        }
        if (pts.size() == 2)
            closed = false;

        const size_t n = pts.size();
        const size_t segs = closed ? n : n - 1;

        for (size_t i = 0; i < segs; ++i)
        {
            const DPoint& a = pts[i];
            const DPoint& b = pts[(i + 1) % n];
            DPoint d = direction(a, b);
            DPoint nv = normalOf(d);
            addPiece(out, {
                { a.x + nv.x * hw, a.y + nv.y * hw },
                { b.x + nv.x * hw, b.y + nv.y * hw },
                { b.x - nv.x * hw, b.y - nv.y * hw },
                { a.x - nv.x * hw, a.y - nv.y * hw } });
        }

        auto join = [&](const DPoint& prev, const DPoint& p, const DPoint& next) {
            DPoint d0 = direction(prev, p);
            DPoint d1 = direction(p, next);
            double cr = cross2(d0.x, d0.y, d1.x, d1.y);
            double dt = dot2(d0.x, d0.y, d1.x, d1.y);
            if (std::fabs(cr) < 1e-12 && dt > 0)
                return;

            if (style.join == 1)
            {
                addCircle(out, p, hw, tolerance);
                return;
            }

            // outer side of the turn
            double s = cr > 0 ? -1.0 : 1.0;
            DPoint n0 = normalOf(d0);
            DPoint n1 = normalOf(d1);
            DPoint o0{ p.x + s * n0.x * hw, p.y + s * n0.y * hw };
            DPoint o1{ p.x + s * n1.x * hw, p.y + s * n1.y * hw };

            if (style.join == 0)
            {
                double mx = n0.x + n1.x, my = n0.y + n1.y;
                double ml = std::sqrt(mx * mx + my * my);
                if (ml > 1e-12)
                {
                    mx /= ml;
                    my /= ml;
                    double cosHalf = dot2(mx, my, n0.x, n0.y);
                    if (cosHalf > 1e-12 && 1.0 / cosHalf <= style.miterLimit)
                    {
                        double len = hw / cosHalf;
                        DPoint tip{ p.x + s * mx * len, p.y + s * my * len };
                        addPiece(out, { p, o0, tip, o1 });
                        return;
                    }
                }
            }
            addPiece(out, { p, o0, o1 });
        };

        if (closed)
        {
            for (size_t i = 0; i < n; ++i)
                join(pts[(i + n - 1) % n], pts[i], pts[(i + 1) % n]);
            return;
        }

        for (size_t i = 1; i + 1 < n; ++i)
            join(pts[i - 1], pts[i], pts[i + 1]);

        auto cap = [&](const DPoint& p, const DPoint& outward) {
            if (style.cap == 1)
            {
                addCircle(out, p, hw, tolerance);
            }
            else if (style.cap == 2)
            {
                DPoint nv = normalOf(outward);
                DPoint e{ p.x + outward.x * hw, p.y + outward.y * hw };
                addPiece(out, {
                    { p.x + nv.x * hw, p.y + nv.y * hw },
                    { e.x + nv.x * hw, e.y + nv.y * hw },
                    { e.x - nv.x * hw, e.y - nv.y * hw },
                    { p.x - nv.x * hw, p.y - nv.y * hw } });
            }
        };

        cap(pts[0], direction(pts[1], pts[0]));
        cap(pts[n - 1], direction(pts[n - 2], pts[n - 1]));
    }
}
