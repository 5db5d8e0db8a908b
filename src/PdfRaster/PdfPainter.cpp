#include "PdfPainter.h"
#include "PdfDebug.h"

#include <algorithm>
#include <cmath>
#include <new>

namespace pdfraster
{
    namespace
    {
        struct Edge
        {
            double y0, y1; // y0 < y1
            double x0;     // x at y0
            double dxdy;
            int dir;
        };

        struct Crossing
        {
            double x;
            int dir;
        };

        inline float clamp01(float v)
        {
            return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v);
        }
    }

    // ---------------------------------------------------------
    // Page lifecycle
    // ---------------------------------------------------------

    bool PdfPainter::beginPage(int width, int height, const float background[4], PdfError& err)
    {
        if (width <= 0 || height <= 0)
        {
            err.set(PdfErrorCode::RenderBackendFault, "empty render target");
            return false;
        }

        _w = width;
        _h = height;
        _clips.clear();
        _allocFailed = false;

        try
        {
            _buffer.assign(static_cast<size_t>(width) * height * 4, 0.0f);
        }
        catch (const std::bad_alloc&)
        {
            _buffer.clear();
            err.set(PdfErrorCode::RenderBackendFault,
                "cannot allocate a " + std::to_string(width) + "x" + std::to_string(height) + " target");
            return false;
        }

        float a = clamp01(background[3]);
        if (a > 0)
        {
            float pr = clamp01(background[0]) * a;
            float pg = clamp01(background[1]) * a;
            float pb = clamp01(background[2]) * a;
            for (size_t i = 0; i < _buffer.size(); i += 4)
            {
                _buffer[i + 0] = pr;
                _buffer[i + 1] = pg;
                _buffer[i + 2] = pb;
                _buffer[i + 3] = a;
            }
        }

        LogDebug("[PdfPainter] begin %dx%d", width, height);
        return true;
    }

    bool PdfPainter::endPage(std::vector<uint8_t>& rgba, PdfError& err)
    {
        if (_allocFailed || _buffer.empty())
        {
            err.set(PdfErrorCode::RenderBackendFault, "render target allocation failed");
            return false;
        }

        rgba.resize(static_cast<size_t>(_w) * _h * 4);
        for (size_t i = 0; i < _buffer.size(); i += 4)
        {
            float a = clamp01(_buffer[i + 3]);
            if (a <= 0.0f)
            {
                rgba[i + 0] = rgba[i + 1] = rgba[i + 2] = rgba[i + 3] = 0;
                continue;
            }
            for (int c = 0; c < 3; ++c)
                rgba[i + c] = static_cast<uint8_t>(std::lround(clamp01(_buffer[i + c] / a) * 255.0f));
            rgba[i + 3] = static_cast<uint8_t>(std::lround(a * 255.0f));
        }

        _clips.clear();
        return true;
    }

    // ---------------------------------------------------------
    // Coverage
    // ---------------------------------------------------------

    bool PdfPainter::paintBounds(const PdfContours& contours, int& x0, int& y0, int& x1, int& y1) const
    {
        double bx0, by0, bx1, by1;
        if (!PdfTessellator::Bounds(contours, bx0, by0, bx1, by1))
            return false;
        if (!std::isfinite(bx0) || !std::isfinite(by0) || !std::isfinite(bx1) || !std::isfinite(by1))
            return false;

        x0 = static_cast<int>(std::max(0.0, std::floor(bx0)));
        y0 = static_cast<int>(std::max(0.0, std::floor(by0)));
        x1 = static_cast<int>(std::min(static_cast<double>(_w), std::ceil(bx1)));
        y1 = static_cast<int>(std::min(static_cast<double>(_h), std::ceil(by1)));

        if (!_clips.empty())
        {
            const CoverageMask& clip = _clips.back();
            x0 = std::max(x0, clip.x0);
            y0 = std::max(y0, clip.y0);
            x1 = std::min(x1, clip.x1);
            y1 = std::min(y1, clip.y1);
        }
        return x0 < x1 && y0 < y1;
    }

    bool PdfPainter::rasterize(const PdfContours& contours, bool evenOdd, CoverageMask& mask) const
    {
        const int bw = mask.x1 - mask.x0;
        const int bh = mask.y1 - mask.y0;
        mask.cov.assign(static_cast<size_t>(bw) * bh, 0.0f);

        std::vector<Edge> edges;
        for (const auto& c : contours)
        {
            const size_t n = c.size();
            for (size_t i = 0; i < n; ++i)
            {
                const DPoint& p = c[i];
                const DPoint& q = c[(i + 1) % n];
                if (p.y == q.y)
                    continue;

                Edge e;
                e.dir = q.y > p.y ? 1 : -1;
                const DPoint& top = q.y > p.y ? p : q;
                const DPoint& bottom = q.y > p.y ? q : p;
                e.y0 = top.y;
                e.y1 = bottom.y;
                if (e.y1 <= mask.y0 || e.y0 >= mask.y1)
                    continue;
                e.x0 = top.x;
                e.dxdy = (bottom.x - top.x) / (bottom.y - top.y);
                edges.push_back(e);
            }
        }
        if (edges.empty())
            return true;

        std::sort(edges.begin(), edges.end(), [](const Edge& a, const Edge& b) { return a.y0 < b.y0; });

        const float w = 1.0f / SUBSAMPLES;
        std::vector<size_t> active;
        std::vector<Crossing> crossings;
        std::vector<float> delta(bw + 1);
        size_t next = 0;

        for (int y = mask.y0; y < mask.y1; ++y)
        {
            if ((y - mask.y0) % BAND_ROWS == 0 && cancelled())
                return false;

            float* row = &mask.cov[static_cast<size_t>(y - mask.y0) * bw];
            std::fill(delta.begin(), delta.end(), 0.0f);

            // exact horizontal coverage of [xa, xb) on one sub-scanline
            auto addSpan = [&](double xa, double xb) {
                xa = std::max(xa, static_cast<double>(mask.x0)) - mask.x0;
                xb = std::min(xb, static_cast<double>(mask.x1)) - mask.x0;
                if (xb <= xa)
                    return;
                int ia = static_cast<int>(xa);
                int ib = static_cast<int>(xb);
                if (ia == ib)
                {
                    row[ia] += static_cast<float>(xb - xa) * w;
                    return;
                }
                row[ia] += static_cast<float>(ia + 1 - xa) * w;
                delta[ia + 1] += w;
                delta[ib] -= w;
                if (ib < bw)
                    row[ib] += static_cast<float>(xb - ib) * w;
            };

            for (int s = 0; s < SUBSAMPLES; ++s)
            {
                const double sy = y + (s + 0.5) / SUBSAMPLES;

                while (next < edges.size() && edges[next].y0 <= sy)
                    active.push_back(next++);
                active.erase(std::remove_if(active.begin(), active.end(),
                    [&](size_t i) { return edges[i].y1 <= sy; }), active.end());

                crossings.clear();
                for (size_t i : active)
                {
                    const Edge& e = edges[i];
                    crossings.push_back({ e.x0 + (sy - e.y0) * e.dxdy, e.dir });
                }
                if (crossings.size() < 2)
                    continue;
                std::sort(crossings.begin(), crossings.end(),
                    [](const Crossing& a, const Crossing& b) { return a.x < b.x; });

                int winding = 0;
                for (size_t i = 0; i + 1 < crossings.size(); ++i)
                {
                    winding += evenOdd ? 1 : crossings[i].dir;
                    bool inside = evenOdd ? (winding & 1) != 0 : winding != 0;
                    if (inside)
                        addSpan(crossings[i].x, crossings[i + 1].x);
                }
            }

            float run = 0.0f;
            for (int x = 0; x < bw; ++x)
            {
                run += delta[x];
                row[x] = clamp01(row[x] + run);
            }
        }
        return true;
    }

    // ---------------------------------------------------------
    // Paint sources
    // ---------------------------------------------------------

    bool PdfPainter::sample(const PdfPaintSource& paint, int x, int y, float out[4]) const
    {
        const double cx = x + 0.5;
        const double cy = y + 0.5;

        switch (paint.kind)
        {
        case PdfPaintSource::Solid:
            out[0] = paint.r;
            out[1] = paint.g;
            out[2] = paint.b;
            out[3] = 1.0f;
            return true;

        case PdfPaintSource::Shading:
        {
            double sx, sy;
            paint.deviceToShading.apply(cx, cy, sx, sy);
            PdfRGB rgb;
            if (!paint.shading || !paint.shading->evaluate(sx, sy, rgb))
                return false;
            out[0] = static_cast<float>(rgb.r);
            out[1] = static_cast<float>(rgb.g);
            out[2] = static_cast<float>(rgb.b);
            out[3] = 1.0f;
            return true;
        }

        case PdfPaintSource::Image:
        {
            const PdfImage* img = paint.image.get();
            if (!img || img->width <= 0 || img->height <= 0)
                return false;

            double u, v;
            paint.deviceToImage.apply(cx, cy, u, v);
            u = std::min(std::max(u, 0.0), 1.0);
            v = std::min(std::max(v, 0.0), 1.0);

            // row 0 is the top of the unit square
            double fx = u * img->width;
            double fy = (1.0 - v) * img->height;

            auto texel = [&](int tx, int ty, float t[4]) {
                tx = std::min(std::max(tx, 0), img->width - 1);
                ty = std::min(std::max(ty, 0), img->height - 1);
                const uint8_t* p = &img->rgba[(static_cast<size_t>(ty) * img->width + tx) * 4];
                float a = p[3] / 255.0f;
                // premultiply so filtering does not bleed transparent colour
                t[0] = p[0] / 255.0f * a;
                t[1] = p[1] / 255.0f * a;
                t[2] = p[2] / 255.0f * a;
                t[3] = a;
            };

            float pm[4];
            if (!img->interpolate)
            {
                texel(static_cast<int>(fx), static_cast<int>(fy), pm);
            }
            else
            {
                double gx = fx - 0.5, gy = fy - 0.5;
                int ix = static_cast<int>(std::floor(gx));
                int iy = static_cast<int>(std::floor(gy));
                float tx = static_cast<float>(gx - ix);
                float ty = static_cast<float>(gy - iy);
                float t00[4], t10[4], t01[4], t11[4];
                texel(ix, iy, t00);
                texel(ix + 1, iy, t10);
                texel(ix, iy + 1, t01);
                texel(ix + 1, iy + 1, t11);
                for (int c = 0; c < 4; ++c)
                {
                    float top = t00[c] + (t10[c] - t00[c]) * tx;
                    float bottom = t01[c] + (t11[c] - t01[c]) * tx;
                    pm[c] = top + (bottom - top) * ty;
                }
            }

            if (pm[3] <= 0.0f)
                return false;
            out[0] = pm[0] / pm[3];
            out[1] = pm[1] / pm[3];
            out[2] = pm[2] / pm[3];
            out[3] = pm[3];
            return true;
        }
        }
        return false;
    }

    // ---------------------------------------------------------
    // Fill & clip
    // ---------------------------------------------------------

    void PdfPainter::fill(const PdfContours& contours, bool evenOdd, const PdfPaintSource& paint)
    {
        if (_buffer.empty() || paint.alpha <= 0.0f)
            return;

        CoverageMask mask;
        if (!paintBounds(contours, mask.x0, mask.y0, mask.x1, mask.y1))
            return;

        try
        {
            if (!rasterize(contours, evenOdd, mask))
                return;
        }
        catch (const std::bad_alloc&)
        {
            _allocFailed = true;
            return;
        }

        const CoverageMask* clip = _clips.empty() ? nullptr : &_clips.back();
        const int bw = mask.x1 - mask.x0;

        for (int y = mask.y0; y < mask.y1; ++y)
        {
            if ((y - mask.y0) % BAND_ROWS == 0 && cancelled())
                return;

            const float* covRow = &mask.cov[static_cast<size_t>(y - mask.y0) * bw];
            float* dst = &_buffer[(static_cast<size_t>(y) * _w + mask.x0) * 4];

            for (int x = mask.x0; x < mask.x1; ++x, dst += 4)
            {
                float m = covRow[x - mask.x0];
                if (m <= 0.0f)
                    continue;
                if (clip)
                {
                    m *= clip->at(x, y);
                    if (m <= 0.0f)
                        continue;
                }

                float src[4];
                if (!sample(paint, x, y, src))
                    continue;

                // premultiplied source-over
                float a = src[3] * paint.alpha * m;
                float inv = 1.0f - a;
                dst[0] = src[0] * a + dst[0] * inv;
                dst[1] = src[1] * a + dst[1] * inv;
                dst[2] = src[2] * a + dst[2] * inv;
                dst[3] = a + dst[3] * inv;
            }
        }
    }

    void PdfPainter::pushClip(const PdfContours& contours, bool evenOdd)
    {
        CoverageMask mask;
        if (_buffer.empty() || !paintBounds(contours, mask.x0, mask.y0, mask.x1, mask.y1))
        {
            // nothing visible until the matching pop
            _clips.push_back(CoverageMask());
            return;
        }

        try
        {
            if (!rasterize(contours, evenOdd, mask))
            {
                _clips.push_back(CoverageMask());
                return;
            }
        }
        catch (const std::bad_alloc&)
        {
            _allocFailed = true;
            _clips.push_back(CoverageMask());
            return;
        }

        // intersect with the enclosing clip
        if (!_clips.empty())
        {
            const CoverageMask& parent = _clips.back();
            const int bw = mask.x1 - mask.x0;
            for (int y = mask.y0; y < mask.y1; ++y)
            {
                float* row = &mask.cov[static_cast<size_t>(y - mask.y0) * bw];
                for (int x = mask.x0; x < mask.x1; ++x)
                    row[x - mask.x0] *= parent.at(x, y);
            }
        }

        _clips.push_back(std::move(mask));
    }

    void PdfPainter::popClip()
    {
        if (!_clips.empty())
            _clips.pop_back();
    }
}
