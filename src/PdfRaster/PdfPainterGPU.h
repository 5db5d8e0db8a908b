#pragma once
#include "IPdfPainter.h"

#include <EGL/egl.h>
#include <vector>

namespace pdfraster
{
    // =====================================================
    // PdfPainterGPU - OpenGL rendering on an off-screen EGL context
    //
    // Fills are stencil-then-cover into a multisampled framebuffer.
    // Clips are single-sample coverage textures, each one already
    // multiplied by its parent. The context belongs to the thread that
    // called beginPage.
    // =====================================================
    class PdfPainterGPU : public IPdfPainter
    {
    public:
        PdfPainterGPU() = default;
        ~PdfPainterGPU() override;

        PdfPainterGPU(const PdfPainterGPU&) = delete;
        PdfPainterGPU& operator=(const PdfPainterGPU&) = delete;

        // EGL display, context and GL objects; fails with
        // RenderBackendFault when no GL 3.3 context can be made
        bool initialize(PdfError& err);

        // True when an EGL display with an OpenGL-capable config exists
        static bool IsAvailable();

        // ==================== IPdfPainter Implementation ====================
        bool beginPage(int width, int height, const float background[4], PdfError& err) override;

        int width() const override { return _w; }
        int height() const override { return _h; }

        void fill(const PdfContours& contours, bool evenOdd, const PdfPaintSource& paint) override;

        void pushClip(const PdfContours& contours, bool evenOdd) override;
        void popClip() override;

        bool endPage(std::vector<uint8_t>& rgba, PdfError& err) override;

        bool isGPU() const override { return true; }
        const char* name() const override { return "gpu"; }

        static constexpr int MAX_SAMPLES = 16;

    private:
        enum CoverMode
        {
            CoverSolid = 0,
            CoverTexture = 1,
            CoverClip = 2
        };

        // ===== EGL =====
        EGLDisplay _display = EGL_NO_DISPLAY;
        EGLContext _context = EGL_NO_CONTEXT;
        EGLSurface _surface = EGL_NO_SURFACE;
        bool _initialized = false;

        // ===== GL objects =====
        unsigned int _program = 0;
        unsigned int _vao = 0;
        unsigned int _vbo = 0;

        unsigned int _fbo = 0;          // multisampled colour + stencil
        unsigned int _colorRb = 0;
        unsigned int _stencilRb = 0;

        unsigned int _maskFbo = 0;      // multisampled R8 + stencil for clips
        unsigned int _maskRb = 0;
        unsigned int _maskStencilRb = 0;

        unsigned int _resolveFbo = 0;   // single-sample blit target

        int _samples = 1;
        int _maxTextureSize = 0;

        // uniform locations
        int _uViewport = -1;
        int _uMode = -1;
        int _uColor = -1;
        int _uAlpha = -1;
        int _uDeviceToTex = -1;
        int _uTexture = -1;
        int _uClip = -1;
        int _uHasClip = -1;

        int _w = 0;
        int _h = 0;
        bool _lost = false;

        // resolved clip textures, innermost last; 0 is an empty clip
        std::vector<unsigned int> _clips;

        bool createContext(PdfError& err);
        bool createProgram(PdfError& err);
        bool createTargets(PdfError& err);
        void destroyTargets();
        void destroy();

        bool makeCurrent();
        bool checkError(const char* where);

        // Writes the contour winding into the stencil of the bound
        // framebuffer; returns the covering rectangle
        bool stencil(const PdfContours& contours, bool evenOdd,
            float& x0, float& y0, float& x1, float& y1);

        void cover(float x0, float y0, float x1, float y1, bool evenOdd);

        unsigned int uploadTexture(const std::vector<uint8_t>& premultiplied, int w, int h, bool linear);
        unsigned int bakeShading(const PdfPaintSource& paint, int x0, int y0, int x1, int y1);
        unsigned int uploadImage(const PdfImage& image);

        void bindClip();
    };
}
