#include "PdfPainterGPU.h"
#include "PdfDebug.h"

#define GL_GLEXT_PROTOTYPES
#include <GL/gl.h>
#include <GL/glext.h>
#include <EGL/eglext.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace pdfraster
{
    namespace
    {
        const char* kVertexShader = R"(#version 330 core
layout(location = 0) in vec2 aPos;
uniform vec2 uViewport;
void main()
{
    // device y grows downwards and maps to framebuffer rows in order
    gl_Position = vec4(aPos / uViewport * 2.0 - 1.0, 0.0, 1.0);
}
)";

        const char* kFragmentShader = R"(#version 330 core
uniform int uMode;
uniform vec4 uColor;
uniform float uAlpha;
uniform mat3 uDeviceToTex;
uniform sampler2D uTexture;
uniform sampler2D uClip;
uniform bool uHasClip;
out vec4 fragColor;
void main()
{
    float m = uHasClip ? texelFetch(uClip, ivec2(gl_FragCoord.xy), 0).r : 1.0;
    if (uMode == 2)
    {
        fragColor = vec4(m, 0.0, 0.0, 1.0);
        return;
    }
    vec4 c = uColor;
    if (uMode == 1)
    {
        vec2 uv = (uDeviceToTex * vec3(gl_FragCoord.xy, 1.0)).xy;
        c = texture(uTexture, uv);
    }
    fragColor = c * (uAlpha * m);
}
)";

        bool compileShader(GLenum type, const char* source, GLuint& out, std::string& log)
        {
            GLuint shader = glCreateShader(type);
            glShaderSource(shader, 1, &source, nullptr);
            glCompileShader(shader);

            GLint status = 0;
            glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
            if (!status)
            {
                GLint length = 0;
                glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
                log.assign(std::max(length, 1), '\0');
                glGetShaderInfoLog(shader, length, nullptr, &log[0]);
                glDeleteShader(shader);
                return false;
            }
            out = shader;
            return true;
        }

        // column-major mat3 of an affine map
        void toMat3(const PdfMatrix& m, float out[9])
        {
            out[0] = static_cast<float>(m.a); out[1] = static_cast<float>(m.b); out[2] = 0.0f;
            out[3] = static_cast<float>(m.c); out[4] = static_cast<float>(m.d); out[5] = 0.0f;
            out[6] = static_cast<float>(m.e); out[7] = static_cast<float>(m.f); out[8] = 1.0f;
        }

        EGLDisplay openDisplay()
        {
            EGLDisplay display = eglGetDisplay(EGL_DEFAULT_DISPLAY);
            if (display != EGL_NO_DISPLAY && eglInitialize(display, nullptr, nullptr))
                return display;

            // headless machines
            display = eglGetPlatformDisplay(EGL_PLATFORM_SURFACELESS_MESA, EGL_DEFAULT_DISPLAY, nullptr);
            if (display != EGL_NO_DISPLAY && eglInitialize(display, nullptr, nullptr))
                return display;
            return EGL_NO_DISPLAY;
        }

        bool chooseConfig(EGLDisplay display, EGLConfig& config)
        {
            const EGLint attribs[] = {
                EGL_SURFACE_TYPE, EGL_PBUFFER_BIT,
                EGL_RENDERABLE_TYPE, EGL_OPENGL_BIT,
                EGL_RED_SIZE, 8,
                EGL_GREEN_SIZE, 8,
                EGL_BLUE_SIZE, 8,
                EGL_ALPHA_SIZE, 8,
                EGL_NONE
            };
            EGLint count = 0;
            return eglChooseConfig(display, attribs, &config, 1, &count) && count > 0;
        }
    }

    PdfPainterGPU::~PdfPainterGPU()
    {
        destroy();
    }

    bool PdfPainterGPU::IsAvailable()
    {
        EGLDisplay display = openDisplay();
        if (display == EGL_NO_DISPLAY)
            return false;
        EGLConfig config;
        return eglBindAPI(EGL_OPENGL_API) && chooseConfig(display, config);
    }

    // =========================================================
    // Context
    // =========================================================

    bool PdfPainterGPU::initialize(PdfError& err)
    {
        if (_initialized)
            return true;

        if (!createContext(err) || !createProgram(err))
        {
            destroy();
            return false;
        }

        glGenVertexArrays(1, &_vao);
        glGenBuffers(1, &_vbo);
        glBindVertexArray(_vao);
        glBindBuffer(GL_ARRAY_BUFFER, _vbo);
        glEnableVertexAttribArray(0);
        glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 2 * sizeof(float), nullptr);

        GLint maxSamples = 1;
        glGetIntegerv(GL_MAX_SAMPLES, &maxSamples);
        _samples = std::max(1, std::min(static_cast<int>(maxSamples), MAX_SAMPLES));
        glGetIntegerv(GL_MAX_TEXTURE_SIZE, &_maxTextureSize);

        if (!checkError("initialize"))
        {
            err.set(PdfErrorCode::RenderBackendFault, "GL setup failed");
            destroy();
            return false;
        }

        _initialized = true;
        LogDebug("[PdfPainterGPU] %s, %d samples", reinterpret_cast<const char*>(glGetString(GL_RENDERER)), _samples);
        return true;
    }

    bool PdfPainterGPU::createContext(PdfError& err)
    {
        _display = openDisplay();
        if (_display == EGL_NO_DISPLAY)
        {
            err.set(PdfErrorCode::RenderBackendFault, "no EGL display");
            return false;
        }
        if (!eglBindAPI(EGL_OPENGL_API))
        {
            err.set(PdfErrorCode::RenderBackendFault, "EGL has no desktop OpenGL");
            return false;
        }

        EGLConfig config;
        if (!chooseConfig(_display, config))
        {
            err.set(PdfErrorCode::RenderBackendFault, "no EGL config for OpenGL pbuffers");
            return false;
        }

        const EGLint pbufferAttribs[] = { EGL_WIDTH, 1, EGL_HEIGHT, 1, EGL_NONE };
        _surface = eglCreatePbufferSurface(_display, config, pbufferAttribs);
        if (_surface == EGL_NO_SURFACE)
        {
            err.set(PdfErrorCode::RenderBackendFault, "eglCreatePbufferSurface failed");
            return false;
        }

        const EGLint contextAttribs[] = {
            EGL_CONTEXT_MAJOR_VERSION, 3,
            EGL_CONTEXT_MINOR_VERSION, 3,
            EGL_CONTEXT_OPENGL_PROFILE_MASK, EGL_CONTEXT_OPENGL_CORE_PROFILE_BIT,
            EGL_NONE
        };
        _context = eglCreateContext(_display, config, EGL_NO_CONTEXT, contextAttribs);
        if (_context == EGL_NO_CONTEXT)
        {
            err.set(PdfErrorCode::RenderBackendFault, "no OpenGL 3.3 core context");
            return false;
        }

        if (!makeCurrent())
        {
            err.set(PdfErrorCode::RenderBackendFault, "eglMakeCurrent failed");
            return false;
        }
        return true;
    }

    bool PdfPainterGPU::createProgram(PdfError& err)
    {
        std::string log;
        GLuint vs = 0, fs = 0;
        if (!compileShader(GL_VERTEX_SHADER, kVertexShader, vs, log) ||
            !compileShader(GL_FRAGMENT_SHADER, kFragmentShader, fs, log))
        {
            if (vs)
                glDeleteShader(vs);
            err.set(PdfErrorCode::RenderBackendFault, "shader compile failed: " + log);
            return false;
        }

        _program = glCreateProgram();
        glAttachShader(_program, vs);
        glAttachShader(_program, fs);
        glLinkProgram(_program);
        glDeleteShader(vs);
        glDeleteShader(fs);

        GLint status = 0;
        glGetProgramiv(_program, GL_LINK_STATUS, &status);
        if (!status)
        {
            err.set(PdfErrorCode::RenderBackendFault, "shader link failed");
            return false;
        }

        _uViewport = glGetUniformLocation(_program, "uViewport");
        _uMode = glGetUniformLocation(_program, "uMode");
        _uColor = glGetUniformLocation(_program, "uColor");
        _uAlpha = glGetUniformLocation(_program, "uAlpha");
        _uDeviceToTex = glGetUniformLocation(_program, "uDeviceToTex");
        _uTexture = glGetUniformLocation(_program, "uTexture");
        _uClip = glGetUniformLocation(_program, "uClip");
        _uHasClip = glGetUniformLocation(_program, "uHasClip");

        glUseProgram(_program);
        glUniform1i(_uTexture, 0);
        glUniform1i(_uClip, 1);
        return true;
    }

    bool PdfPainterGPU::makeCurrent()
    {
        return eglMakeCurrent(_display, _surface, _surface, _context) == EGL_TRUE;
    }

    bool PdfPainterGPU::checkError(const char* where)
    {
        GLenum e = glGetError();
        if (e == GL_NO_ERROR)
            return true;

        LogDebug("[PdfPainterGPU] GL error 0x%x in %s", e, where);
        // drain the queue
        while (glGetError() != GL_NO_ERROR) {}
        _lost = true;
        return false;
    }

    void PdfPainterGPU::destroy()
    {
        if (_context != EGL_NO_CONTEXT && makeCurrent())
        {
            for (GLuint tex : _clips)
            {
                if (tex)
                    glDeleteTextures(1, &tex);
            }
            _clips.clear();
            destroyTargets();
            if (_vbo)
                glDeleteBuffers(1, &_vbo);
            if (_vao)
                glDeleteVertexArrays(1, &_vao);
            if (_program)
                glDeleteProgram(_program);
            _vbo = _vao = _program = 0;
        }

        if (_display != EGL_NO_DISPLAY)
        {
            eglMakeCurrent(_display, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
            if (_context != EGL_NO_CONTEXT)
                eglDestroyContext(_display, _context);
            if (_surface != EGL_NO_SURFACE)
                eglDestroySurface(_display, _surface);
            eglReleaseThread();
        }

        // the display stays initialized; other threads may hold contexts on it
        _context = EGL_NO_CONTEXT;
        _surface = EGL_NO_SURFACE;
        _display = EGL_NO_DISPLAY;
        _initialized = false;
    }

    // =========================================================
    // Targets
    // =========================================================

    bool PdfPainterGPU::createTargets(PdfError& err)
    {
        destroyTargets();

        glGenRenderbuffers(1, &_colorRb);
        glBindRenderbuffer(GL_RENDERBUFFER, _colorRb);
        glRenderbufferStorageMultisample(GL_RENDERBUFFER, _samples, GL_RGBA8, _w, _h);

        glGenRenderbuffers(1, &_stencilRb);
        glBindRenderbuffer(GL_RENDERBUFFER, _stencilRb);
        glRenderbufferStorageMultisample(GL_RENDERBUFFER, _samples, GL_DEPTH24_STENCIL8, _w, _h);

        glGenFramebuffers(1, &_fbo);
        glBindFramebuffer(GL_FRAMEBUFFER, _fbo);
        glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_RENDERBUFFER, _colorRb);
        glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT, GL_RENDERBUFFER, _stencilRb);
        bool ok = glCheckFramebufferStatus(GL_FRAMEBUFFER) == GL_FRAMEBUFFER_COMPLETE;

        glGenRenderbuffers(1, &_maskRb);
        glBindRenderbuffer(GL_RENDERBUFFER, _maskRb);
        glRenderbufferStorageMultisample(GL_RENDERBUFFER, _samples, GL_R8, _w, _h);

        glGenRenderbuffers(1, &_maskStencilRb);
        glBindRenderbuffer(GL_RENDERBUFFER, _maskStencilRb);
        glRenderbufferStorageMultisample(GL_RENDERBUFFER, _samples, GL_DEPTH24_STENCIL8, _w, _h);

        glGenFramebuffers(1, &_maskFbo);
        glBindFramebuffer(GL_FRAMEBUFFER, _maskFbo);
        glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_RENDERBUFFER, _maskRb);
        glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_STENCIL_ATTACHMENT, GL_RENDERBUFFER, _maskStencilRb);
        ok = ok && glCheckFramebufferStatus(GL_FRAMEBUFFER) == GL_FRAMEBUFFER_COMPLETE;
        glClearStencil(0);
        glClear(GL_STENCIL_BUFFER_BIT);

        glGenFramebuffers(1, &_resolveFbo);

        if (!ok || !checkError("createTargets"))
        {
            err.set(PdfErrorCode::RenderBackendFault,
                "cannot create a " + std::to_string(_w) + "x" + std::to_string(_h) + " framebuffer");
            return false;
        }
        return true;
    }

    void PdfPainterGPU::destroyTargets()
    {
        GLuint fbos[] = { _fbo, _maskFbo, _resolveFbo };
        GLuint rbs[] = { _colorRb, _stencilRb, _maskRb, _maskStencilRb };
        for (GLuint f : fbos)
        {
            if (f)
                glDeleteFramebuffers(1, &f);
        }
        for (GLuint r : rbs)
        {
            if (r)
                glDeleteRenderbuffers(1, &r);
        }
        _fbo = _maskFbo = _resolveFbo = 0;
        _colorRb = _stencilRb = _maskRb = _maskStencilRb = 0;
    }

    bool PdfPainterGPU::beginPage(int width, int height, const float background[4], PdfError& err)
    {
        if (width <= 0 || height <= 0)
        {
            err.set(PdfErrorCode::RenderBackendFault, "empty render target");
            return false;
        }
        if (!initialize(err))
            return false;
        if (!makeCurrent())
        {
            err.set(PdfErrorCode::RenderBackendFault, "eglMakeCurrent failed");
            return false;
        }

        GLint maxRb = 0;
        glGetIntegerv(GL_MAX_RENDERBUFFER_SIZE, &maxRb);
        if (width > maxRb || height > maxRb)
        {
            err.set(PdfErrorCode::RenderBackendFault,
                "viewport " + std::to_string(width) + "x" + std::to_string(height) + " exceeds the GL limit");
            return false;
        }

        _w = width;
        _h = height;
        _lost = false;
        if (!createTargets(err))
            return false;

        glBindFramebuffer(GL_FRAMEBUFFER, _fbo);
        glViewport(0, 0, _w, _h);

        float a = std::min(std::max(background[3], 0.0f), 1.0f);
        glClearColor(background[0] * a, background[1] * a, background[2] * a, a);
        glClearStencil(0);
        glClear(GL_COLOR_BUFFER_BIT | GL_STENCIL_BUFFER_BIT);

        glUseProgram(_program);
        glUniform2f(_uViewport, static_cast<float>(_w), static_cast<float>(_h));
        glBindVertexArray(_vao);
        glDisable(GL_CULL_FACE);
        glDisable(GL_DEPTH_TEST);
        glEnable(GL_MULTISAMPLE);
        glEnable(GL_BLEND);
        glBlendFunc(GL_ONE, GL_ONE_MINUS_SRC_ALPHA);

        if (!checkError("beginPage"))
        {
            err.set(PdfErrorCode::RenderBackendFault, "GL error at page start");
            return false;
        }

        LogDebug("[PdfPainterGPU] begin %dx%d", width, height);
        return true;
    }

    bool PdfPainterGPU::endPage(std::vector<uint8_t>& rgba, PdfError& err)
    {
        if (_lost || !makeCurrent())
        {
            err.set(PdfErrorCode::RenderBackendFault, "GL device lost during the render");
            return false;
        }

        GLuint tex = 0;
        glGenTextures(1, &tex);
        glBindTexture(GL_TEXTURE_2D, tex);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, _w, _h, 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);

        glBindFramebuffer(GL_DRAW_FRAMEBUFFER, _resolveFbo);
        glFramebufferTexture2D(GL_DRAW_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, tex, 0);
        glBindFramebuffer(GL_READ_FRAMEBUFFER, _fbo);
        glBlitFramebuffer(0, 0, _w, _h, 0, 0, _w, _h, GL_COLOR_BUFFER_BIT, GL_NEAREST);

        rgba.resize(static_cast<size_t>(_w) * _h * 4);
        glBindFramebuffer(GL_READ_FRAMEBUFFER, _resolveFbo);
        glPixelStorei(GL_PACK_ALIGNMENT, 1);
        glReadPixels(0, 0, _w, _h, GL_RGBA, GL_UNSIGNED_BYTE, rgba.data());
        glDeleteTextures(1, &tex);

        for (GLuint clip : _clips)
        {
            if (clip)
                glDeleteTextures(1, &clip);
        }
        _clips.clear();

        if (!checkError("endPage"))
        {
            err.set(PdfErrorCode::RenderBackendFault, "glReadPixels failed");
            return false;
        }

        // un-premultiply
        for (size_t i = 0; i < rgba.size(); i += 4)
        {
            int a = rgba[i + 3];
            if (a == 0)
            {
                rgba[i] = rgba[i + 1] = rgba[i + 2] = 0;
                continue;
            }
            if (a == 255)
                continue;
            for (int c = 0; c < 3; ++c)
                rgba[i + c] = static_cast<uint8_t>(std::min(255, (rgba[i + c] * 255 + a / 2) / a));
        }
        return true;
    }

    // =========================================================
    // Stencil-then-cover
    // =========================================================

    bool PdfPainterGPU::stencil(const PdfContours& contours, bool evenOdd,
        float& x0, float& y0, float& x1, float& y1)
    {
        double bx0, by0, bx1, by1;
        if (!PdfTessellator::Bounds(contours, bx0, by0, bx1, by1))
            return false;

        x0 = static_cast<float>(std::max(0.0, std::floor(bx0)));
        y0 = static_cast<float>(std::max(0.0, std::floor(by0)));
        x1 = static_cast<float>(std::min(static_cast<double>(_w), std::ceil(bx1)));
        y1 = static_cast<float>(std::min(static_cast<double>(_h), std::ceil(by1)));
        if (!(x0 < x1 && y0 < y1))
            return false;

        // one fan per contour, flattened into a triangle list
        std::vector<float> verts;
        for (const auto& c : contours)
        {
            for (size_t i = 1; i + 1 < c.size(); ++i)
            {
                const DPoint* tri[3] = { &c[0], &c[i], &c[i + 1] };
                for (const DPoint* p : tri)
                {
                    verts.push_back(static_cast<float>(p->x));
                    verts.push_back(static_cast<float>(p->y));
                }
            }
        }
        if (verts.empty())
            return false;

        glBindBuffer(GL_ARRAY_BUFFER, _vbo);
        glBufferData(GL_ARRAY_BUFFER, verts.size() * sizeof(float), verts.data(), GL_STREAM_DRAW);

        glColorMask(GL_FALSE, GL_FALSE, GL_FALSE, GL_FALSE);
        glEnable(GL_STENCIL_TEST);
        glStencilMask(0xFF);
        glStencilFunc(GL_ALWAYS, 0, 0xFF);
        if (evenOdd)
        {
            glStencilOp(GL_KEEP, GL_KEEP, GL_INVERT);
        }
        else
        {
            glStencilOpSeparate(GL_FRONT, GL_KEEP, GL_KEEP, GL_INCR_WRAP);
            glStencilOpSeparate(GL_BACK, GL_KEEP, GL_KEEP, GL_DECR_WRAP);
        }
        glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(verts.size() / 2));
        glColorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);
        return true;
    }

    void PdfPainterGPU::cover(float x0, float y0, float x1, float y1, bool evenOdd)
    {
        const float quad[] = {
            x0, y0, x1, y0, x1, y1,
            x0, y0, x1, y1, x0, y1
        };
        glBindBuffer(GL_ARRAY_BUFFER, _vbo);
        glBufferData(GL_ARRAY_BUFFER, sizeof(quad), quad, GL_STREAM_DRAW);

        // test the winding and reset the stencil for the next fill
        glStencilFunc(GL_NOTEQUAL, 0, evenOdd ? 0x01 : 0xFF);
        glStencilOp(GL_ZERO, GL_ZERO, GL_ZERO);
        glDrawArrays(GL_TRIANGLES, 0, 6);
        glDisable(GL_STENCIL_TEST);
    }

    void PdfPainterGPU::bindClip()
    {
        bool hasClip = !_clips.empty();
        glUniform1i(_uHasClip, hasClip ? 1 : 0);
        glActiveTexture(GL_TEXTURE1);
        glBindTexture(GL_TEXTURE_2D, hasClip ? _clips.back() : 0);
        glActiveTexture(GL_TEXTURE0);
    }

    // =========================================================
    // Textures
    // =========================================================

    unsigned int PdfPainterGPU::uploadTexture(const std::vector<uint8_t>& premultiplied, int w, int h, bool linear)
    {
        GLuint tex = 0;
        glGenTextures(1, &tex);
        glActiveTexture(GL_TEXTURE0);
        glBindTexture(GL_TEXTURE_2D, tex);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, w, h, 0, GL_RGBA, GL_UNSIGNED_BYTE, premultiplied.data());
        GLint filter = linear ? GL_LINEAR : GL_NEAREST;
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, filter);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, filter);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        return tex;
    }

    unsigned int PdfPainterGPU::uploadImage(const PdfImage& image)
    {
        // oversized images are point-sampled down to the texture limit
        int tw = image.width, th = image.height;
        if (_maxTextureSize > 0)
        {
            tw = std::min(tw, _maxTextureSize);
            th = std::min(th, _maxTextureSize);
        }

        std::vector<uint8_t> pm(static_cast<size_t>(tw) * th * 4);
        for (int y = 0; y < th; ++y)
        {
            int sy = static_cast<int>(static_cast<int64_t>(y) * image.height / th);
            for (int x = 0; x < tw; ++x)
            {
                int sx = static_cast<int>(static_cast<int64_t>(x) * image.width / tw);
                const uint8_t* s = &image.rgba[(static_cast<size_t>(sy) * image.width + sx) * 4];
                uint8_t* d = &pm[(static_cast<size_t>(y) * tw + x) * 4];
                d[0] = static_cast<uint8_t>((s[0] * s[3] + 127) / 255);
                d[1] = static_cast<uint8_t>((s[1] * s[3] + 127) / 255);
                d[2] = static_cast<uint8_t>((s[2] * s[3] + 127) / 255);
                d[3] = s[3];
            }
        }
        return uploadTexture(pm, tw, th, image.interpolate);
    }

    unsigned int PdfPainterGPU::bakeShading(const PdfPaintSource& paint, int x0, int y0, int x1, int y1)
    {
        const int bw = x1 - x0;
        const int bh = y1 - y0;
        std::vector<uint8_t> pm(static_cast<size_t>(bw) * bh * 4, 0);

        for (int y = 0; y < bh; ++y)
        {
            for (int x = 0; x < bw; ++x)
            {
                double sx, sy;
                paint.deviceToShading.apply(x0 + x + 0.5, y0 + y + 0.5, sx, sy);
                PdfRGB rgb;
                if (!paint.shading->evaluate(sx, sy, rgb))
                    continue;
                uint8_t* d = &pm[(static_cast<size_t>(y) * bw + x) * 4];
                d[0] = static_cast<uint8_t>(std::lround(std::min(std::max(rgb.r, 0.0), 1.0) * 255));
                d[1] = static_cast<uint8_t>(std::lround(std::min(std::max(rgb.g, 0.0), 1.0) * 255));
                d[2] = static_cast<uint8_t>(std::lround(std::min(std::max(rgb.b, 0.0), 1.0) * 255));
                d[3] = 255;
            }
        }
        return uploadTexture(pm, bw, bh, false);
    }

    // =========================================================
    // Fill & clip
    // =========================================================

    void PdfPainterGPU::fill(const PdfContours& contours, bool evenOdd, const PdfPaintSource& paint)
    {
        if (_lost || paint.alpha <= 0.0f)
            return;
        if (!_clips.empty() && _clips.back() == 0)
            return;

        glBindFramebuffer(GL_FRAMEBUFFER, _fbo);
        glUseProgram(_program);

        float x0, y0, x1, y1;
        if (!stencil(contours, evenOdd, x0, y0, x1, y1))
        {
            glDisable(GL_STENCIL_TEST);
            return;
        }

        GLuint tex = 0;
        float m[9];
        switch (paint.kind)
        {
        case PdfPaintSource::Solid:
            glUniform1i(_uMode, CoverSolid);
            glUniform4f(_uColor, paint.r, paint.g, paint.b, 1.0f);
            break;

        case PdfPaintSource::Shading:
        {
            if (!paint.shading)
                break;
            int ix0 = static_cast<int>(x0), iy0 = static_cast<int>(y0);
            int ix1 = static_cast<int>(x1), iy1 = static_cast<int>(y1);
            tex = bakeShading(paint, ix0, iy0, ix1, iy1);
            double bw = ix1 - ix0, bh = iy1 - iy0;
            toMat3(PdfMatrix(1.0 / bw, 0, 0, 1.0 / bh, -ix0 / bw, -iy0 / bh), m);
            glUniform1i(_uMode, CoverTexture);
            glUniformMatrix3fv(_uDeviceToTex, 1, GL_FALSE, m);
            break;
        }

        case PdfPaintSource::Image:
            if (!paint.image || paint.image->width <= 0 || paint.image->height <= 0)
                break;
            tex = uploadImage(*paint.image);
            // texture row 0 is v = 1
            toMat3(PdfMul(paint.deviceToImage, PdfMatrix(1, 0, 0, -1, 0, 1)), m);
            glUniform1i(_uMode, CoverTexture);
            glUniformMatrix3fv(_uDeviceToTex, 1, GL_FALSE, m);
            break;
        }

        if (paint.kind != PdfPaintSource::Solid && !tex)
        {
            // clear the stencil without painting
            glColorMask(GL_FALSE, GL_FALSE, GL_FALSE, GL_FALSE);
            cover(x0, y0, x1, y1, evenOdd);
            glColorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);
            return;
        }

        glUniform1f(_uAlpha, paint.alpha);
        bindClip();
        cover(x0, y0, x1, y1, evenOdd);

        if (tex)
            glDeleteTextures(1, &tex);
        checkError("fill");
    }

    void PdfPainterGPU::pushClip(const PdfContours& contours, bool evenOdd)
    {
        if (_lost || (!_clips.empty() && _clips.back() == 0))
        {
            _clips.push_back(0);
            return;
        }

        glBindFramebuffer(GL_FRAMEBUFFER, _maskFbo);
        glDisable(GL_BLEND);
        glClearColor(0, 0, 0, 0);
        glClear(GL_COLOR_BUFFER_BIT);
        glUseProgram(_program);

        float x0, y0, x1, y1;
        if (!stencil(contours, evenOdd, x0, y0, x1, y1))
        {
            glDisable(GL_STENCIL_TEST);
            glEnable(GL_BLEND);
            glBindFramebuffer(GL_FRAMEBUFFER, _fbo);
            _clips.push_back(0);
            return;
        }

        // coverage times the enclosing clip
        glUniform1i(_uMode, CoverClip);
        bindClip();
        cover(x0, y0, x1, y1, evenOdd);

        GLuint tex = 0;
        glGenTextures(1, &tex);
        glBindTexture(GL_TEXTURE_2D, tex);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_R8, _w, _h, 0, GL_RED, GL_UNSIGNED_BYTE, nullptr);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);

        glBindFramebuffer(GL_DRAW_FRAMEBUFFER, _resolveFbo);
        glFramebufferTexture2D(GL_DRAW_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, tex, 0);
        glBindFramebuffer(GL_READ_FRAMEBUFFER, _maskFbo);
        glBlitFramebuffer(0, 0, _w, _h, 0, 0, _w, _h, GL_COLOR_BUFFER_BIT, GL_NEAREST);
        glFramebufferTexture2D(GL_DRAW_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, 0, 0);

        glBindFramebuffer(GL_FRAMEBUFFER, _fbo);
        glEnable(GL_BLEND);
        _clips.push_back(tex);
        checkError("pushClip");
    }

    void PdfPainterGPU::popClip()
    {
        if (_clips.empty())
            return;
        GLuint tex = _clips.back();
        _clips.pop_back();
        if (tex && !_lost)
            glDeleteTextures(1, &tex);
    }
}
