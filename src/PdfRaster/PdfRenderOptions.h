#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>

namespace pdfraster
{
    enum class PdfBackend
    {
        Auto,   // GPU, falling back to CPU
        Cpu,
        Gpu
    };

    inline const char* PdfBackendName(PdfBackend backend)
    {
        switch (backend)
        {
        case PdfBackend::Auto: return "auto";
        case PdfBackend::Cpu: return "cpu";
        case PdfBackend::Gpu: return "gpu";
        }
        return "auto";
    }

    inline bool ParseBackend(const std::string& text, PdfBackend& out)
    {
        if (text == "auto") { out = PdfBackend::Auto; return true; }
        if (text == "cpu") { out = PdfBackend::Cpu; return true; }
        if (text == "gpu") { out = PdfBackend::Gpu; return true; }
        return false;
    }

    // ============================================
    // RENDER OPTIONS
    // ============================================
    struct RenderOptions
    {
        PdfBackend backend = PdfBackend::Auto;

        // straight RGBA, 0..1; transparent unless a page colour is wanted
        float background[4] = { 0.0f, 0.0f, 0.0f, 0.0f };

        // substitute font programs; empty means the built-in set
        std::string fontDirectory;

        size_t cacheCapacity = 16;
        size_t cacheMemory = size_t(256) * 1024 * 1024;

        int maxViewportSide = 16384;
        int64_t maxViewportPixels = int64_t(1) << 28;

        void setOpaqueBackground(float r, float g, float b)
        {
            background[0] = r;
            background[1] = g;
            background[2] = b;
            background[3] = 1.0f;
        }

        // PDFRASTER_BACKEND, PDFRASTER_FONT_DIR (or STANDARD_FONTS) and
        // PDFRASTER_CACHE_PAGES over the defaults; bad values are ignored
        static RenderOptions fromEnvironment()
        {
            RenderOptions options;

            if (const char* backend = std::getenv("PDFRASTER_BACKEND"))
                ParseBackend(backend, options.backend);

            if (const char* dir = std::getenv("PDFRASTER_FONT_DIR"))
                options.fontDirectory = dir;
            else if (const char* dir2 = std::getenv("STANDARD_FONTS"))
                options.fontDirectory = dir2;

            if (const char* pages = std::getenv("PDFRASTER_CACHE_PAGES"))
            {
                char* end = nullptr;
                long n = std::strtol(pages, &end, 10);
                if (end != pages && *end == '\0' && n >= 0)
                    options.cacheCapacity = static_cast<size_t>(n);
            }

            return options;
        }
    };
}
