#include "PdfDebug.h"
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace pdfraster
{
    namespace
    {
        std::mutex g_logMutex;
        FILE* g_logFile = nullptr;
        bool g_ownsFile = false;
        bool g_initialized = false;

        void initLocked()
        {
            if (g_initialized)
                return;
            g_initialized = true;

            const char* target = std::getenv("PDFRASTER_LOG");
            if (!target || !*target)
                return;

            if (std::strcmp(target, "stderr") == 0)
            {
                g_logFile = stderr;
                g_ownsFile = false;
                return;
            }

            g_logFile = std::fopen(target, "a");
            g_ownsFile = g_logFile != nullptr;
        }
    }

    void PdfDebug::Init()
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        initLocked();
    }

    void PdfDebug::Close()
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (g_logFile && g_ownsFile)
            std::fclose(g_logFile);
        g_logFile = nullptr;
        g_ownsFile = false;
        g_initialized = false;
    }

    bool PdfDebug::Enabled()
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        initLocked();
        return g_logFile != nullptr;
    }

    void PdfDebug::Write(const char* line)
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        initLocked();
        if (!g_logFile)
            return;
        std::fprintf(g_logFile, "%s\n", line);
        std::fflush(g_logFile);
    }
}
