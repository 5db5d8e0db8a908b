#pragma once

// ============================================
// DEBUG LOGGING
// PDFRASTER_LOG unset   -> silent
// PDFRASTER_LOG=stderr  -> standard error
// PDFRASTER_LOG=<path>  -> appended to file
// ============================================

#include <cstdio>
#include <cstdarg>

namespace pdfraster
{
    class PdfDebug
    {
    public:
        // Re-reads PDFRASTER_LOG; called lazily by the first log line
        static void Init();
        static void Close();
        static bool Enabled();
        static void Write(const char* line);
    };
}

#if defined(__GNUC__)
__attribute__((format(printf, 1, 2)))
#endif
inline void LogDebugImpl(const char* fmt, ...)
{
    if (!pdfraster::PdfDebug::Enabled())
        return;

    char buf[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    pdfraster::PdfDebug::Write(buf);
}

#define LogDebug(...) LogDebugImpl(__VA_ARGS__)
