//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#include "Utils.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
# define NOMINMAX
# include <windows.h>
#endif

namespace dm
{
    std::string formatted (const char* fmt, ...)
    {
        char buf [2048];
        buf[2047] = '\0';
        va_list args;
        va_start(args, fmt);
        vsnprintf (buf, 2047, fmt, args);
        va_end (args);
        return buf;
    }

    void handle_assert_failure(const char* cond, const char* fileName, int line, const char* commentFormat, ...)
    {
        char buf [2048];
        buf[2047] = '\0';
        va_list args;
        va_start(args, commentFormat);
        vsnprintf (buf, 2047, commentFormat, args);
        va_end (args);

        fprintf (stderr, "ASSERT failure: %s. Condition %s failed (%s:%d)\n", buf, cond, fileName, line);
        abort();
    }

    void consoleMessage (const char* fmt, ...)
    {
#ifdef _WIN32
        char buf [2048];
        buf[2047] = '\0';
        va_list args;
        va_start(args, fmt);
        vsnprintf (buf, 2047, fmt, args);
        va_end (args);
        OutputDebugString (buf);
#else
        va_list args;
        va_start(args, fmt);
        vfprintf (stderr, fmt, args);
        va_end (args);
#endif
    }
}

namespace dm
{

    namespace
    {
        double currentDateInSeconds ()
        {
            return std::chrono::duration<double>(std::chrono::steady_clock::now().time_since_epoch()).count();
        }
    }

    void ScopeTimer :: start ()
    {
        _startTime = currentDateInSeconds();
    }

    void ScopeTimer :: stop ()
    {
        if (_startTime < 0)
            return;

        const auto endTime = currentDateInSeconds();
        const auto deltaTime = endTime - _startTime;

        dm_dbg ("[TIME] elapsed in %s: %.1f ms", _label.c_str(), deltaTime*1e3);

        _startTime = -1.0;
    }

} // dm
